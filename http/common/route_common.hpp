#ifndef TRELLIS_HTTP_ROUTE_COMMON_HPP
#define TRELLIS_HTTP_ROUTE_COMMON_HPP

#include <cstdint>
#include <cstddef>
#include <functional>
#include <memory>
#include <string_view>

// Forward declare for 'HttpCallbackType'
namespace Trellis::Http {

struct HttpRequest;
struct HttpResponse;

// Used throughout the entire program
using HttpCallbackType = std::function<void(HttpRequest&, HttpResponse&)>;

// Shared so a match result keeps its handler alive whatever happens to the trie afterwards
using HandlerPtr = std::shared_ptr<const HttpCallbackType>;

// Method token meaning "any method", also what an empty method list expands to
inline constexpr std::string_view METHOD_ALL = "ALL";

// vvv Markers vvv
inline constexpr char             DYNAMIC_MARKER  = ':';
inline constexpr std::string_view CATCH_ALL_TOKEN = "*";
inline constexpr std::string_view ROOT_TOKEN      = "/";
inline constexpr char             VERSION_MARKER  = '#';

// std::regex recurses per character, longer segments are never handed to a pattern
inline constexpr std::size_t MAX_DYNAMIC_SEGMENT_LENGTH = 4096;

enum class RouteError : std::uint8_t {
    NONE,
    INVALID_PATTERN,          // Dynamic segment pattern failed to compile
    UNKNOWN_DYNAMIC_SEGMENT,  // Route references a ':name' which was never defined
    CATCH_ALL_NOT_FINAL,      // '*' used anywhere but as the last segment
    EMPTY_PATH,               // Nothing to insert
    ROUTER_FROZEN             // Registration attempted after the serve phase began
};

enum class MatchStatus : std::uint8_t {
    FOUND,
    NOT_FOUND,
    METHOD_NOT_ALLOWED
};

inline const char* RouteErrorToString(RouteError error)
{
    switch(error) {
        case RouteError::NONE:                    return "NONE";
        case RouteError::INVALID_PATTERN:         return "INVALID_PATTERN";
        case RouteError::UNKNOWN_DYNAMIC_SEGMENT: return "UNKNOWN_DYNAMIC_SEGMENT";
        case RouteError::CATCH_ALL_NOT_FINAL:     return "CATCH_ALL_NOT_FINAL";
        case RouteError::EMPTY_PATH:              return "EMPTY_PATH";
        case RouteError::ROUTER_FROZEN:           return "ROUTER_FROZEN";
        default:                                  return "UNKNOWN";
    }
}

inline const char* MatchStatusToString(MatchStatus status)
{
    switch(status) {
        case MatchStatus::FOUND:              return "FOUND";
        case MatchStatus::NOT_FOUND:          return "NOT_FOUND";
        case MatchStatus::METHOD_NOT_ALLOWED: return "METHOD_NOT_ALLOWED";
        default:                              return "UNKNOWN";
    }
}

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_ROUTE_COMMON_HPP
