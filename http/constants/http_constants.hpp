#ifndef TRELLIS_HTTP_CONSTANTS_HPP
#define TRELLIS_HTTP_CONSTANTS_HPP

#include <cstdint>

namespace Trellis::Http {

// Only the statuses the router itself produces, handlers are free to set any code
enum class HttpStatus : std::uint16_t {
    OK                    = 200,
    NOT_FOUND             = 404,
    METHOD_NOT_ALLOWED    = 405,
    INTERNAL_SERVER_ERROR = 500
};

inline const char* HttpStatusToReason(HttpStatus status)
{
    switch(status) {
        case HttpStatus::OK:                    return "OK";
        case HttpStatus::NOT_FOUND:             return "Not Found";
        case HttpStatus::METHOD_NOT_ALLOWED:    return "Method Not Allowed";
        case HttpStatus::INTERNAL_SERVER_ERROR: return "Internal Server Error";
        default:                                return "Unknown";
    }
}

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_CONSTANTS_HPP
