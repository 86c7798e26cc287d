#ifndef TRELLIS_HTTP_ROUTE_SEGMENT_HPP
#define TRELLIS_HTTP_ROUTE_SEGMENT_HPP

#include <cstdint>
#include <string_view>

namespace Trellis::Http {

enum class SegmentKind : std::uint8_t {
    LITERAL,   // "users"
    DYNAMIC,   // ":id", matched against a registered pattern
    CATCH_ALL  // "*", only ever the last segment of a route
};

// vvv Type checks vvv
SegmentKind      ClassifySegment(std::string_view token);
bool             IsDynamicToken(std::string_view token);
bool             IsCatchAllToken(std::string_view token);

// vvv Utilities vvv
std::string_view SegmentKindToString(SegmentKind kind);

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_ROUTE_SEGMENT_HPP
