#include "route_segment.hpp"
#include "http/common/route_common.hpp"

namespace Trellis::Http {

// vvv Type checks vvv
SegmentKind ClassifySegment(std::string_view token)
{
    if(IsCatchAllToken(token)) return SegmentKind::CATCH_ALL;
    if(IsDynamicToken(token))  return SegmentKind::DYNAMIC;
    return SegmentKind::LITERAL;
}

bool IsDynamicToken(std::string_view token)
{
    return !token.empty() && token.front() == DYNAMIC_MARKER;
}

bool IsCatchAllToken(std::string_view token)
{
    return token == CATCH_ALL_TOKEN;
}

// vvv Utilities vvv
std::string_view SegmentKindToString(SegmentKind kind)
{
    switch(kind)
    {
        case SegmentKind::LITERAL:   return "literal";
        case SegmentKind::DYNAMIC:   return "dynamic";
        case SegmentKind::CATCH_ALL: return "catch-all";
        default:                     return "<unknown>";
    }
}

} // namespace Trellis::Http
