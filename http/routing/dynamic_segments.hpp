#ifndef TRELLIS_HTTP_DYNAMIC_SEGMENTS_HPP
#define TRELLIS_HTTP_DYNAMIC_SEGMENTS_HPP

#include "http/common/route_common.hpp"

#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Trellis::Http {

// Named patterns (":id" -> "\d+") routes may reference as path segments
class DynamicSegmentRegistry {
public:
    // Last write wins, a pattern which fails to compile leaves any previous entry intact
    RouteError Define(std::string_view name, std::string_view pattern);

    const std::regex* Lookup(std::string_view name) const;
    const std::string* Source(std::string_view name) const;

    // Search semantics, anchor the pattern with '^...$' to test the whole segment.
    // Segments longer than the length limit never match.
    bool Matches(std::string_view name, std::string_view segment) const;

    void        SetMaxSegmentLength(std::size_t length) { maxSegmentLength_ = length; }
    std::size_t GetMaxSegmentLength() const             { return maxSegmentLength_; }

    std::size_t Size() const { return patterns_.size(); }

private:
    struct CompiledPattern {
        std::string source;
        std::regex  regex;
    };

    std::unordered_map<std::string, CompiledPattern> patterns_;
    std::size_t                                      maxSegmentLength_ = MAX_DYNAMIC_SEGMENT_LENGTH;
};

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_DYNAMIC_SEGMENTS_HPP
