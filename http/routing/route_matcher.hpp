#ifndef TRELLIS_HTTP_ROUTE_MATCHER_HPP
#define TRELLIS_HTTP_ROUTE_MATCHER_HPP

#include "route_trie.hpp"
#include "route_params.hpp"
#include "dynamic_segments.hpp"

#include <string_view>

namespace Trellis::Http {

struct RouteMatch {
    HandlerPtr              handler;  // Only set when FOUND
    RouteParams             params;
    MatchStatus             status  = MatchStatus::NOT_FOUND;
};

/*
 * Walks a trie for one request. Literal children are followed first, then the
 * dynamic children of the node where literals ran out (in insertion order, the
 * first whose pattern accepts the segment is taken for good), then the catch-all.
 * Holds only const references, any number of threads may call Match concurrently.
 */
class RouteMatcher {
public:
    RouteMatcher(const RouteTrie& trie, const DynamicSegmentRegistry& registry);

    RouteMatch Match(const PathSegments& segments, std::string_view method, std::string_view version) const;

    // Picks the entry for 'version' (falling back to version-less entries) and then 'method'
    static MatchStatus ResolveMethod(const TrieNode& node, std::string_view method,
                                     std::string_view version, HandlerPtr& outHandler);

private:
    const TrieNode* MatchDynamicChild(const TrieNode& node, std::string_view segment) const;

private:
    const RouteTrie&              trie_;
    const DynamicSegmentRegistry& registry_;
};

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_ROUTE_MATCHER_HPP
