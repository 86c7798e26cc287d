#ifndef TRELLIS_HTTP_ROUTE_TRIE_HPP
#define TRELLIS_HTTP_ROUTE_TRIE_HPP

#include "route_segment.hpp"
#include "path_segmenter.hpp"
#include "dynamic_segments.hpp"
#include "http/common/route_common.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Trellis::Http {

struct HandlerEntry {
    std::string      method;   // Upper-cased, or METHOD_ALL
    std::string      version;  // Empty for the version-less (default) registration
    HandlerPtr       handler;
};

struct TrieNode {
    std::string segment;
    SegmentKind kind = SegmentKind::LITERAL;

    // Insertion order is kept, it decides which dynamic sibling gets tried first
    std::vector<std::unique_ptr<TrieNode>> children;

    // Unique per (method, version), scanned front to back
    std::vector<HandlerEntry> handlers;

    bool hasDynamicChild  = false;
    bool hasCatchallChild = false;

    TrieNode*       FindChild(std::string_view token);
    const TrieNode* FindChild(std::string_view token) const;
    const TrieNode* FindLiteralChild(std::string_view token) const;
    const TrieNode* CatchAllChild() const;

    bool IsLeaf() const { return !handlers.empty(); }
};

// Deepest node reachable through literal children, 'offset' indexes the first unconsumed segment.
// 'exactLeaf' means every segment was consumed and the node carries handler entries.
struct ResolveResult {
    const TrieNode* node      = nullptr;
    std::size_t     offset    = 0;
    bool            exactLeaf = false;
};

class RouteTrie {
public:
    RouteTrie() = default;

    RouteTrie(const RouteTrie&)            = delete;
    RouteTrie& operator=(const RouteTrie&) = delete;

    // Every ':name' in 'segments' must already be known to 'registry'
    RouteError Insert(const PathSegments& segments, const HttpCallbackType& handler,
                      const std::vector<std::string>& methods, std::string_view version,
                      const DynamicSegmentRegistry& registry);

    ResolveResult Resolve(const PathSegments& segments) const;
    ResolveResult Resolve(const TrieNode* from, const PathSegments& segments, std::size_t offset) const;

    const TrieNode& Root() const { return root_; }

    // Total handler entries across all nodes
    std::size_t EntryCount() const;

private:
    TrieNode root_;
};

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_ROUTE_TRIE_HPP
