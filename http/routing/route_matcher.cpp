#include "route_matcher.hpp"

namespace Trellis::Http {

RouteMatcher::RouteMatcher(const RouteTrie& trie, const DynamicSegmentRegistry& registry)
    : trie_(trie), registry_(registry) {}

RouteMatch RouteMatcher::Match(const PathSegments& segments, std::string_view method, std::string_view version) const
{
    RouteMatch result;

    ResolveResult cursor = trie_.Resolve(segments);

    while(true) {
        const TrieNode& node = *cursor.node;

        if(cursor.exactLeaf) {
            result.status = ResolveMethod(node, method, version, result.handler);
            return result;
        }

        // Every segment consumed on an interior node
        if(cursor.offset == segments.size())
            return result;

        const std::string& segment = segments[cursor.offset];

        if(node.hasDynamicChild) {
            if(const TrieNode* dynamic = MatchDynamicChild(node, segment)) {
                result.params = result.params.Add(dynamic->segment, segment);
                cursor        = trie_.Resolve(dynamic, segments, cursor.offset + 1);
                continue;
            }
        }

        if(const TrieNode* catchAll = node.CatchAllChild()) {
            result.params = result.params.Add(CATCH_ALL_TOKEN, segment);
            result.status = ResolveMethod(*catchAll, method, version, result.handler);
            return result;
        }

        return result;
    }
}

MatchStatus RouteMatcher::ResolveMethod(
    const TrieNode& node, std::string_view method,
    std::string_view version, HandlerPtr& outHandler
)
{
    outHandler = nullptr;

    // Versioned entries win when the request names a version we know, else the default ones
    std::string_view effective;
    if(!version.empty()) {
        for(const auto& entry : node.handlers) {
            if(entry.version == version) {
                effective = version;
                break;
            }
        }
    }

    bool anyForVersion = false;
    for(const auto& entry : node.handlers) {
        if(entry.version != effective)
            continue;

        anyForVersion = true;
        if(entry.method == METHOD_ALL || entry.method == method) {
            outHandler = entry.handler;
            return MatchStatus::FOUND;
        }
    }

    return anyForVersion ? MatchStatus::METHOD_NOT_ALLOWED : MatchStatus::NOT_FOUND;
}

const TrieNode* RouteMatcher::MatchDynamicChild(const TrieNode& node, std::string_view segment) const
{
    for(const auto& child : node.children) {
        if(child->kind != SegmentKind::DYNAMIC)
            continue;

        if(registry_.Matches(child->segment, segment))
            return child.get();
    }

    return nullptr;
}

} // namespace Trellis::Http
