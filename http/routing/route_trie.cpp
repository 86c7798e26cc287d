#include "route_trie.hpp"

#include <stack>

namespace Trellis::Http {

// vvv TrieNode vvv
TrieNode* TrieNode::FindChild(std::string_view token)
{
    for(auto& child : children)
        if(child->segment == token)
            return child.get();

    return nullptr;
}

const TrieNode* TrieNode::FindChild(std::string_view token) const
{
    for(const auto& child : children)
        if(child->segment == token)
            return child.get();

    return nullptr;
}

const TrieNode* TrieNode::FindLiteralChild(std::string_view token) const
{
    // A request segment spelled ":id" or "*" must not walk into a pattern node
    for(const auto& child : children)
        if(child->kind == SegmentKind::LITERAL && child->segment == token)
            return child.get();

    return nullptr;
}

const TrieNode* TrieNode::CatchAllChild() const
{
    if(!hasCatchallChild)
        return nullptr;

    for(const auto& child : children)
        if(child->kind == SegmentKind::CATCH_ALL)
            return child.get();

    return nullptr;
}

// vvv RouteTrie vvv
RouteError RouteTrie::Insert(
    const PathSegments& segments, const HttpCallbackType& handler,
    const std::vector<std::string>& methods, std::string_view version,
    const DynamicSegmentRegistry& registry
)
{
    if(segments.empty())
        return RouteError::EMPTY_PATH;

    // Validate everything up front so a rejected route leaves no half built branch behind
    for(std::size_t i = 0; i < segments.size(); ++i) {
        switch(ClassifySegment(segments[i])) {
            case SegmentKind::DYNAMIC:
                if(!registry.Lookup(segments[i]))
                    return RouteError::UNKNOWN_DYNAMIC_SEGMENT;
                break;

            case SegmentKind::CATCH_ALL:
                if(i + 1 != segments.size())
                    return RouteError::CATCH_ALL_NOT_FINAL;
                break;

            default:
                break;
        }
    }

    TrieNode* node = &root_;
    for(const auto& token : segments) {
        TrieNode* child = node->FindChild(token);
        if(!child) {
            auto created     = std::make_unique<TrieNode>();
            created->segment = token;
            created->kind    = ClassifySegment(token);

            if(created->kind == SegmentKind::DYNAMIC)
                node->hasDynamicChild = true;
            else if(created->kind == SegmentKind::CATCH_ALL)
                node->hasCatchallChild = true;

            child = created.get();
            node->children.push_back(std::move(created));
        }
        node = child;
    }

    auto shared = std::make_shared<const HttpCallbackType>(handler);

    for(const auto& method : methods) {
        bool replaced = false;
        for(auto& entry : node->handlers) {
            if(entry.method == method && entry.version == version) {
                entry.handler = shared;
                replaced      = true;
                break;
            }
        }

        if(!replaced)
            node->handlers.push_back(HandlerEntry{method, std::string(version), shared});
    }

    return RouteError::NONE;
}

ResolveResult RouteTrie::Resolve(const PathSegments& segments) const
{
    return Resolve(&root_, segments, 0);
}

ResolveResult RouteTrie::Resolve(const TrieNode* from, const PathSegments& segments, std::size_t offset) const
{
    const TrieNode* node = from;

    while(offset < segments.size()) {
        const TrieNode* child = node->FindLiteralChild(segments[offset]);
        if(!child)
            break;

        node = child;
        ++offset;
    }

    return ResolveResult{node, offset, offset == segments.size() && node->IsLeaf()};
}

std::size_t RouteTrie::EntryCount() const
{
    std::size_t count = 0;

    std::stack<const TrieNode*> pending;
    pending.push(&root_);

    while(!pending.empty()) {
        const TrieNode* node = pending.top();
        pending.pop();

        count += node->handlers.size();
        for(const auto& child : node->children)
            pending.push(child.get());
    }

    return count;
}

} // namespace Trellis::Http
