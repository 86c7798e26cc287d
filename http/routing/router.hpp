#ifndef TRELLIS_HTTP_ROUTER_HPP
#define TRELLIS_HTTP_ROUTER_HPP

#include "route_trie.hpp"
#include "route_matcher.hpp"
#include "dynamic_segments.hpp"
#include "config/config.hpp"
#include "http/common/route_common.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <string>
#include <string_view>

// To keep naming consistent :)
using Json = nlohmann::json;

namespace Trellis::Http {

/*
 * Routes are registered during a single threaded build phase, Freeze() ends it.
 * From then on the router is read-only and Match / Dispatch may run from any
 * number of threads without locking. Registering after Freeze() fails with
 * ROUTER_FROZEN instead of racing the readers.
 */
class Router {
public:
    Router();

    Router(const Router&)            = delete;
    Router& operator=(const Router&) = delete;

    // vvv Build phase vvv
    // 'path' may carry a "#version" suffix, which takes precedence over 'version'
    RouteError RegisterRoute(std::string_view path, HttpCallbackType handler,
                             std::string_view methods = {}, std::string_view version = {});
    RouteError RegisterDynamicSegment(std::string_view name, std::string_view pattern);

    // Version source, [Dynamic] patterns and verbosity, stops at the first bad pattern
    RouteError ApplyConfig(const Core::Config& config);

    void SetVerbose(bool verbose) { verbose_ = verbose; }
    void SetMaxDynamicSegmentLength(std::size_t length);
    void SetVersionSource(std::string_view header, std::string_view prefix);
    void SetNotFoundHandler(HttpCallbackType handler);
    void SetNotAllowedHandler(HttpCallbackType handler);

    void Freeze();
    bool IsFrozen() const { return frozen_.load(std::memory_order_acquire); }

    // vvv Serve phase vvv
    RouteMatch       Match(std::string_view path, std::string_view method, std::string_view version) const;
    std::string_view ResolveVersion(const HttpRequest& req) const;
    void             Dispatch(HttpRequest& req, HttpResponse& res) const;

    // vvv Introspection vvv
    Json DumpRoutes() const;

    const RouteTrie&              GetTrie()     const { return trie_; }
    const DynamicSegmentRegistry& GetRegistry() const { return registry_; }

private:
    Json DumpNode(const TrieNode& node) const;

private:
    DynamicSegmentRegistry registry_;
    RouteTrie              trie_;
    RouteMatcher           matcher_;

    HttpCallbackType notFoundHandler_;
    HttpCallbackType notAllowedHandler_;

    std::string versionHeader_;
    std::string versionPrefix_;

    bool              verbose_ = true;
    std::atomic<bool> frozen_  = false;
};

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_ROUTER_HPP
