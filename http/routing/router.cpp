#include "router.hpp"

#include "http/headers/http_headers.hpp"
#include "http/request/http_request.hpp"
#include "http/response/http_response.hpp"
#include "utils/logger/logger.hpp"

namespace Trellis::Http {

using namespace Trellis::Utils; // For 'Logger'

Router::Router()
    : matcher_(trie_, registry_)
{
    Core::RouterConfig defaults;
    versionHeader_ = defaults.versionHeader;
    versionPrefix_ = defaults.versionPrefix;
    verbose_       = defaults.verbose;
}

// vvv Build phase vvv
RouteError Router::RegisterRoute(
    std::string_view path, HttpCallbackType handler,
    std::string_view methods, std::string_view version
)
{
    auto& logger = Logger::GetInstance();

    if(IsFrozen()) {
        logger.Warn("[Router]: Rejected '", path, "', routes cannot be added once serving started");
        return RouteError::ROUTER_FROZEN;
    }

    auto [routePath, suffixVersion] = SplitRouteVersion(path);
    if(path.find(VERSION_MARKER) != std::string_view::npos)
        version = suffixVersion;

    PathSegments             segments   = SplitPath(routePath);
    std::vector<std::string> methodList = SplitMethods(methods);

    if(verbose_) {
        std::string joined;
        for(const auto& method : methodList) {
            if(!joined.empty())
                joined += ',';
            joined += method;
        }
        logger.Info("[Router]: Adding path: ", routePath, " [", joined, "] ", version);
    }

    RouteError err = trie_.Insert(segments, handler, methodList, version, registry_);
    if(err != RouteError::NONE)
        logger.Warn("[Router]: Failed to add '", path, "': ", RouteErrorToString(err));

    return err;
}

RouteError Router::RegisterDynamicSegment(std::string_view name, std::string_view pattern)
{
    if(IsFrozen()) {
        Logger::GetInstance().Warn("[Router]: Rejected dynamic segment '", name, "', router is frozen");
        return RouteError::ROUTER_FROZEN;
    }

    return registry_.Define(name, pattern);
}

RouteError Router::ApplyConfig(const Core::Config& config)
{
    SetVerbose(config.routerConfig.verbose);
    SetVersionSource(config.routerConfig.versionHeader, config.routerConfig.versionPrefix);
    SetMaxDynamicSegmentLength(config.routerConfig.maxDynamicSegmentLength);

    for(const auto& [name, pattern] : config.dynamicConfig.segments) {
        RouteError err = RegisterDynamicSegment(name, pattern);
        if(err != RouteError::NONE)
            return err;
    }

    return RouteError::NONE;
}

void Router::SetVersionSource(std::string_view header, std::string_view prefix)
{
    versionHeader_ = header;
    versionPrefix_ = prefix;
}

void Router::SetMaxDynamicSegmentLength(std::size_t length)
{
    if(IsFrozen()) {
        Logger::GetInstance().Warn("[Router]: Segment length limit cannot change once serving started");
        return;
    }

    registry_.SetMaxSegmentLength(length);
}

void Router::SetNotFoundHandler(HttpCallbackType handler)
{
    notFoundHandler_ = std::move(handler);
}

void Router::SetNotAllowedHandler(HttpCallbackType handler)
{
    notAllowedHandler_ = std::move(handler);
}

void Router::Freeze()
{
    if(frozen_.exchange(true, std::memory_order_acq_rel))
        return;

    Logger::GetInstance().Info(
        "[Router]: Frozen with ", trie_.EntryCount(), " handler entries and ",
        registry_.Size(), " dynamic segments"
    );
}

// vvv Serve phase vvv
RouteMatch Router::Match(std::string_view path, std::string_view method, std::string_view version) const
{
    return matcher_.Match(SplitPath(path), method, version);
}

std::string_view Router::ResolveVersion(const HttpRequest& req) const
{
    return ExtractVersionToken(req.headers.GetHeader(versionHeader_), versionPrefix_);
}

void Router::Dispatch(HttpRequest& req, HttpResponse& res) const
{
    req.version = std::string(ResolveVersion(req));

    RouteMatch match = Match(req.path, req.method, req.version);
    req.params = std::move(match.params);

    Logger::GetInstance().Debug(
        "[Router]: ", req.method, ' ', req.path, " (version '", req.version, "') -> ",
        MatchStatusToString(match.status)
    );

    switch(match.status)
    {
        case MatchStatus::FOUND:
            (*match.handler)(req, res);
            return;

        case MatchStatus::METHOD_NOT_ALLOWED:
            if(notAllowedHandler_)
                notAllowedHandler_(req, res);
            else
                res.SendStatus(HttpStatus::METHOD_NOT_ALLOWED);
            return;

        case MatchStatus::NOT_FOUND:
        default:
            if(notFoundHandler_)
                notFoundHandler_(req, res);
            else
                res.SendStatus(HttpStatus::NOT_FOUND);
            return;
    }
}

// vvv Introspection vvv
Json Router::DumpRoutes() const
{
    Json children = Json::array();
    for(const auto& child : trie_.Root().children)
        children.push_back(DumpNode(*child));

    return Json{
        {"entries",  trie_.EntryCount()},
        {"frozen",   IsFrozen()},
        {"children", std::move(children)}
    };
}

Json Router::DumpNode(const TrieNode& node) const
{
    Json out = {
        {"segment", node.segment},
        {"kind",    std::string(SegmentKindToString(node.kind))}
    };

    if(node.kind == SegmentKind::DYNAMIC)
        if(const std::string* source = registry_.Source(node.segment))
            out["pattern"] = *source;

    Json handlers = Json::array();
    for(const auto& entry : node.handlers)
        handlers.push_back(Json{{"method", entry.method}, {"version", entry.version}});
    out["handlers"] = std::move(handlers);

    Json children = Json::array();
    for(const auto& child : node.children)
        children.push_back(DumpNode(*child));
    out["children"] = std::move(children);

    return out;
}

} // namespace Trellis::Http
