#include "path_segmenter.hpp"
#include "http/common/route_common.hpp"

#include <cctype>

namespace Trellis::Http {

PathSegments SplitPath(std::string_view path)
{
    PathSegments segments;

    std::size_t pos = 0;
    while(pos < path.size()) {
        std::size_t slash = path.find('/', pos);
        if(slash == std::string_view::npos)
            slash = path.size();

        if(slash > pos)
            segments.emplace_back(path.substr(pos, slash - pos));

        pos = slash + 1;
    }

    if(segments.empty())
        segments.emplace_back(ROOT_TOKEN);

    return segments;
}

std::pair<std::string_view, std::string_view> SplitRouteVersion(std::string_view route)
{
    std::size_t hash = route.find(VERSION_MARKER);
    if(hash == std::string_view::npos)
        return {route, {}};

    return {route.substr(0, hash), route.substr(hash + 1)};
}

std::vector<std::string> SplitMethods(std::string_view csv)
{
    std::vector<std::string> methods;

    std::size_t pos = 0;
    while(pos <= csv.size()) {
        std::size_t comma = csv.find(',', pos);
        if(comma == std::string_view::npos)
            comma = csv.size();

        std::string_view token = csv.substr(pos, comma - pos);

        // Trim surrounding whitespace
        while(!token.empty() && std::isspace(static_cast<unsigned char>(token.front())))
            token.remove_prefix(1);
        while(!token.empty() && std::isspace(static_cast<unsigned char>(token.back())))
            token.remove_suffix(1);

        if(!token.empty()) {
            std::string method(token);
            for(char& c : method)
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            methods.push_back(std::move(method));
        }

        pos = comma + 1;
    }

    if(methods.empty())
        methods.emplace_back(METHOD_ALL);

    return methods;
}

} // namespace Trellis::Http
