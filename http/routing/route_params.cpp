#include "route_params.hpp"

namespace Trellis::Http {

RouteParams RouteParams::Add(std::string_view name, std::string_view value) const
{
    RouteParams next = *this;
    next.entries_.emplace_back(std::string(name), std::string(value));

    return next;
}

const std::string* RouteParams::Get(std::string_view name) const
{
    // Innermost binding wins, so scan from the back
    for(auto it = entries_.rbegin(); it != entries_.rend(); ++it)
        if(it->first == name)
            return &it->second;

    return nullptr;
}

std::vector<std::string> RouteParams::GetAll(std::string_view name) const
{
    std::vector<std::string> values;
    for(const auto& [key, value] : entries_)
        if(key == name)
            values.push_back(value);

    return values;
}

bool RouteParams::Has(std::string_view name) const
{
    return Get(name) != nullptr;
}

} // namespace Trellis::Http
