#ifndef TRELLIS_CONFIG_HELPERS_HPP
#define TRELLIS_CONFIG_HELPERS_HPP

#include "utils/logger/logger.hpp"
#include <toml++/toml.hpp>
#include <string>
#include <utility>
#include <vector>

namespace Trellis::Core::ConfigHelpers {

using Trellis::Utils::Logger;

// vvv Helper Helper Functions vvv
// "Router.Limits" walks nested tables, an empty view means some table on the way is missing
inline toml::node_view<const toml::node> ResolveTomlPath(const toml::table& tbl, const char* section)
{
    toml::node_view<const toml::node> node{tbl};

    const char* p = section;
    const char* segment_start = p;

    while(true) {
        while(*p != '\0' && *p != '.')
            ++p;

        std::string_view key(segment_start,
                             static_cast<size_t>(p - segment_start));

        node = node[key];
        if(!node || !node.is_table())
            return {};

        if(*p == '\0')
            break;

        ++p;
        segment_start = p;
    }

    return node;
}

// vvv Helper Functions vvv
template<typename T>
bool ExtractValue(
    const toml::table& tbl, const char* section, const char* field, T& target
)
{
    auto node = ResolveTomlPath(tbl, section);
    if(node && node.is_table()) {
        if(auto val = node[field].value<T>()) {
            target = *val;
            return true;
        }
    }

    Logger::GetInstance().Warn(
        "[Config]: Missing or invalid entry: [", section, "] ", field,
        ". Using default value: ", target
    );
    return false;
}

// Every string valued key of [section], non-strings are skipped with a warning
inline std::vector<std::pair<std::string, std::string>> ExtractStringTable(
    const toml::table& tbl, const char* section
)
{
    std::vector<std::pair<std::string, std::string>> entries;

    auto node = ResolveTomlPath(tbl, section);
    if(!node)
        return entries;

    for(auto&& [key, value] : *node.as_table()) {
        if(auto str = value.value<std::string>())
            entries.emplace_back(std::string(key.str()), *str);
        else
            Logger::GetInstance().Warn("[Config]: Non-string value in [", section, "] ", key.str(), ", skipped");
    }

    return entries;
}

} // namespace Trellis::Core::ConfigHelpers

#endif // TRELLIS_CONFIG_HELPERS_HPP
