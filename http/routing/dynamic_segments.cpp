#include "dynamic_segments.hpp"
#include "utils/logger/logger.hpp"

namespace Trellis::Http {

using namespace Trellis::Utils; // For 'Logger'

RouteError DynamicSegmentRegistry::Define(std::string_view name, std::string_view pattern)
{
    std::regex compiled;
    try {
        compiled.assign(pattern.begin(), pattern.end(), std::regex::ECMAScript | std::regex::optimize);
    }
    catch(const std::regex_error& err) {
        Logger::GetInstance().Warn("[DynamicSegments]: Pattern for '", name, "' failed to compile: ", err.what());
        return RouteError::INVALID_PATTERN;
    }

    patterns_.insert_or_assign(std::string(name), CompiledPattern{std::string(pattern), std::move(compiled)});
    return RouteError::NONE;
}

const std::regex* DynamicSegmentRegistry::Lookup(std::string_view name) const
{
    auto it = patterns_.find(std::string(name));
    return (it != patterns_.end()) ? &it->second.regex : nullptr;
}

const std::string* DynamicSegmentRegistry::Source(std::string_view name) const
{
    auto it = patterns_.find(std::string(name));
    return (it != patterns_.end()) ? &it->second.source : nullptr;
}

bool DynamicSegmentRegistry::Matches(std::string_view name, std::string_view segment) const
{
    if(segment.size() > maxSegmentLength_)
        return false;

    const std::regex* regex = Lookup(name);
    if(!regex)
        return false;

    return std::regex_search(segment.begin(), segment.end(), *regex);
}

} // namespace Trellis::Http
