#include "config.hpp"
#include "config_helper.hpp"
#include "utils/logger/logger.hpp"

#include <toml++/toml.hpp>
#include <cstdint>

namespace Trellis::Core {

using namespace Trellis::Utils; // For 'Logger'
using namespace ConfigHelpers;  // For 'ExtractValue', 'ExtractStringTable'

namespace {

void ReadTable(const toml::table& tbl, Config& config)
{
    ExtractValue(tbl, "Router", "verbose",        config.routerConfig.verbose);
    ExtractValue(tbl, "Router", "version_header", config.routerConfig.versionHeader);
    ExtractValue(tbl, "Router", "version_prefix", config.routerConfig.versionPrefix);
    ExtractValue(tbl, "Router", "max_dynamic_segment_length", config.routerConfig.maxDynamicSegmentLength);

    ExtractValue(tbl, "Logging", "level",      config.loggingConfig.level);
    ExtractValue(tbl, "Logging", "timestamps", config.loggingConfig.timestamps);

    config.dynamicConfig.segments = ExtractStringTable(tbl, "Dynamic");
}

} // namespace

Config& Config::GetInstance()
{
    static Config config;
    return config;
}

bool Config::LoadRouterSettings(std::string_view path)
{
    Logger& logger = Logger::GetInstance();

    try {
        auto tbl = toml::parse_file(path);
        ReadTable(tbl, *this);
    }
    catch(const toml::parse_error& err) {
        logger.Error("[Config]: '", path, "' ", err.what(), ". Keeping current router settings.");
        return false;
    }

    logger.Info("[Config]: Loaded router settings from '", path, "'");
    return true;
}

bool Config::LoadRouterSettingsFromString(std::string_view toml)
{
    try {
        auto tbl = toml::parse(toml);
        ReadTable(tbl, *this);
    }
    catch(const toml::parse_error& err) {
        Logger::GetInstance().Error("[Config]: ", err.what(), ". Keeping current router settings.");
        return false;
    }

    return true;
}

void Config::ApplyLoggingSettings() const
{
    Logger& logger = Logger::GetInstance();

    constexpr Logger::LevelMask unknown = UINT32_MAX;

    auto mask = Logger::ParseLevelMask(loggingConfig.level, unknown);
    if(mask == unknown)
        logger.Warn("[Config]: Unknown [Logging] level '", loggingConfig.level, "', keeping current mask");
    else
        logger.SetLevelMask(mask);

    logger.EnableTimestamps(loggingConfig.timestamps);
}

} // namespace Trellis::Core
