#ifndef TRELLIS_CONFIG_HPP
#define TRELLIS_CONFIG_HPP

#include "http/common/route_common.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Trellis::Core {

struct RouterConfig {
    bool        verbose       = true;
    std::string versionHeader = "Accept";
    std::string versionPrefix = "application/vnd.";
    std::size_t maxDynamicSegmentLength = Http::MAX_DYNAMIC_SEGMENT_LENGTH;
};

struct LoggingConfig {
    std::string level      = "all";
    bool        timestamps = true;
};

// [Dynamic] table, name -> pattern pairs in file order
struct DynamicSegmentConfig {
    std::vector<std::pair<std::string, std::string>> segments;
};

class Config {
public:
    Config() = default;

    static Config& GetInstance();

    // Both return false (and keep whatever was loaded before) when the TOML does not parse
    bool LoadRouterSettings(std::string_view path);
    bool LoadRouterSettingsFromString(std::string_view toml);

    // Pushes 'loggingConfig' into the global logger
    void ApplyLoggingSettings() const;

public:
    RouterConfig         routerConfig;
    LoggingConfig        loggingConfig;
    DynamicSegmentConfig dynamicConfig;
};

} // namespace Trellis::Core

#endif // TRELLIS_CONFIG_HPP
