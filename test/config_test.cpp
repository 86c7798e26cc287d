/*
 * Build: g++ -std=c++17 -I. test/config_test.cpp\
          config/config.cpp\
          http/routing/*.cpp\
          http/headers/http_headers.cpp\
          http/response/http_response.cpp\
          utils/logger/logger.cpp
 */

#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>

#include "config/config.hpp"
#include "http/routing/router.hpp"
#include "test/common/test_helpers.hpp"
#include "utils/logger/logger.hpp"

using namespace Trellis::Core;
using namespace Trellis::Http;
using namespace Trellis::Test;
using namespace Trellis::Utils;

static const char* SAMPLE_TOML = R"(
[Router]
verbose        = false
version_header = "X-Api-Version"
version_prefix = "ver="
max_dynamic_segment_length = 64

[Logging]
level      = "warnings"
timestamps = false

[Dynamic]
":id"   = '^\d+$'
":slug" = '^[a-z-]+$'
)";

static void test_defaults()
{
    std::cout << "[TEST] Defaults without any file\n";

    Config config;
    assert(config.routerConfig.verbose);
    assert(config.routerConfig.versionHeader == "Accept");
    assert(config.routerConfig.versionPrefix == "application/vnd.");
    assert(config.routerConfig.maxDynamicSegmentLength == MAX_DYNAMIC_SEGMENT_LENGTH);
    assert(config.loggingConfig.level == "all");
    assert(config.dynamicConfig.segments.empty());

    std::cout << "[+] Passed defaults\n";
}

static void test_load_string()
{
    std::cout << "[TEST] Load settings from TOML text\n";

    Config config;
    assert(config.LoadRouterSettingsFromString(SAMPLE_TOML));

    assert(!config.routerConfig.verbose);
    assert(config.routerConfig.versionHeader == "X-Api-Version");
    assert(config.routerConfig.versionPrefix == "ver=");
    assert(config.routerConfig.maxDynamicSegmentLength == 64);
    assert(config.loggingConfig.level == "warnings");
    assert(!config.loggingConfig.timestamps);
    assert(config.dynamicConfig.segments.size() == 2);

    std::cout << "[+] Passed load string\n";
}

static void test_partial_and_invalid()
{
    std::cout << "[TEST] Missing entries keep defaults, bad TOML is rejected\n";

    Config config;
    assert(config.LoadRouterSettingsFromString("[Router]\nversion_prefix = \"v=\"\n"));
    assert(config.routerConfig.versionPrefix == "v=");
    assert(config.routerConfig.versionHeader == "Accept");
    assert(config.routerConfig.verbose);

    // Wrong type keeps the default
    assert(config.LoadRouterSettingsFromString("[Router]\nverbose = \"yes\"\n"));
    assert(config.routerConfig.verbose);

    assert(!config.LoadRouterSettingsFromString("[Router\nverbose = "));
    assert(config.routerConfig.versionPrefix == "v=");

    assert(!config.LoadRouterSettings("definitely/not/here.toml"));

    std::cout << "[+] Passed partial & invalid\n";
}

static void test_load_file()
{
    std::cout << "[TEST] Load settings from a file\n";

    const char* path = "trellis_config_test.toml";
    {
        std::ofstream out(path);
        out << SAMPLE_TOML;
    }

    Config config;
    assert(config.LoadRouterSettings(path));
    assert(config.routerConfig.versionHeader == "X-Api-Version");
    std::remove(path);

    std::cout << "[+] Passed load file\n";
}

static void test_apply_to_router()
{
    std::cout << "[TEST] Apply config to a router\n";

    Config config;
    assert(config.LoadRouterSettingsFromString(SAMPLE_TOML));

    Router router;
    assert(router.ApplyConfig(config) == RouteError::NONE);
    assert(router.GetRegistry().Size() == 2);
    assert(router.GetRegistry().GetMaxSegmentLength() == 64);

    assert(router.RegisterRoute("/post/:slug", Tag("post"), "GET")  == RouteError::NONE);
    assert(router.RegisterRoute("/post/:id#2", Tag("post2"), "GET") == RouteError::NONE);

    RouteMatch m = router.Match("/post/hello-world", "GET", "");
    assert(Invoke(m) == "post");
    assert(*m.params.Get(":slug") == "hello-world");

    // Over the configured limit no pattern is consulted
    assert(router.Match("/post/" + std::string(65, 'a'), "GET", "").status == MatchStatus::NOT_FOUND);

    HttpRequest req;
    req.method = "GET";
    req.path   = "/post/17";
    req.headers.SetHeader("X-Api-Version", "ver=2");

    HttpResponse res;
    router.Dispatch(req, res);
    assert(res.body == "post2");

    Config broken;
    assert(broken.LoadRouterSettingsFromString("[Dynamic]\n\":bad\" = '('\n"));
    Router other;
    assert(other.ApplyConfig(broken) == RouteError::INVALID_PATTERN);

    std::cout << "[+] Passed apply to router\n";
}

static void test_logging_settings()
{
    std::cout << "[TEST] Logging settings reach the logger\n";

    Logger& logger = Logger::GetInstance();
    Logger::LevelMask before = logger.GetLevelMask();

    Config config;
    config.loggingConfig.level = "warnings";
    config.ApplyLoggingSettings();
    assert(logger.GetLevelMask() == (TRELLIS_LOG_WARNINGS));

    // Unknown names leave the mask alone
    config.loggingConfig.level = "chatty";
    config.ApplyLoggingSettings();
    assert(logger.GetLevelMask() == (TRELLIS_LOG_WARNINGS));

    assert(Logger::ParseLevelMask("all", 0) == TRELLIS_LOG_ALL);
    assert(Logger::ParseLevelMask("none", 7) == TRELLIS_LOG_NONE);
    assert(Logger::ParseLevelMask("???", 7) == 7);

    logger.SetLevelMask(before);
    logger.EnableTimestamps(true);

    std::cout << "[+] Passed logging settings\n";
}

int main()
{
    Logger::GetInstance().SetLevelMask(TRELLIS_LOG_NONE);

    test_defaults();
    test_load_string();
    test_partial_and_invalid();
    test_load_file();
    test_apply_to_router();
    test_logging_settings();

    std::cout << "All config tests passed\n";
    return 0;
}
