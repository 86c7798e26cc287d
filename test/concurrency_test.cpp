/*
 * Build: g++ -std=c++17 -O2 -I. -pthread test/concurrency_test.cpp\
          http/routing/*.cpp\
          http/headers/http_headers.cpp\
          http/response/http_response.cpp\
          utils/logger/logger.cpp
 */

#include <atomic>
#include <cassert>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "http/routing/router.hpp"
#include "test/common/test_helpers.hpp"
#include "utils/logger/logger.hpp"

using namespace Trellis::Http;
using namespace Trellis::Test;
using namespace Trellis::Utils;

static void BuildRouter(Router& router)
{
    assert(router.RegisterDynamicSegment(":id",   R"(^\d+$)")   == RouteError::NONE);
    assert(router.RegisterDynamicSegment(":name", "^[a-z]+$")   == RouteError::NONE);

    assert(router.RegisterRoute("/users/:id",           Tag("user"),   "GET")  == RouteError::NONE);
    assert(router.RegisterRoute("/users/:id/posts/:id", Tag("post"),   "GET")  == RouteError::NONE);
    assert(router.RegisterRoute("/teams/:name",         Tag("team"))           == RouteError::NONE);
    assert(router.RegisterRoute("/teams/:name#v2",      Tag("team-v2"))        == RouteError::NONE);
    assert(router.RegisterRoute("/static/*",            Tag("static"))         == RouteError::NONE);

    router.Freeze();
}

static void stress_test_multithread(const Router& router, int threads, int ops)
{
    std::cout << "[TEST] Concurrent matching: " << threads << " threads, " << ops << " ops\n";

    std::atomic<bool> startFlag{false};
    std::atomic<int>  failures{0};

    auto worker = [&](int tid) {
        std::mt19937 rng(tid);
        std::uniform_int_distribution<int> pick(0, 4);

        while(!startFlag.load(std::memory_order_acquire))
            std::this_thread::yield();

        for(int i = 0; i < ops; ++i) {
            std::string n = std::to_string(tid * 100000 + i);

            switch(pick(rng)) {
                case 0: {
                    RouteMatch m = router.Match("/users/" + n, "GET", "");
                    if(Invoke(m) != "user" || m.params.Size() != 1 || *m.params.Get(":id") != n)
                        failures.fetch_add(1);
                    break;
                }
                case 1: {
                    RouteMatch m = router.Match("/users/" + n + "/posts/" + std::to_string(i), "GET", "");
                    auto ids = m.params.GetAll(":id");
                    if(Invoke(m) != "post" || ids.size() != 2 || ids[0] != n || ids[1] != std::to_string(i))
                        failures.fetch_add(1);
                    break;
                }
                case 2: {
                    const char* version = (i % 2) ? "v2" : "";
                    RouteMatch m = router.Match("/teams/abc", "PUT", version);
                    if(Invoke(m) != ((i % 2) ? "team-v2" : "team"))
                        failures.fetch_add(1);
                    break;
                }
                case 3: {
                    RouteMatch m = router.Match("/static/" + n, "GET", "");
                    if(Invoke(m) != "static" || *m.params.Get("*") != n)
                        failures.fetch_add(1);
                    break;
                }
                default: {
                    if(router.Match("/users/" + n, "DELETE", "").status != MatchStatus::METHOD_NOT_ALLOWED ||
                       router.Match("/nowhere/" + n, "GET", "").status  != MatchStatus::NOT_FOUND)
                        failures.fetch_add(1);
                    break;
                }
            }
        }
    };

    std::vector<std::thread> pool;
    for(int t = 0; t < threads; ++t)
        pool.emplace_back(worker, t);

    startFlag.store(true, std::memory_order_release);
    for(auto& th : pool)
        th.join();

    assert(failures.load() == 0);
    std::cout << "[+] Passed concurrent matching\n";
}

static void stress_test_dispatch(const Router& router, int threads, int ops)
{
    std::cout << "[TEST] Concurrent dispatch keeps requests apart\n";

    std::atomic<int> failures{0};

    auto worker = [&](int tid) {
        for(int i = 0; i < ops; ++i) {
            std::string id = std::to_string(tid) + std::to_string(i);

            HttpRequest req;
            req.method = "GET";
            req.path   = "/users/" + id;

            HttpResponse res;
            router.Dispatch(req, res);

            if(res.body != "user" || *req.params.Get(":id") != id)
                failures.fetch_add(1);
        }
    };

    std::vector<std::thread> pool;
    for(int t = 0; t < threads; ++t)
        pool.emplace_back(worker, t + 1);
    for(auto& th : pool)
        th.join();

    assert(failures.load() == 0);
    std::cout << "[+] Passed concurrent dispatch\n";
}

int main()
{
    Logger::GetInstance().SetLevelMask(TRELLIS_LOG_NONE);

    Router router;
    BuildRouter(router);

    unsigned int cores = std::thread::hardware_concurrency();
    int threads = static_cast<int>(cores < 4 ? 4 : cores);

    stress_test_multithread(router, threads, 20000);
    stress_test_dispatch(router, threads, 5000);

    std::cout << "All concurrency tests passed\n";
    return 0;
}
