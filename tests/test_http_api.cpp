#include <atomic>
#include <iostream>
#include <string>

#include <boost/json.hpp>

#include "api/HttpServer.hpp"
#include "api/Router.hpp"
#include "app/AnalysisScheduler.hpp"
#include "app/ServiceLocator.hpp"
#include "core/RuntimeSettings.hpp"
#include "core/TickStore.hpp"

namespace {

namespace json = boost::json;

wsm::api::Request makeRequest(const std::string& method, const std::string& path, const std::string& query = {}) {
    wsm::api::Request request{};
    request.method = method;
    request.path = path;
    request.query = query;
    request.target = query.empty() ? path : path + '?' + query;
    request.version = "HTTP/1.1";
    return request;
}

struct LocatorGuard {
    ~LocatorGuard() { app::ServiceLocator::instance().reset(); }
};

}  // namespace

int main() {
    // Raw request parsing: request line, query, content type and sized body.
    {
        const std::string raw =
            "POST /api/v1/config?min_cycle=5 HTTP/1.1\r\nHost: x\r\nContent-Type: application/x-www-form-urlencoded\r\n"
            "Content-Length: 13\r\n\r\nmax_cycle=9&extra";
        const auto request = wsm::api::parseRequest(raw);
        if (request.method != "POST" || request.path != "/api/v1/config" || request.query != "min_cycle=5"
            || request.contentType != "application/x-www-form-urlencoded" || request.body != "max_cycle=9&e") {
            std::cerr << "Unexpected parsed request body='" << request.body << "'\n";
            return 1;
        }
    }

    wsm::api::Router router;
    LocatorGuard locatorGuard;

    {
        const auto response = router.handle(makeRequest("GET", "/nope"));
        if (response.statusCode != 404 || json::parse(response.body).at("error").as_string() != "not_found") {
            std::cerr << "Expected 404 not_found, got " << response.statusCode << " " << response.body << "\n";
            return 1;
        }
    }

    {
        const auto response = router.handle(makeRequest("GET", "/api/v1/snapshot"));
        if (response.statusCode != 503) {
            std::cerr << "Expected 503 before services are registered\n";
            return 1;
        }
    }

    core::TickStore store;
    store.insertOne(domain::make_live_tick(1000, 123.25));
    core::RuntimeSettings settings(domain::AnalysisSettings{"R_100", 60, 300, 70.0, 100.0});
    std::atomic<bool> stop{false};
    app::AnalysisScheduler scheduler(store, settings, stop, app::AnalysisScheduler::Options{});
    scheduler.setStatus("Backfilling...");
    scheduler.publish(scheduler.runPass(1000));

    auto& locator = app::ServiceLocator::instance();
    locator.setScheduler(&scheduler);
    locator.setSettings(&settings);
    locator.setTickStore(&store);

    {
        const auto response = router.handle(makeRequest("GET", "/healthz"));
        if (response.statusCode != 200 || json::parse(response.body).at("status").as_string() != "ok") {
            std::cerr << "Expected healthy status\n";
            return 1;
        }
    }

    {
        const auto response = router.handle(makeRequest("GET", "/api/v1/snapshot"));
        const auto body = json::parse(response.body).as_object();
        const auto& config = body.at("config").as_object();
        if (response.statusCode != 200 || body.at("status").as_string() != "Backfilling..."
            || body.at("price").as_double() != 123.25 || !body.at("kings").is_array()
            || body.at("last_update").as_string().size() != 19U || config.at("symbol").as_string() != "R_100"
            || config.at("min_cycle").as_int64() != 60 || config.at("max_strength").as_double() != 100.0) {
            std::cerr << "Unexpected snapshot body: " << response.body << "\n";
            return 1;
        }
    }

    {
        const auto response = router.handle(makeRequest("POST", "/api/v1/config", "min_cycle=30&max_strength=95.5"));
        const auto body = json::parse(response.body).as_object();
        if (response.statusCode != 200 || body.at("min_cycle").as_int64() != 30
            || body.at("max_cycle").as_int64() != 300 || body.at("max_strength").as_double() != 95.5) {
            std::cerr << "Unexpected config update response: " << response.body << "\n";
            return 1;
        }
        if (settings.current().minCycle != 30) {
            std::cerr << "Config update did not reach the runtime settings\n";
            return 1;
        }
    }

    {
        auto request = makeRequest("POST", "/api/v1/config");
        request.contentType = "application/x-www-form-urlencoded";
        request.body = "max_cycle=45";
        const auto response = router.handle(request);
        if (response.statusCode != 200 || settings.current().maxCycle != 45) {
            std::cerr << "Expected form body parameters to apply\n";
            return 1;
        }
    }

    const char* invalidQueries[] = {"min_cycle=abc", "min_cycle=0", "min_cycle=50&max_cycle=40", "min_strength=-1",
                                    "max_strength=101", "min_strength=99&max_strength=98", "min_strength=nan",
                                    "max_cycle=3601", "max_cycle=2147483647"};
    for (const auto* query : invalidQueries) {
        const auto response = router.handle(makeRequest("POST", "/api/v1/config", query));
        if (response.statusCode != 400 || json::parse(response.body).at("error").as_string() != "invalid_config") {
            std::cerr << "Expected 400 invalid_config for '" << query << "', got " << response.statusCode << "\n";
            return 1;
        }
    }
    if (settings.current().minCycle != 30 || settings.current().maxCycle != 45) {
        std::cerr << "Rejected updates must not change the settings\n";
        return 1;
    }

    {
        const auto response = router.handle(makeRequest("GET", "/stats"));
        const auto body = json::parse(response.body).as_object();
        if (response.statusCode != 200 || body.at("tick_count").as_uint64() != 1U || !body.at("counters").is_object()
            || !body.at("routes").as_object().contains("GET /api/v1/snapshot")) {
            std::cerr << "Unexpected stats body: " << response.body << "\n";
            return 1;
        }
    }

    if (router.handle(makeRequest("GET", "/api/v1/config")).statusCode != 404) {
        std::cerr << "Expected GET on the config route to be unknown\n";
        return 1;
    }

    return 0;
}
