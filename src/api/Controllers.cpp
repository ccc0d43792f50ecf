#include "api/Controllers.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "app/AnalysisScheduler.hpp"
#include "app/LiveSubscriber.hpp"
#include "app/ServiceLocator.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "core/RuntimeSettings.hpp"
#include "core/TickStore.hpp"
#include "domain/Models.hpp"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"
#include "http/QueryParams.hpp"

namespace wsm::api {

namespace {

constexpr auto kWsDownGrace = std::chrono::seconds(120);

Response emptyResponse() {
    return Response{200, "OK", {}, "application/json", {}};
}

boost::json::object configToJson(const domain::AnalysisSettings& settings) {
    boost::json::object config;
    config["symbol"] = settings.symbol;
    config["min_cycle"] = settings.minCycle;
    config["max_cycle"] = settings.maxCycle;
    config["min_strength"] = settings.minStrength;
    config["max_strength"] = settings.maxStrength;
    return config;
}

boost::json::object snapshotToJson(const domain::Snapshot& snapshot) {
    boost::json::array kings;
    kings.reserve(snapshot.kings.size());
    for (const auto& king : snapshot.kings) {
        boost::json::object item;
        item["tf"] = king.timeframe;
        item["color"] = domain::color_name(king.color);
        item["level"] = king.level;
        item["curr"] = king.currCount;
        item["next"] = king.nextCount;
        item["strength"] = king.strength;
        kings.emplace_back(std::move(item));
    }

    boost::json::object payload;
    payload["status"] = snapshot.status;
    payload["last_update"] = snapshot.lastUpdate;
    payload["price"] = snapshot.price;
    payload["kings"] = std::move(kings);
    payload["config"] = configToJson(snapshot.config);
    return payload;
}

}  // namespace

Response healthz() {
    const auto snapshot = common::metrics::Registry::instance().snapshot();

    std::chrono::duration<double> wsDownDuration{0.0};
    bool wsDown = false;
    if (const auto it = snapshot.gauges.find("ws_state"); it != snapshot.gauges.end()) {
        wsDown = it->second.value < 0.5;
        if (it->second.zeroSince.has_value()) {
            wsDownDuration = snapshot.capturedAt - *it->second.zeroSince;
        }
    }

    Response response = emptyResponse();
    if (!wsDown || wsDownDuration <= kWsDownGrace) {
        http::write_json(response, boost::json::object{{"status", "ok"}});
        return response;
    }

    boost::json::object detail;
    detail["issue"] = "ws_down";
    detail["duration_seconds"] = wsDownDuration.count();
    boost::json::object payload;
    payload["status"] = "error";
    boost::json::array details;
    details.emplace_back(std::move(detail));
    payload["details"] = std::move(details);
    http::write_json(response, payload, 503);
    return response;
}

Response snapshot(const Request&) {
    Response response = emptyResponse();
    const auto* scheduler = app::ServiceLocator::instance().scheduler();
    if (!scheduler) {
        http::json_error(response, 503, http::errors::not_ready);
        return response;
    }
    const auto current = scheduler->latestSnapshot();
    http::write_json(response, snapshotToJson(*current));
    return response;
}

Response updateConfig(const Request& request) {
    Response response = emptyResponse();
    auto* settings = app::ServiceLocator::instance().settings();
    if (!settings) {
        http::json_error(response, 503, http::errors::not_ready);
        return response;
    }

    core::SettingsUpdate update;
    try {
        update.minCycle = http::opt_int(request, "min_cycle");
        update.maxCycle = http::opt_int(request, "max_cycle");
        update.minStrength = http::opt_double(request, "min_strength");
        update.maxStrength = http::opt_double(request, "max_strength");
        const auto applied = settings->apply(update);
        http::write_json(response, configToJson(applied));
    }
    catch (const std::invalid_argument& ex) {
        LOG_WARN("Controllers::updateConfig rejected query='" << request.query << "' body='" << request.body
                                                                  << "': " << ex.what());
        http::json_error(response, 400, http::errors::invalid_config);
    }
    return response;
}

Response stats(const Request&) {
    const auto snapshot = common::metrics::Registry::instance().snapshot();
    const auto uptimeSeconds =
        std::chrono::duration_cast<std::chrono::duration<double>>(snapshot.capturedAt - snapshot.startTime).count();

    auto threadCount = std::thread::hardware_concurrency();
    if (threadCount == 0U) {
        threadCount = 1U;
    }

    boost::json::object payload;
    payload["uptime_seconds"] = uptimeSeconds;
    payload["threads"] = threadCount;

    const auto& locator = app::ServiceLocator::instance();
    if (const auto* store = locator.tickStore()) {
        payload["tick_count"] = store->count();
    }
    if (const auto* live = locator.liveSubscriber()) {
        payload["live_state"] = app::LiveSubscriber::stateName(live->state());
        payload["live_ticks"] = live->ticksReceived();
    }
    if (const auto* scheduler = locator.scheduler()) {
        payload["status"] = scheduler->status();
        payload["passes"] = scheduler->passes();
    }

    boost::json::object counters;
    for (const auto& [key, value] : snapshot.counters) {
        counters[key] = value;
    }
    boost::json::object gauges;
    for (const auto& [key, gauge] : snapshot.gauges) {
        gauges[key] = gauge.value;
    }
    boost::json::object routes;
    for (const auto& [route, requests] : snapshot.routes) {
        routes[route] = requests;
    }
    payload["counters"] = std::move(counters);
    payload["gauges"] = std::move(gauges);
    payload["routes"] = std::move(routes);

    Response response = emptyResponse();
    http::write_json(response, payload);
    return response;
}

}  // namespace wsm::api
