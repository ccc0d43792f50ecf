#include "api/Router.hpp"

#include <exception>
#include <string>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "http/ErrorCodes.hpp"
#include "http/HttpJson.hpp"

namespace wsm::api {

namespace {

std::string makeKey(const std::string& method, const std::string& path) {
    return method + ' ' + path;
}

}  // namespace

Router::Router() {
    routes_.emplace(makeKey("GET", "/"), [](const Request&) { return healthz(); });
    routes_.emplace(makeKey("GET", "/healthz"), [](const Request&) { return healthz(); });
    routes_.emplace(makeKey("GET", "/api/v1/snapshot"), [](const Request& request) { return snapshot(request); });
    routes_.emplace(makeKey("POST", "/api/v1/config"), [](const Request& request) { return updateConfig(request); });
    routes_.emplace(makeKey("GET", "/stats"), [](const Request& request) { return stats(request); });
}

Response Router::handle(const Request& request) const {
    const auto key = makeKey(request.method, request.path);
    const auto it = routes_.find(key);
    if (it == routes_.end()) {
        Response response{404, "Not Found", {}, "application/json", {}};
        http::json_error(response, 404, http::errors::not_found);
        return response;
    }

    common::metrics::Registry::instance().incrementRequest(key);
    try {
        return it->second(request);
    }
    catch (const std::exception& ex) {
        LOG_ERR("Router: handler for " << key << " failed: " << ex.what());
        Response response{500, "Internal Server Error", {}, "application/json", {}};
        http::json_error(response, 500, http::errors::internal_error);
        return response;
    }
}

}  // namespace wsm::api
