#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

#include "adapters/deriv/DerivConnection.hpp"
#include "adapters/deriv/DerivProtocol.hpp"

namespace {

namespace json = boost::json;
using adapters::deriv::parse_history_response;

bool expectError(const domain::FetchResult& result, domain::FetchError::Kind kind, const char* label) {
    if (result.ok()) {
        std::cerr << label << ": expected an error result\n";
        return false;
    }
    if (result.error().kind != kind) {
        std::cerr << label << ": unexpected error kind " << domain::to_string(result.error().kind) << "\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    {
        const auto request = json::parse(adapters::deriv::make_history_request("R_100", {1000, 1600})).as_object();
        if (request.at("ticks_history").as_string() != "R_100" || request.at("start").as_int64() != 1000
            || request.at("end").as_int64() != 1600 || request.at("count").as_int64() != 5000
            || request.at("style").as_string() != "ticks" || request.at("adjust_start_time").as_int64() != 1) {
            std::cerr << "Unexpected history request: " << json::serialize(request) << "\n";
            return 1;
        }
        const auto subscribe = json::parse(adapters::deriv::make_subscribe_request("R_50")).as_object();
        if (subscribe.at("ticks").as_string() != "R_50" || subscribe.at("subscribe").as_int64() != 1) {
            std::cerr << "Unexpected subscribe request\n";
            return 1;
        }
        const auto authorize = json::parse(adapters::deriv::make_authorize_request("tok")).as_object();
        if (authorize.at("authorize").as_string() != "tok") {
            std::cerr << "Unexpected authorize request\n";
            return 1;
        }
    }

    // Ticks outside [start, end) are dropped; sequence numbers follow the kept order.
    {
        const std::string payload =
            R"({"echo_req":{},"history":{"times":[999,1000,1000,1599,1600],"prices":[1.0,2.0,"2.5",3.0,4.0]},"msg_type":"history"})";
        const auto result = parse_history_response(payload, {1000, 1600});
        if (!result.ok()) {
            std::cerr << "Expected history to parse: " << result.error().message << "\n";
            return 1;
        }
        const auto& ticks = result.value();
        if (ticks.size() != 3U || ticks[0].timestamp != 1000 || ticks[1].price != 2.5 || ticks[2].timestamp != 1599) {
            std::cerr << "Unexpected history ticks (size=" << ticks.size() << ")\n";
            return 1;
        }
        if (ticks[0].sortKey != domain::make_sort_key(1000, 0) || ticks[1].sortKey != domain::make_sort_key(1000, 1)
            || ticks[2].sortKey != domain::make_sort_key(1599, 2)) {
            std::cerr << "Unexpected sort keys for history ticks\n";
            return 1;
        }
    }

    if (!expectError(parse_history_response(R"({"error":{"code":"InputValidationFailed","message":"bad"}})", {0, 1}),
                     domain::FetchError::Kind::Upstream, "error object")
        || !expectError(parse_history_response(R"({"msg_type":"history"})", {0, 1}),
                        domain::FetchError::Kind::Protocol, "missing history")
        || !expectError(parse_history_response(R"({"history":{"times":[1,2],"prices":[1.0]}})", {0, 10}),
                        domain::FetchError::Kind::Protocol, "length mismatch")
        || !expectError(parse_history_response("not json", {0, 10}), domain::FetchError::Kind::Protocol,
                        "malformed payload")) {
        return 1;
    }

    {
        const auto tick = adapters::deriv::parse_tick_message(
            R"({"msg_type":"tick","tick":{"epoch":1700000000,"quote":1234.56,"symbol":"R_100"}})");
        if (!tick || tick->timestamp != 1700000000 || tick->price != 1234.56
            || tick->sortKey != domain::make_sort_key(1700000000)) {
            std::cerr << "Expected a live tick to parse\n";
            return 1;
        }
        if (adapters::deriv::parse_tick_message(R"({"msg_type":"ping","ping":"pong"})")
            || adapters::deriv::parse_tick_message(R"({"tick":{"epoch":1}})")
            || adapters::deriv::parse_tick_message("[]")) {
            std::cerr << "Expected non-tick messages to be ignored\n";
            return 1;
        }
    }

    {
        bool rejected = false;
        try {
            adapters::deriv::ensure_authorized(R"({"error":{"code":"InvalidToken","message":"The token is invalid."}})");
        }
        catch (const std::runtime_error&) {
            rejected = true;
        }
        if (!rejected) {
            std::cerr << "Expected an authorize error to throw\n";
            return 1;
        }
        adapters::deriv::ensure_authorized(R"({"authorize":{"loginid":"VRTC1"},"msg_type":"authorize"})");
    }

    {
        adapters::deriv::Endpoint endpoint;
        endpoint.appId = "4242";
        if (endpoint.target() != "/websockets/v3?app_id=4242" || endpoint.host != "ws.derivws.com") {
            std::cerr << "Unexpected upstream endpoint " << endpoint.host << endpoint.target() << "\n";
            return 1;
        }
    }

    return 0;
}
