#include "adapters/deriv/DerivProtocol.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/json.hpp>

namespace adapters::deriv {
namespace {

namespace json = boost::json;

domain::FetchError protocol_error(std::string message) {
    return domain::FetchError{domain::FetchError::Kind::Protocol, std::move(message)};
}

std::optional<json::value> parse_object(const std::string& payload) {
    json::error_code ec;
    auto value = json::parse(payload, ec);
    if (ec || !value.is_object()) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

std::string make_authorize_request(const std::string& token) {
    json::object request;
    request["authorize"] = token;
    return json::serialize(request);
}

std::string make_history_request(const std::string& symbol, const domain::TimeChunk& chunk) {
    json::object request;
    request["ticks_history"] = symbol;
    request["start"] = chunk.start;
    request["end"] = chunk.end;
    request["count"] = kHistoryCount;
    request["style"] = "ticks";
    request["adjust_start_time"] = 1;
    return json::serialize(request);
}

std::string make_subscribe_request(const std::string& symbol) {
    json::object request;
    request["ticks"] = symbol;
    request["subscribe"] = 1;
    return json::serialize(request);
}

std::optional<std::string> upstream_error(const json::value& reply) {
    if (!reply.is_object()) {
        return std::nullopt;
    }
    const auto* error = reply.as_object().if_contains("error");
    if (error == nullptr || error->is_null()) {
        return std::nullopt;
    }
    if (error->is_object()) {
        const auto& errorObj = error->as_object();
        if (const auto* message = errorObj.if_contains("message"); message != nullptr && message->is_string()) {
            return std::string(message->as_string().c_str());
        }
        if (const auto* code = errorObj.if_contains("code"); code != nullptr && code->is_string()) {
            return std::string(code->as_string().c_str());
        }
    }
    return std::string{"unspecified upstream error"};
}

void ensure_authorized(const std::string& payload) {
    const auto reply = parse_object(payload);
    if (!reply) {
        throw std::runtime_error("authorize reply is not a JSON object");
    }
    if (auto error = upstream_error(*reply)) {
        throw std::runtime_error("authorize rejected: " + *error);
    }
    if (reply->as_object().if_contains("authorize") == nullptr) {
        throw std::runtime_error("authorize reply missing 'authorize' field");
    }
}

domain::FetchResult parse_history_response(const std::string& payload, const domain::TimeChunk& chunk) {
    const auto reply = parse_object(payload);
    if (!reply) {
        return domain::FetchResult::failure(protocol_error("history reply is not a JSON object"));
    }
    if (auto error = upstream_error(*reply)) {
        return domain::FetchResult::failure(
            domain::FetchError{domain::FetchError::Kind::Upstream, std::move(*error)});
    }

    const auto* history = reply->as_object().if_contains("history");
    if (history == nullptr || !history->is_object()) {
        return domain::FetchResult::failure(protocol_error("history reply missing 'history' object"));
    }

    const auto* times = history->as_object().if_contains("times");
    const auto* prices = history->as_object().if_contains("prices");
    if (times == nullptr || prices == nullptr || !times->is_array() || !prices->is_array()) {
        return domain::FetchResult::failure(protocol_error("history reply missing times/prices arrays"));
    }

    const auto& timesArr = times->as_array();
    const auto& pricesArr = prices->as_array();
    if (timesArr.size() != pricesArr.size()) {
        return domain::FetchResult::failure(protocol_error("history times/prices length mismatch"));
    }

    domain::TickBatch ticks;
    ticks.reserve(timesArr.size());
    try {
        std::int64_t sequence = 0;
        for (std::size_t i = 0; i < timesArr.size(); ++i) {
            const auto timestamp = json_to_int64(timesArr[i]);
            if (timestamp < chunk.start || timestamp >= chunk.end) {
                continue;
            }
            const auto price = json_to_double(pricesArr[i]);
            ticks.push_back(domain::Tick{timestamp, price, domain::make_sort_key(timestamp, sequence)});
            ++sequence;
        }
    }
    catch (const std::exception& ex) {
        return domain::FetchResult::failure(protocol_error(ex.what()));
    }

    return domain::FetchResult::success(std::move(ticks));
}

std::optional<domain::Tick> parse_tick_message(const std::string& payload) {
    const auto message = parse_object(payload);
    if (!message) {
        return std::nullopt;
    }

    const auto* tick = message->as_object().if_contains("tick");
    if (tick == nullptr || !tick->is_object()) {
        return std::nullopt;
    }

    const auto& tickObj = tick->as_object();
    const auto* epoch = tickObj.if_contains("epoch");
    const auto* quote = tickObj.if_contains("quote");
    if (epoch == nullptr || quote == nullptr) {
        return std::nullopt;
    }

    try {
        return domain::make_live_tick(json_to_int64(*epoch), json_to_double(*quote));
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

double json_to_double(const json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        }
        catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for floating conversion");
}

std::int64_t json_to_int64(const json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stoll(str);
        }
        catch (const std::exception& ex) {
            throw std::runtime_error("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

}  // namespace adapters::deriv
