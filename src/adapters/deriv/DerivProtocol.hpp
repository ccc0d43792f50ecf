#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <boost/json/value.hpp>

#include "domain/feed/ITickFeed.hpp"

namespace adapters::deriv {

constexpr std::int64_t kHistoryCount = 5000;

std::string make_authorize_request(const std::string& token);

std::string make_history_request(const std::string& symbol, const domain::TimeChunk& chunk);

std::string make_subscribe_request(const std::string& symbol);

// Upstream "error.message" (or "error.code") when the reply carries an error object.
std::optional<std::string> upstream_error(const boost::json::value& reply);

// Throws std::runtime_error unless the payload is an error-free authorize reply.
void ensure_authorized(const std::string& payload);

// Parses a ticks_history reply. Ticks outside [chunk.start, chunk.end) are dropped and
// the remainder receive sort keys from their position in the reply.
domain::FetchResult parse_history_response(const std::string& payload, const domain::TimeChunk& chunk);

// Returns the tick carried by a streaming message, nullopt for anything else.
std::optional<domain::Tick> parse_tick_message(const std::string& payload);

double json_to_double(const boost::json::value& value);
std::int64_t json_to_int64(const boost::json::value& value);

}  // namespace adapters::deriv
