#pragma once

#include <string_view>

#include <boost/json/value.hpp>

#include "api/Controllers.hpp"

namespace wsm::http {

// Serializes a JSON value into the response body with the given status.
void write_json(wsm::api::Response& response, const boost::json::value& value, int statusCode = 200);

// Writes {"error":"<code>"} with the given status.
void json_error(wsm::api::Response& response, int statusCode, std::string_view errorCode);

}  // namespace wsm::http
