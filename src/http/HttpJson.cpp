#include "http/HttpJson.hpp"

#include <array>
#include <string>

#include <boost/json/object.hpp>
#include <boost/json/serializer.hpp>

namespace {

std::string status_reason(int statusCode) {
    switch (statusCode) {
    case 200:
        return "OK";
    case 400:
        return "Bad Request";
    case 404:
        return "Not Found";
    case 500:
        return "Internal Server Error";
    case 503:
        return "Service Unavailable";
    default:
        break;
    }
    return "Unknown";
}

std::string serialize_json(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};

    while (!sr.done()) {
        boost::json::string_view chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }

    return result;
}

}  // namespace

namespace wsm::http {

void write_json(wsm::api::Response& response, const boost::json::value& value, int statusCode) {
    response.body = serialize_json(value);
    response.statusCode = statusCode;
    response.statusText = status_reason(statusCode);
    response.contentType = "application/json; charset=utf-8";
    response.headers.clear();
}

void json_error(wsm::api::Response& response, int statusCode, std::string_view errorCode) {
    boost::json::object payload;
    payload["error"] = boost::json::string_view(errorCode.data(), errorCode.size());
    write_json(response, payload, statusCode);
}

}  // namespace wsm::http
