#pragma once

#include <string>
#include <utility>
#include <vector>

namespace wsm::api {

struct Request {
    std::string method;
    std::string target;
    std::string path;
    std::string query;
    std::string version;
    std::string contentType;
    std::string body;
};

struct Response {
    int statusCode;
    std::string statusText;
    std::string body;
    std::string contentType;
    std::vector<std::pair<std::string, std::string>> headers;
};

Response healthz();

Response snapshot(const Request& request);

// Partial update of the analysis bounds from min_cycle, max_cycle, min_strength and
// max_strength. Parameters come from the query string or a form-encoded body.
Response updateConfig(const Request& request);

Response stats(const Request& request);

}  // namespace wsm::api
