#pragma once

#include <optional>
#include <string>

#include "api/Controllers.hpp"

namespace wsm::http {

// Looks the key up in the query string first, then in a form-encoded body.
std::optional<std::string> opt_string(const wsm::api::Request& request, const char* key);

// Empty when the key is absent. Throws std::invalid_argument when present but not an integer.
std::optional<int> opt_int(const wsm::api::Request& request, const char* key);

// Empty when the key is absent. Throws std::invalid_argument when present but not a finite number.
std::optional<double> opt_double(const wsm::api::Request& request, const char* key);

}  // namespace wsm::http
