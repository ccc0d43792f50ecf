#pragma once

#include <string_view>

namespace wsm::http::errors {

inline constexpr std::string_view not_found = "not_found";
inline constexpr std::string_view invalid_config = "invalid_config";
inline constexpr std::string_view not_ready = "not_ready";
inline constexpr std::string_view internal_error = "internal_error";

}  // namespace wsm::http::errors
