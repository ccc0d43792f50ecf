#include "http/QueryParams.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

std::string decode_component(std::string_view value) {
    std::string decoded;
    decoded.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char ch = value[i];
        if (ch == '+') {
            decoded.push_back(' ');
        }
        else if (ch == '%' && i + 2 < value.size()) {
            const char* begin = value.data() + i + 1;
            const char* end = begin + 2;
            unsigned int code{};
            auto [ptr, ec] = std::from_chars(begin, end, code, 16);
            if (ec == std::errc() && ptr == end) {
                decoded.push_back(static_cast<char>(code));
                i += 2;
            }
            else {
                decoded.push_back(ch);
            }
        }
        else {
            decoded.push_back(ch);
        }
    }
    return decoded;
}

// Splits "a=1&b=2" into decoded key/value pairs, keeping their order.
std::vector<std::pair<std::string, std::string>> parse_pairs(std::string_view encoded) {
    std::vector<std::pair<std::string, std::string>> pairs;
    while (!encoded.empty()) {
        const auto amp = encoded.find('&');
        const auto part = encoded.substr(0, amp);
        encoded = amp == std::string_view::npos ? std::string_view{} : encoded.substr(amp + 1);
        if (part.empty()) {
            continue;
        }
        const auto eq = part.find('=');
        if (eq == std::string_view::npos) {
            pairs.emplace_back(decode_component(part), std::string{});
        }
        else {
            pairs.emplace_back(decode_component(part.substr(0, eq)), decode_component(part.substr(eq + 1)));
        }
    }
    return pairs;
}

std::optional<std::string> find_value(std::string_view encoded, std::string_view key) {
    for (auto& [name, value] : parse_pairs(encoded)) {
        if (name == key) {
            return std::move(value);
        }
    }
    return std::nullopt;
}

bool is_form_body(const wsm::api::Request& request) {
    if (request.body.empty()) {
        return false;
    }
    return request.contentType.empty()
        || request.contentType.find("application/x-www-form-urlencoded") != std::string::npos;
}

}  // namespace

namespace wsm::http {

std::optional<std::string> opt_string(const wsm::api::Request& request, const char* key) {
    if (!key) {
        return std::nullopt;
    }
    if (auto value = find_value(request.query, key)) {
        return value;
    }
    if (is_form_body(request)) {
        return find_value(request.body, key);
    }
    return std::nullopt;
}

std::optional<int> opt_int(const wsm::api::Request& request, const char* key) {
    const auto value = opt_string(request, key);
    if (!value) {
        return std::nullopt;
    }
    int result = 0;
    const auto* begin = value->data();
    const auto* end = begin + value->size();
    auto [ptr, ec] = std::from_chars(begin, end, result);
    if (value->empty() || ec != std::errc() || ptr != end) {
        throw std::invalid_argument(std::string("not an integer: ") + key);
    }
    return result;
}

std::optional<double> opt_double(const wsm::api::Request& request, const char* key) {
    const auto value = opt_string(request, key);
    if (!value) {
        return std::nullopt;
    }
    char* parsedEnd = nullptr;
    const double result = std::strtod(value->c_str(), &parsedEnd);
    if (value->empty() || parsedEnd != value->c_str() + value->size() || !std::isfinite(result)) {
        throw std::invalid_argument(std::string("not a number: ") + key);
    }
    return result;
}

}  // namespace wsm::http
