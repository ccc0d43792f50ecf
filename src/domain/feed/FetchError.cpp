#include "domain/feed/ITickFeed.hpp"

namespace domain {

const char* to_string(FetchError::Kind kind) noexcept {
    switch (kind) {
    case FetchError::Kind::Transport:
        return "transport";
    case FetchError::Kind::Timeout:
        return "timeout";
    case FetchError::Kind::Protocol:
        return "protocol";
    case FetchError::Kind::Upstream:
        return "upstream";
    }
    return "unknown";
}

}  // namespace domain
