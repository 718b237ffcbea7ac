#include "remote_client.hpp"
#include <fmt/format.h>

RemoteError RemoteError::http(int status, const std::string& body) {
    return RemoteError(Kind::Http, status, fmt::format("HTTP {}: {}", status, body));
}

RemoteError RemoteError::network(const std::string& message) {
    return RemoteError(Kind::Network, 0, fmt::format("network error: {}", message));
}

RemoteError RemoteError::decode(const std::string& message) {
    return RemoteError(Kind::Decode, 0, fmt::format("failed to decode response: {}", message));
}

bool RemoteError::retryable() const {
    switch (kind_) {
        case Kind::Network: return true;
        case Kind::Http: return status_ >= 500 || status_ == 413;
        case Kind::Decode: return false;
    }
    return false;
}
