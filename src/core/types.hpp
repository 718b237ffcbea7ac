#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstddef>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Credentials and endpoint used to build the remote clients
struct SessionContext {
    std::string api_key;
    std::string api_url;            // base URL, no trailing slash
    std::string org_name;           // "" = default org
};

// Defaults applied when a flag is not given on the command line
struct SyncDefaults {
    std::string root = "tracesync";
    size_t workers = 8;
    size_t page_size = 200;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
