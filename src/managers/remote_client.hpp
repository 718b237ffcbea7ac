#pragma once

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

// One page of query results.
struct QueryResponse {
    std::vector<json> rows;                 // JSON objects
    std::optional<std::string> cursor;      // absent or empty = last page
};

// Transport failure from a remote call.
class RemoteError : public std::runtime_error {
public:
    enum class Kind { Http, Network, Decode };

    RemoteError(Kind kind, int status, const std::string& message)
        : std::runtime_error(message), kind_(kind), status_(status) {}

    static RemoteError http(int status, const std::string& body);
    static RemoteError network(const std::string& message);
    static RemoteError decode(const std::string& message);

    Kind kind() const { return kind_; }
    int status() const { return status_; }      // 0 unless kind == Http

    // 5xx, 413 and network failures
    bool retryable() const;

private:
    Kind kind_;
    int status_;
};

// Runs one query text. Implementations must be callable from several threads.
class QueryClient {
public:
    virtual ~QueryClient() = default;
    virtual QueryResponse execute_query(const std::string& query) = 0;
};

// Uploads span rows in requests of at most page_size rows. Returns bytes sent.
// Implementations must be callable from several threads.
class IngestClient {
public:
    virtual ~IngestClient() = default;
    virtual size_t upload_rows(const std::vector<json>& rows, size_t page_size) = 0;
};
