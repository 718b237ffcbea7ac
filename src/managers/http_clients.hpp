#pragma once

#include <string>
#include <core/types.hpp>
#include "remote_client.hpp"

// Plain HTTP response as seen by the clients below.
struct HttpResponse {
    long status = 0;
    std::string body;
};

// POST a JSON body with bearer auth (and the org header when org_name is set).
// Throws RemoteError::network on transport failure; HTTP status is returned.
HttpResponse http_post_json(const SessionContext& session, const std::string& path,
                            const std::string& body);

// POST {api_url}/btql
class HttpQueryClient : public QueryClient {
public:
    explicit HttpQueryClient(SessionContext session);
    QueryResponse execute_query(const std::string& query) override;

    // {"data": [...], "cursor": "..."} -> QueryResponse. Throws RemoteError::decode.
    static QueryResponse parse_response(const std::string& body);

private:
    SessionContext session_;
};

// POST {api_url}/logs3
class HttpIngestClient : public IngestClient {
public:
    explicit HttpIngestClient(SessionContext session);
    size_t upload_rows(const std::vector<json>& rows, size_t page_size) override;

private:
    SessionContext session_;
};
