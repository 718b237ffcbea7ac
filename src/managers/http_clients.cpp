#include "http_clients.hpp"
#include <core/constants.hpp>
#include <managers/sync_log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <algorithm>

static void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpResponse http_post_json(const SessionContext& session, const std::string& path,
                            const std::string& body) {
    ensure_curl_initialized();

    struct CurlDeleter {
        void operator()(CURL* c) const { curl_easy_cleanup(c); }
    };
    struct SlistDeleter {
        void operator()(curl_slist* l) const { curl_slist_free_all(l); }
    };

    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) throw RemoteError::network("curl_easy_init failed");

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers,
                                    ("Authorization: Bearer " + session.api_key).c_str());
    if (!session.org_name.empty()) {
        raw_headers = curl_slist_append(
            raw_headers, fmt::format("{}: {}", ORG_NAME_HEADER, session.org_name).c_str());
    }
    std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

    std::string url = session.api_url + path;
    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, HTTP_CONNECT_TIMEOUT_SECS);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, HTTP_REQUEST_TIMEOUT_SECS);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw RemoteError::network(fmt::format("{} {}", url, curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

// ── Query client ────────────────────────────────────────────

HttpQueryClient::HttpQueryClient(SessionContext session) : session_(std::move(session)) {}

QueryResponse HttpQueryClient::parse_response(const std::string& body) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw RemoteError::decode(e.what());
    }
    if (!doc.is_object() || !doc.contains("data") || !doc["data"].is_array()) {
        throw RemoteError::decode("expected an object with a data array");
    }

    QueryResponse out;
    for (auto& row : doc["data"]) {
        if (!row.is_object()) throw RemoteError::decode("data rows must be objects");
        out.rows.push_back(std::move(row));
    }
    auto it = doc.find("cursor");
    if (it != doc.end() && it->is_string()) {
        out.cursor = it->get<std::string>();
    }
    return out;
}

QueryResponse HttpQueryClient::execute_query(const std::string& query) {
    json body = {{"query", query}, {"fmt", "json"}};
    HttpResponse resp = http_post_json(session_, QUERY_ENDPOINT, body.dump());
    if (resp.status < 200 || resp.status >= 300) {
        throw RemoteError::http(static_cast<int>(resp.status), resp.body);
    }
    return parse_response(resp.body);
}

// ── Ingest client ───────────────────────────────────────────

HttpIngestClient::HttpIngestClient(SessionContext session) : session_(std::move(session)) {}

size_t HttpIngestClient::upload_rows(const std::vector<json>& rows, size_t page_size) {
    size_t step = std::max<size_t>(page_size, 1);
    size_t bytes = 0;
    for (size_t start = 0; start < rows.size(); start += step) {
        size_t end = std::min(rows.size(), start + step);
        json body = json::object();
        body["rows"] = json::array();
        for (size_t i = start; i < end; i++) body["rows"].push_back(rows[i]);
        body["api_version"] = INGEST_API_VERSION;

        std::string payload = body.dump();
        HttpResponse resp = http_post_json(session_, INGEST_ENDPOINT, payload);
        if (resp.status < 200 || resp.status >= 300) {
            throw RemoteError::http(static_cast<int>(resp.status), resp.body);
        }
        bytes += payload.size();
        sync_log(fmt::format("ingest: uploaded {} row(s), {} bytes", end - start, payload.size()));
    }
    return bytes;
}
