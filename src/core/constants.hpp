#pragma once

#include <cstddef>
#include <cstdint>

// ── State files ─────────────────────────────────────────────
constexpr uint32_t STATE_SCHEMA_VERSION      = 1;
constexpr const char* SPEC_FILE_NAME         = "spec.json";
constexpr const char* STATE_FILE_NAME        = "state.json";
constexpr const char* MANIFEST_FILE_NAME     = "manifest.json";
constexpr const char* DATA_DIR_NAME          = "data";
constexpr const char* LEGACY_JSONL_NAME      = "data.jsonl";
constexpr const char* LEGACY_NDJSON_NAME     = "data.ndjson";
constexpr size_t SPEC_HASH_PREFIX_LEN        = 12;

// ── Pull / push defaults ────────────────────────────────────
constexpr size_t DEFAULT_PULL_LIMIT          = 100;   // traces when no limit flag is set
constexpr size_t DEFAULT_PAGE_SIZE           = 200;
constexpr size_t DEFAULT_WORKERS             = 8;
constexpr size_t ROOT_DISCOVERY_PAGE_SIZE    = 1000;  // query service caps limit at 1000
constexpr size_t ROOT_FETCH_CHUNK_SIZE       = 100;
constexpr uint64_t PULL_OUTPUT_PART_MAX_BYTES = 128ULL * 1024 * 1024;  // 128 MiB

// ── Query retry ─────────────────────────────────────────────
constexpr int QUERY_MAX_ATTEMPTS             = 5;
constexpr int QUERY_RETRY_BASE_DELAY_MS      = 300;
constexpr int QUERY_MAX_BACKOFF_MS           = 8000;
constexpr double QUERY_BACKOFF_MULTIPLIER    = 2.0;
constexpr double QUERY_BACKOFF_JITTER        = 0.2;   // +/- 20%

// ── HTTP ────────────────────────────────────────────────────
constexpr long HTTP_CONNECT_TIMEOUT_SECS     = 30;
constexpr long HTTP_REQUEST_TIMEOUT_SECS     = 300;
constexpr const char* QUERY_ENDPOINT         = "/btql";
constexpr const char* INGEST_ENDPOINT        = "/logs3";
constexpr const char* ORG_NAME_HEADER        = "x-bt-org-name";
constexpr int INGEST_API_VERSION             = 2;

// ── Push row rewrite ────────────────────────────────────────
constexpr const char* MISSING_ROOT_ID        = "__missing__";
constexpr const char* DEFAULT_LOG_ID         = "g";
