#pragma once

#include <cstddef>
#include <cstdint>

namespace glacierup::constants {

// Tree hash
constexpr size_t TREE_HASH_CHUNK_SIZE = 1024 * 1024;                    // 1MB leaves
constexpr size_t DIGEST_SIZE = 32;                                       // SHA-256

// Part size limits (Glacier: power of two, 1MB..4GB)
constexpr uint64_t MIN_PART_SIZE = 1024ULL * 1024;                       // 1MB
constexpr uint64_t MAX_PART_SIZE = 4096ULL * 1024 * 1024;                // 4GB
constexpr uint64_t DEFAULT_PART_SIZE_MB = 8;
constexpr uint64_t MAX_PARTS_PER_UPLOAD = 10000;

// Upload defaults
constexpr size_t DEFAULT_UPLOAD_THREADS = 5;
constexpr uint32_t DEFAULT_MAX_ATTEMPTS = 10;
constexpr uint32_t DEFAULT_INITIAL_BACKOFF_MS = 500;
constexpr uint32_t DEFAULT_MAX_BACKOFF_MS = 30000;
constexpr uint64_t DEFAULT_SINGLE_REQUEST_THRESHOLD = 4ULL * 1024 * 1024;  // 4MB

// Retrieval defaults
constexpr uint64_t DEFAULT_OUTPUT_SEGMENT_SIZE = 16ULL * 1024 * 1024;    // 16MB
constexpr int DEFAULT_POLL_INTERVAL_SECONDS = 15 * 60;
constexpr int DEFAULT_POLL_TIMEOUT_SECONDS = 0;                          // 0 = no limit

// HTTP defaults
constexpr int DEFAULT_CONNECT_TIMEOUT_SECONDS = 10;
constexpr int DEFAULT_REQUEST_TIMEOUT_SECONDS = 300;
constexpr size_t DEFAULT_LIST_LIMIT = 1000;

// Glacier REST API
constexpr const char* GLACIER_API_VERSION = "2012-06-01";
constexpr const char* DEFAULT_ACCOUNT_ID = "-";
constexpr const char* DEFAULT_REGION = "us-east-1";

// Metrics
constexpr size_t DEFAULT_METRICS_INTERVAL_SECONDS = 15;

} // namespace glacierup::constants
