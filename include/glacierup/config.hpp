#pragma once

#include "glacierup/constants.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace glacierup {

/// Configuration for the vault backend ("glacier" or "local").
struct BackendConfig {
    std::string type = "glacier";
    std::map<std::string, std::string> params;  // Passed to VaultClientFactory

    bool empty() const { return type.empty(); }

    /// Validate required fields for this backend type.
    /// Returns error message or empty string on success.
    std::string validate() const;

    /// Copy of params with credentials replaced by "****".
    std::map<std::string, std::string> masked_params() const;
};

/// Configuration for one glacier-upload invocation.
struct AppConfig {
    // Subcommand: upload, list-uploads, list-parts, init-archive-retrieval,
    // init-inventory-retrieval, describe-job, get-job-output, abort-upload,
    // delete-archive
    std::string command;

    std::string vault;
    BackendConfig backend;

    // Upload
    std::filesystem::path file;
    std::string description;
    uint64_t part_size_mb = constants::DEFAULT_PART_SIZE_MB;
    size_t upload_threads = constants::DEFAULT_UPLOAD_THREADS;
    uint32_t max_retries = constants::DEFAULT_MAX_ATTEMPTS;
    uint64_t single_request_threshold = constants::DEFAULT_SINGLE_REQUEST_THRESHOLD;
    bool force_multipart = false;
    bool fail_on_digest_mismatch = false;  // Do not retry parts the remote rejects

    // Session / job identifiers
    std::string upload_id;
    std::string job_id;
    std::string archive_id;

    // Retrieval
    std::string tier;                      // Expedited, Standard, Bulk
    std::string inventory_format = "JSON"; // JSON or CSV
    std::filesystem::path output_file = "glacier_archive.bin";
    uint64_t segment_size_mb = constants::DEFAULT_OUTPUT_SEGMENT_SIZE / (1024 * 1024);
    bool wait = false;
    uint32_t poll_interval_secs = constants::DEFAULT_POLL_INTERVAL_SECONDS;
    uint32_t poll_timeout_secs = constants::DEFAULT_POLL_TIMEOUT_SECONDS;  // 0 = forever

    // Network
    uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    uint32_t request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = constants::DEFAULT_METRICS_INTERVAL_SECONDS;

    /// Parse a subcommand and its options.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<AppConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill credentials and region from the AWS_* environment and copy the
    /// network timeouts into the backend params.
    void apply_defaults();

    /// Validate fields required by the command. Returns error message or empty string.
    std::string validate() const;

    uint64_t part_size_bytes() const { return part_size_mb * 1024ULL * 1024; }
    uint64_t segment_size_bytes() const { return segment_size_mb * 1024ULL * 1024; }

    /// One line per effective setting, secrets masked.
    std::vector<std::string> describe() const;
};

/// Names of every supported subcommand.
const std::vector<std::string>& known_commands();

} // namespace glacierup
