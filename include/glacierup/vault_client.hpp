#pragma once

#include "glacierup/chunk_reader.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace glacierup {

// Classification of a remote failure
enum class RemoteErrorKind {
    None,
    NotFound,          // No such vault, upload, archive or job
    AccessDenied,      // Bad or missing credentials
    InvalidParameter,  // Request rejected as malformed
    ChecksumMismatch,  // Remote tree hash disagrees with ours
    Transient,         // Network error, timeout, throttling, 5xx
    Other
};

const char* remote_error_to_string(RemoteErrorKind kind);

// Outcome of a remote call
struct RemoteStatus {
    RemoteErrorKind kind = RemoteErrorKind::None;
    std::string message;

    bool ok() const { return kind == RemoteErrorKind::None; }
    bool transient() const { return kind == RemoteErrorKind::Transient; }

    static RemoteStatus success() { return {}; }
    static RemoteStatus failure(RemoteErrorKind k, std::string msg) {
        return {k, std::move(msg)};
    }
};

// Result of InitiateMultipartUpload
struct InitiateUploadResult {
    RemoteStatus status;
    std::string upload_id;
    std::string location;
};

// Result of UploadMultipartPart
struct UploadPartResult {
    RemoteStatus status;
    std::string tree_hash;  // Hex tree hash reported by the remote, may be empty
};

// Result of CompleteMultipartUpload and UploadArchive
struct ArchiveResult {
    RemoteStatus status;
    std::string archive_id;
    std::string tree_hash;
    std::string location;
};

// Entry in ListMultipartUploads
struct MultipartUploadInfo {
    std::string upload_id;
    std::string description;
    std::string creation_date;
    uint64_t part_size = 0;
    std::string vault_arn;
};

struct ListUploadsResult {
    RemoteStatus status;
    std::vector<MultipartUploadInfo> uploads;
    std::string marker;  // Non-empty when more results are available
};

// Entry in ListParts
struct PartInfo {
    ByteRange range;
    std::string tree_hash;
};

struct ListPartsResult {
    RemoteStatus status;
    std::string upload_id;
    std::string description;
    uint64_t part_size = 0;
    std::vector<PartInfo> parts;
    std::string marker;  // Non-empty when more results are available
};

enum class JobKind {
    ArchiveRetrieval,
    InventoryRetrieval
};

const char* job_kind_to_string(JobKind kind);

// Parameters for InitiateJob
struct JobRequest {
    JobKind kind = JobKind::ArchiveRetrieval;
    std::string archive_id;              // Required for archive retrieval
    std::string description;
    std::string tier;                    // Expedited, Standard, Bulk; empty = service default
    std::string inventory_format = "JSON";  // JSON or CSV
};

struct InitiateJobResult {
    RemoteStatus status;
    std::string job_id;
    std::string location;
};

enum class JobStatusCode {
    InProgress,
    Succeeded,
    Failed
};

const char* job_status_to_string(JobStatusCode code);

// Result of DescribeJob
struct JobDescription {
    RemoteStatus status;
    std::string job_id;
    JobKind kind = JobKind::ArchiveRetrieval;
    bool completed = false;
    JobStatusCode status_code = JobStatusCode::InProgress;
    std::string status_message;
    std::string creation_date;
    std::string completion_date;
    uint64_t output_size = 0;        // Archive or inventory size once known
    std::string output_tree_hash;    // Whole-output tree hash if the remote reports one
};

// Result of GetJobOutput
struct JobOutputResult {
    RemoteStatus status;
    std::vector<uint8_t> data;
    std::string content_type;
    std::string tree_hash;  // Tree hash of the returned range when aligned
};

/// The remote archive service, as seen by the upload and retrieval engines.
///
/// Implementations report failures through RemoteStatus and never throw for
/// remote errors. All methods must be safe to call concurrently.
class VaultClient {
public:
    virtual ~VaultClient() = default;

    // Backend type name (for logging)
    virtual std::string type_name() const = 0;

    // --- Multipart upload ---

    virtual InitiateUploadResult initiate_multipart_upload(
        const std::string& vault, uint64_t part_size,
        const std::string& description) = 0;

    virtual UploadPartResult upload_part(
        const std::string& vault, const std::string& upload_id,
        const ByteRange& range, std::span<const uint8_t> data,
        const std::string& tree_hash) = 0;

    virtual ArchiveResult complete_multipart_upload(
        const std::string& vault, const std::string& upload_id,
        uint64_t archive_size, const std::string& tree_hash) = 0;

    virtual RemoteStatus abort_multipart_upload(
        const std::string& vault, const std::string& upload_id) = 0;

    virtual ListUploadsResult list_multipart_uploads(
        const std::string& vault, const std::string& marker = {}) = 0;

    virtual ListPartsResult list_parts(
        const std::string& vault, const std::string& upload_id,
        const std::string& marker = {}) = 0;

    // --- Archives ---

    // Single-request upload for small archives
    virtual ArchiveResult upload_archive(
        const std::string& vault, std::span<const uint8_t> data,
        const std::string& tree_hash, const std::string& description) = 0;

    virtual RemoteStatus delete_archive(
        const std::string& vault, const std::string& archive_id) = 0;

    // --- Jobs ---

    virtual InitiateJobResult initiate_job(
        const std::string& vault, const JobRequest& request) = 0;

    virtual JobDescription describe_job(
        const std::string& vault, const std::string& job_id) = 0;

    virtual JobOutputResult get_job_output(
        const std::string& vault, const std::string& job_id,
        const std::optional<ByteRange>& range = std::nullopt) = 0;
};

/// Builds vault clients from a backend configuration map.
class VaultClientFactory {
public:
    /// type: "glacier" or "local". Throws std::invalid_argument for an unknown
    /// type or missing required parameters.
    static std::unique_ptr<VaultClient> create(
        const std::string& type,
        const std::map<std::string, std::string>& params);
};

} // namespace glacierup
