#pragma once

#include "glacierup/chunk_reader.hpp"
#include "glacierup/constants.hpp"
#include "glacierup/tree_hash.hpp"
#include "glacierup/upload_pool.hpp"
#include "glacierup/vault_client.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace glacierup {

enum class SessionState {
    Pending,
    Initiated,
    Uploading,
    Finalized,
    Aborted,
    Failed   // Session failed and abort also failed; needs manual cleanup
};

const char* session_state_to_string(SessionState state);

/// One multipart upload, from initiation to completion or abort.
struct UploadSession {
    std::string upload_id;
    std::string vault;
    uint64_t part_size = 0;
    uint64_t total_size = 0;
    size_t part_count = 0;
    std::map<size_t, PartOutcome> outcomes;   // Successful parts, by index
    SessionState state = SessionState::Pending;

    /// Number of indices in [0, part_count) without a successful outcome.
    size_t missing_parts() const;
};

/// Everything an upload needs besides the source file. Passed explicitly,
/// never held in globals.
struct UploadContext {
    VaultClient* client = nullptr;              // Not owned
    std::string vault;
    std::string description;
    size_t concurrency = constants::DEFAULT_UPLOAD_THREADS;
    RetryPolicy retry;
    PartObserver* observer = nullptr;           // Not owned, may be null
    Sleeper sleeper;                            // Empty = real sleep
};

struct ArchiveReceipt {
    std::string archive_id;
    std::string tree_hash;        // Locally computed, hex
    std::string remote_tree_hash; // As reported by the remote (may be empty)
    std::string location;
    uint64_t size = 0;
    std::string upload_id;        // Empty for single-request uploads
};

/// Drives a multipart upload session end to end.
///
/// Failures leave the remote in a known state: every error thrown after a
/// session was opened has already attempted an abort, and the exception's
/// RemoteState says whether that abort succeeded.
class MultipartUploadOrchestrator {
public:
    MultipartUploadOrchestrator(UploadContext context, const ChunkReader& reader);

    /// Open a new session. Throws InitiationError, before any remote call, if
    /// the file needs more than MAX_PARTS_PER_UPLOAD parts.
    UploadSession initiate();

    /// Rebuild a session from the parts the remote already holds. Parts whose
    /// local tree hash matches are marked done and will not be sent again.
    /// Throws InitiationError or IoError; the session is never aborted here,
    /// so errors carry RemoteState::SessionOpen unless the id is unknown.
    UploadSession resume(const std::string& upload_id);

    /// Send every part not yet recorded as successful. Throws UploadError or
    /// IoError after aborting the session.
    void upload(UploadSession& session);

    /// Combine part digests and complete the session. Throws
    /// ChecksumMismatchError or UploadError after aborting the session.
    ArchiveReceipt finalize(UploadSession& session);

    /// Abort the session. Never throws; returns false and marks the session
    /// Failed if the remote refused.
    bool abort(UploadSession& session);

    /// initiate() + upload() + finalize().
    ArchiveReceipt run();

    /// resume() + upload() + finalize().
    ArchiveReceipt run_resume(const std::string& upload_id);

private:
    // Abort, then stamp the resulting remote state on the exception and throw it.
    template <typename E>
    [[noreturn]] void abort_and_throw(UploadSession& session, E error);

    UploadContext context_;
    const ChunkReader& reader_;
};

/// Part size of an existing session, from the first list_parts page.
/// Throws InitiationError.
uint64_t remote_part_size(const UploadContext& context, const std::string& upload_id);

/// Upload a small file with one upload_archive call. Throws InitiationError
/// for remote rejections and IoError for read failures.
ArchiveReceipt upload_in_single_request(const UploadContext& context,
                                        const std::filesystem::path& path);

} // namespace glacierup
