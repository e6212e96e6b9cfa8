#include "glacierup/multipart_upload.hpp"
#include "glacierup/errors.hpp"
#include "glacierup/logging.hpp"

#include <stdexcept>
#include <thread>

namespace glacierup {

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Pending: return "pending";
        case SessionState::Initiated: return "initiated";
        case SessionState::Uploading: return "uploading";
        case SessionState::Finalized: return "finalized";
        case SessionState::Aborted: return "aborted";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

size_t UploadSession::missing_parts() const {
    size_t missing = 0;
    for (size_t i = 0; i < part_count; ++i) {
        auto it = outcomes.find(i);
        if (it == outcomes.end() || !it->second.success) ++missing;
    }
    return missing;
}

MultipartUploadOrchestrator::MultipartUploadOrchestrator(UploadContext context,
                                                         const ChunkReader& reader)
    : context_(std::move(context))
    , reader_(reader) {
    if (!context_.client) {
        throw std::invalid_argument("UploadContext has no vault client");
    }
    if (context_.retry.max_attempts == 0) context_.retry.max_attempts = 1;
    if (!context_.sleeper) {
        context_.sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

template <typename E>
void MultipartUploadOrchestrator::abort_and_throw(UploadSession& session, E error) {
    bool aborted = abort(session);
    error.set_remote_state(aborted ? RemoteState::SessionAborted : RemoteState::AbortFailed);
    throw error;
}

// ============================================================================
// Session setup
// ============================================================================

UploadSession MultipartUploadOrchestrator::initiate() {
    if (reader_.total_size() == 0) {
        throw InitiationError("Source file is empty: " + reader_.path().string());
    }
    if (reader_.part_count() > constants::MAX_PARTS_PER_UPLOAD) {
        uint64_t needed = min_part_size_for(reader_.total_size());
        throw InitiationError(
            "Source file " + reader_.path().string() + " needs " +
            std::to_string(reader_.part_count()) + " parts of " +
            std::to_string(reader_.part_size()) + " bytes, more than the " +
            std::to_string(constants::MAX_PARTS_PER_UPLOAD) + " allowed" +
            (needed ? "; use a part size of " + std::to_string(needed) + " bytes or more"
                    : "; the file is larger than the largest possible archive"));
    }

    auto result = context_.client->initiate_multipart_upload(
        context_.vault, reader_.part_size(), context_.description);
    if (!result.status.ok()) {
        throw InitiationError("Failed to initiate multipart upload to vault '" +
                              context_.vault + "' (" +
                              remote_error_to_string(result.status.kind) + "): " +
                              result.status.message);
    }

    UploadSession session;
    session.upload_id = result.upload_id;
    session.vault = context_.vault;
    session.part_size = reader_.part_size();
    session.total_size = reader_.total_size();
    session.part_count = reader_.part_count();
    session.state = SessionState::Initiated;

    log_info("Initiated multipart upload %s: %zu parts of %lu bytes (%lu bytes total)",
             session.upload_id.c_str(), session.part_count,
             static_cast<unsigned long>(session.part_size),
             static_cast<unsigned long>(session.total_size));
    return session;
}

UploadSession MultipartUploadOrchestrator::resume(const std::string& upload_id) {
    if (reader_.total_size() == 0) {
        throw InitiationError("Source file is empty: " + reader_.path().string());
    }

    UploadSession session;
    session.upload_id = upload_id;
    session.vault = context_.vault;
    session.part_size = reader_.part_size();
    session.total_size = reader_.total_size();
    session.part_count = reader_.part_count();

    size_t listed = 0;
    size_t reused = 0;
    std::string marker;
    do {
        auto page = context_.client->list_parts(context_.vault, upload_id, marker);
        if (!page.status.ok()) {
            // An unknown id means there is no session to leave behind.
            RemoteState state = page.status.kind == RemoteErrorKind::NotFound
                ? RemoteState::NothingCreated
                : RemoteState::SessionOpen;
            throw InitiationError("Cannot resume upload " + upload_id + " (" +
                                      remote_error_to_string(page.status.kind) + "): " +
                                      page.status.message,
                                  state, upload_id);
        }
        if (page.part_size != reader_.part_size()) {
            throw InitiationError("Upload " + upload_id + " uses part size " +
                                      std::to_string(page.part_size) + " but " +
                                      std::to_string(reader_.part_size()) + " was requested",
                                  RemoteState::SessionOpen, upload_id);
        }

        for (const auto& part : page.parts) {
            ++listed;
            if (part.range.offset % session.part_size != 0) {
                log_warn("Ignoring misaligned remote part at offset %lu",
                         static_cast<unsigned long>(part.range.offset));
                continue;
            }
            size_t index = static_cast<size_t>(part.range.offset / session.part_size);
            if (index >= session.part_count || !(reader_.part_range(index) == part.range)) {
                log_warn("Remote part at offset %lu does not match the local file",
                         static_cast<unsigned long>(part.range.offset));
                continue;
            }

            std::vector<uint8_t> data;
            try {
                data = reader_.read_part(index);
            } catch (const IoError& e) {
                throw IoError(e.what(), RemoteState::SessionOpen, upload_id);
            }
            Digest digest = PartHasher::digest_of(data);
            if (to_hex(digest) != part.tree_hash) {
                log_warn("Part %zu differs from the remote copy and will be sent again", index);
                continue;
            }

            PartOutcome outcome;
            outcome.index = index;
            outcome.range = part.range;
            outcome.digest = digest;
            outcome.success = true;
            session.outcomes[index] = outcome;
            ++reused;
        }
        marker = page.marker;
    } while (!marker.empty());

    session.state = SessionState::Initiated;
    log_info("Resuming upload %s: %zu of %zu parts already uploaded (%zu listed)",
             upload_id.c_str(), reused, session.part_count, listed);
    return session;
}

uint64_t remote_part_size(const UploadContext& context, const std::string& upload_id) {
    if (!context.client) {
        throw std::invalid_argument("UploadContext has no vault client");
    }
    auto page = context.client->list_parts(context.vault, upload_id);
    if (!page.status.ok()) {
        RemoteState state = page.status.kind == RemoteErrorKind::NotFound
            ? RemoteState::NothingCreated
            : RemoteState::SessionOpen;
        throw InitiationError("Cannot resume upload " + upload_id + " (" +
                                  remote_error_to_string(page.status.kind) + "): " +
                                  page.status.message,
                              state, upload_id);
    }
    if (!is_valid_part_size(page.part_size)) {
        throw InitiationError("Upload " + upload_id + " reports unusable part size " +
                                  std::to_string(page.part_size),
                              RemoteState::SessionOpen, upload_id);
    }
    return page.part_size;
}

// ============================================================================
// Part upload
// ============================================================================

void MultipartUploadOrchestrator::upload(UploadSession& session) {
    session.state = SessionState::Uploading;

    std::vector<size_t> pending;
    for (size_t i = 0; i < session.part_count; ++i) {
        auto it = session.outcomes.find(i);
        if (it == session.outcomes.end() || !it->second.success) pending.push_back(i);
    }
    if (pending.empty()) {
        log_debug("Upload %s: no parts left to send", session.upload_id.c_str());
        return;
    }

    UploadWorkerPool pool(*context_.client, reader_, context_.retry,
                          context_.observer, context_.sleeper);
    PoolResult result = pool.run(session.vault, session.upload_id, pending,
                                 context_.concurrency);

    for (auto& [index, outcome] : result.completed) {
        session.outcomes[index] = outcome;
    }
    if (result.ok()) {
        return;
    }

    size_t missing = session.missing_parts();
    std::string first_error;
    if (!result.failed.empty()) {
        const auto& first = result.failed.begin()->second;
        first_error = "part " + std::to_string(first.index) + ": " + first.error;
    }

    if (result.io_failure) {
        abort_and_throw(session, IoError("Failed to read source file " +
                                             reader_.path().string() + " (" + first_error + ")",
                                         RemoteState::NothingCreated, session.upload_id));
    }
    abort_and_throw(session,
                    UploadError("Upload failed with " + std::to_string(missing) +
                                    " parts not uploaded (" + first_error + ")",
                                missing, RemoteState::NothingCreated, session.upload_id));
}

// ============================================================================
// Completion and abort
// ============================================================================

ArchiveReceipt MultipartUploadOrchestrator::finalize(UploadSession& session) {
    size_t missing = session.missing_parts();
    if (missing > 0) {
        abort_and_throw(session,
                        UploadError("Cannot complete upload: " + std::to_string(missing) +
                                        " parts have no successful upload",
                                    missing, RemoteState::NothingCreated, session.upload_id));
    }

    std::vector<Digest> digests;
    digests.reserve(session.part_count);
    for (size_t i = 0; i < session.part_count; ++i) {
        digests.push_back(session.outcomes.at(i).digest);
    }
    std::string local_hash = to_hex(PartHasher::combine(digests));

    ArchiveResult result;
    for (uint32_t attempt = 1; ; ++attempt) {
        result = context_.client->complete_multipart_upload(
            session.vault, session.upload_id, session.total_size, local_hash);
        if (!result.status.transient() || attempt >= context_.retry.max_attempts) {
            break;
        }
        log_warn("Completing upload %s failed, retrying (attempt %u): %s",
                 session.upload_id.c_str(), attempt, result.status.message.c_str());
        context_.sleeper(context_.retry.backoff_for(attempt));
    }

    if (result.status.kind == RemoteErrorKind::ChecksumMismatch) {
        abort_and_throw(session,
                        ChecksumMismatchError("Remote rejected archive tree hash " + local_hash +
                                                  ": " + result.status.message,
                                              RemoteState::NothingCreated, session.upload_id));
    }
    if (!result.status.ok()) {
        abort_and_throw(session,
                        UploadError("Failed to complete upload (" +
                                        std::string(remote_error_to_string(result.status.kind)) +
                                        "): " + result.status.message,
                                    0, RemoteState::NothingCreated, session.upload_id));
    }
    if (!result.tree_hash.empty() && result.tree_hash != local_hash) {
        abort_and_throw(session,
                        ChecksumMismatchError("Remote tree hash " + result.tree_hash +
                                                  " differs from local tree hash " + local_hash,
                                              RemoteState::NothingCreated, session.upload_id));
    }

    session.state = SessionState::Finalized;

    ArchiveReceipt receipt;
    receipt.archive_id = result.archive_id;
    receipt.tree_hash = local_hash;
    receipt.remote_tree_hash = result.tree_hash;
    receipt.location = result.location;
    receipt.size = session.total_size;
    receipt.upload_id = session.upload_id;

    log_info("Completed upload %s: archive %s", session.upload_id.c_str(),
             receipt.archive_id.c_str());
    return receipt;
}

bool MultipartUploadOrchestrator::abort(UploadSession& session) {
    auto status = context_.client->abort_multipart_upload(session.vault, session.upload_id);
    if (status.ok()) {
        session.state = SessionState::Aborted;
        log_info("Aborted multipart upload %s", session.upload_id.c_str());
        return true;
    }
    session.state = SessionState::Failed;
    log_error("Failed to abort multipart upload %s (%s): %s", session.upload_id.c_str(),
              remote_error_to_string(status.kind), status.message.c_str());
    return false;
}

ArchiveReceipt MultipartUploadOrchestrator::run() {
    UploadSession session = initiate();
    upload(session);
    return finalize(session);
}

ArchiveReceipt MultipartUploadOrchestrator::run_resume(const std::string& upload_id) {
    UploadSession session = resume(upload_id);
    upload(session);
    return finalize(session);
}

// ============================================================================
// Single-request upload
// ============================================================================

ArchiveReceipt upload_in_single_request(const UploadContext& context,
                                        const std::filesystem::path& path) {
    if (!context.client) {
        throw std::invalid_argument("UploadContext has no vault client");
    }

    ChunkReader reader(path, constants::MAX_PART_SIZE);
    if (reader.total_size() == 0) {
        throw InitiationError("Source file is empty: " + path.string());
    }
    auto data = reader.read_range({0, reader.total_size()});
    std::string local_hash = to_hex(PartHasher::digest_of(data));

    uint32_t max_attempts = context.retry.max_attempts ? context.retry.max_attempts : 1;
    ArchiveResult result;
    for (uint32_t attempt = 1; ; ++attempt) {
        result = context.client->upload_archive(context.vault, data, local_hash,
                                                context.description);
        if (!result.status.transient() || attempt >= max_attempts) {
            break;
        }
        log_warn("Archive upload failed, retrying (attempt %u): %s", attempt,
                 result.status.message.c_str());
        auto delay = context.retry.backoff_for(attempt);
        if (context.sleeper) {
            context.sleeper(delay);
        } else {
            std::this_thread::sleep_for(delay);
        }
    }

    if (!result.status.ok()) {
        throw InitiationError("Failed to upload archive to vault '" + context.vault + "' (" +
                              remote_error_to_string(result.status.kind) + "): " +
                              result.status.message);
    }
    if (!result.tree_hash.empty() && result.tree_hash != local_hash) {
        throw ChecksumMismatchError("Remote tree hash " + result.tree_hash +
                                        " differs from local tree hash " + local_hash,
                                    RemoteState::NotApplicable, result.archive_id);
    }

    ArchiveReceipt receipt;
    receipt.archive_id = result.archive_id;
    receipt.tree_hash = local_hash;
    receipt.remote_tree_hash = result.tree_hash;
    receipt.location = result.location;
    receipt.size = reader.total_size();

    log_info("Uploaded %s in a single request: archive %s", path.string().c_str(),
             receipt.archive_id.c_str());
    return receipt;
}

} // namespace glacierup
