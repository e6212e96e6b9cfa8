#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace glacierup {

/// What exists on the remote side after a failure.
enum class RemoteState {
    NotApplicable,   // Retrieval and local-only errors
    NothingCreated,  // Failed before a multipart session was opened
    SessionOpen,     // An existing session was left in place (resume)
    SessionAborted,  // A session was opened, then aborted successfully
    AbortFailed      // A session was opened and could not be aborted
};

const char* remote_state_to_string(RemoteState state);

/// Base of all errors surfaced by the upload and retrieval engines.
class GlacierError : public std::runtime_error {
public:
    GlacierError(const std::string& message,
                 RemoteState state = RemoteState::NotApplicable,
                 std::string resource_id = {})
        : std::runtime_error(message)
        , remote_state_(state)
        , resource_id_(std::move(resource_id)) {}

    RemoteState remote_state() const { return remote_state_; }

    /// Upload id or job id the error refers to (may be empty).
    const std::string& resource_id() const { return resource_id_; }

    /// Message for the operator, including what was left behind remotely.
    std::string describe() const;

    void set_remote_state(RemoteState state) { remote_state_ = state; }

private:
    RemoteState remote_state_;
    std::string resource_id_;
};

/// Setup failure: missing vault or archive, bad credentials, bad parameters.
class InitiationError : public GlacierError {
public:
    explicit InitiationError(const std::string& message,
                             RemoteState state = RemoteState::NothingCreated,
                             std::string resource_id = {})
        : GlacierError(message, state, std::move(resource_id)) {}
};

/// A part exhausted its retries, or the session could not be completed.
class UploadError : public GlacierError {
public:
    UploadError(const std::string& message, size_t parts_failed,
                RemoteState state, std::string upload_id)
        : GlacierError(message, state, std::move(upload_id))
        , parts_failed_(parts_failed) {}

    /// Parts that never reached a successful upload.
    size_t parts_failed() const { return parts_failed_; }

private:
    size_t parts_failed_;
};

/// The remote rejected the final tree hash. Never retried.
class ChecksumMismatchError : public GlacierError {
public:
    ChecksumMismatchError(const std::string& message, RemoteState state,
                          std::string upload_id)
        : GlacierError(message, state, std::move(upload_id)) {}
};

/// Source file could not be read, or was shorter than expected.
class IoError : public GlacierError {
public:
    explicit IoError(const std::string& message,
                     RemoteState state = RemoteState::NothingCreated,
                     std::string upload_id = {})
        : GlacierError(message, state, std::move(upload_id)) {}
};

/// Remote failure while polling a job or streaming its output.
class RetrievalError : public GlacierError {
public:
    explicit RetrievalError(const std::string& message, std::string job_id = {})
        : GlacierError(message, RemoteState::NotApplicable, std::move(job_id)) {}
};

/// Output requested before the job succeeded. The caller may poll again.
class NotReadyError : public RetrievalError {
public:
    using RetrievalError::RetrievalError;
};

/// The job reached its terminal failed state.
class JobFailedError : public RetrievalError {
public:
    using RetrievalError::RetrievalError;
};

} // namespace glacierup
