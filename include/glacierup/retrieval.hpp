#pragma once

#include "glacierup/constants.hpp"
#include "glacierup/tree_hash.hpp"
#include "glacierup/upload_pool.hpp"
#include "glacierup/vault_client.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace glacierup {

/// Snapshot of a retrieval job from one describe_job call.
struct JobStatus {
    std::string job_id;
    JobKind kind = JobKind::ArchiveRetrieval;
    JobStatusCode code = JobStatusCode::InProgress;
    bool completed = false;
    std::string message;
    std::string creation_date;
    std::string completion_date;
    uint64_t output_size = 0;
    std::string output_tree_hash;

    bool succeeded() const { return completed && code == JobStatusCode::Succeeded; }
    bool failed() const { return completed && code == JobStatusCode::Failed; }
};

struct PollPolicy {
    std::chrono::seconds interval{constants::DEFAULT_POLL_INTERVAL_SECONDS};
    std::chrono::seconds timeout{constants::DEFAULT_POLL_TIMEOUT_SECONDS};  // 0 = no limit
};

/// Lazy, forward-only reader over a completed job's output.
///
/// Each next() fetches one ranged segment. Nothing is cached, so the whole
/// output is never held in memory.
class JobOutputStream {
public:
    JobOutputStream(VaultClient& client, std::string vault, JobStatus status,
                    uint64_t segment_size, RetryPolicy retry, Sleeper sleeper);

    /// Next segment, or nullopt once the output is exhausted. Throws
    /// RetrievalError when a segment cannot be fetched.
    std::optional<std::vector<uint8_t>> next();

    bool exhausted() const { return done_; }
    uint64_t total_size() const { return status_.output_size; }
    uint64_t bytes_received() const { return accumulator_.bytes(); }
    const std::string& content_type() const { return content_type_; }
    const std::string& expected_tree_hash() const { return status_.output_tree_hash; }

    /// True once all bytes arrived and their tree hash equals the one the
    /// remote reported. False when no hash was reported.
    bool verified() const;

    /// Tree hash of the bytes received so far.
    std::string received_tree_hash() const { return to_hex(accumulator_.finish()); }

private:
    JobOutputResult fetch(const std::optional<ByteRange>& range);

    VaultClient& client_;
    std::string vault_;
    JobStatus status_;
    uint64_t segment_size_;
    RetryPolicy retry_;
    Sleeper sleeper_;

    uint64_t offset_ = 0;
    bool done_ = false;
    std::string content_type_;
    TreeHashAccumulator accumulator_;
};

/// Starts retrieval jobs and observes them until their output can be read.
class RetrievalJobPoller {
public:
    /// segment_size is rounded down to a multiple of 1MB (minimum 1MB) so
    /// every ranged read stays tree-hash aligned.
    RetrievalJobPoller(VaultClient& client, std::string vault, RetryPolicy retry = {},
                       uint64_t segment_size = constants::DEFAULT_OUTPUT_SEGMENT_SIZE,
                       Sleeper sleeper = {});

    /// Submit a job and return its id. Throws InitiationError.
    std::string initiate(const JobRequest& request);

    /// One describe_job call. Throws RetrievalError.
    JobStatus poll(const std::string& job_id);

    /// Poll at a fixed interval until the job completes (successfully or
    /// not). Throws RetrievalError once the timeout has elapsed.
    JobStatus wait_for_completion(const std::string& job_id, const PollPolicy& policy,
                                  const Sleeper& sleeper = {});

    /// Stream the output of a succeeded job. Throws NotReadyError while the
    /// job is running and JobFailedError if it failed.
    JobOutputStream fetch_output(const std::string& job_id);

    uint64_t segment_size() const { return segment_size_; }

private:
    VaultClient& client_;
    std::string vault_;
    RetryPolicy retry_;
    uint64_t segment_size_;
    Sleeper sleeper_;
};

/// Drain an archive output stream into a new file at `path`.
///
/// The file must not exist. Each segment is passed to `on_segment` after it is
/// written. When the job reports a tree hash the written bytes must match it.
/// On any failure the partial file is removed before the error propagates, so
/// a later attempt can create it again. Returns the number of bytes written.
uint64_t write_job_output(JobOutputStream& stream, const std::filesystem::path& path,
                          const std::function<void(size_t)>& on_segment = {});

} // namespace glacierup
