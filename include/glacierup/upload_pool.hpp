#pragma once

#include "glacierup/chunk_reader.hpp"
#include "glacierup/constants.hpp"
#include "glacierup/tree_hash.hpp"
#include "glacierup/vault_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace glacierup {

/// Bounded retry with exponential backoff for one part.
struct RetryPolicy {
    uint32_t max_attempts = constants::DEFAULT_MAX_ATTEMPTS;
    std::chrono::milliseconds initial_backoff{constants::DEFAULT_INITIAL_BACKOFF_MS};
    std::chrono::milliseconds max_backoff{constants::DEFAULT_MAX_BACKOFF_MS};

    // Treat a remote per-part checksum disagreement as transient (the bytes
    // are re-read and re-sent) rather than failing the part at once.
    bool retry_digest_mismatch = true;

    /// Delay after failed attempt number `attempt` (1-based).
    std::chrono::milliseconds backoff_for(uint32_t attempt) const;
};

/// Final result for one part.
struct PartOutcome {
    size_t index = 0;
    ByteRange range;
    Digest digest{};
    uint32_t attempts = 0;      // 0 for parts recovered from a resumed session
    bool success = false;
    bool io_error = false;      // Source read failed; never retried
    std::string error;
    std::chrono::milliseconds elapsed{0};
};

/// Receives per-part progress from worker threads. Must be thread-safe.
class PartObserver {
public:
    virtual ~PartObserver() = default;

    /// Called exactly once per part that reaches a final outcome.
    virtual void on_part_completed(size_t index, const PartOutcome& outcome) = 0;

    /// Called before each retry of a part.
    virtual void on_part_retry(size_t /*index*/, uint32_t /*attempt*/,
                               const std::string& /*reason*/) {}
};

/// Fans events out to several observers (not owned).
class ObserverList : public PartObserver {
public:
    void add(PartObserver* observer);
    bool empty() const { return observers_.empty(); }

    void on_part_completed(size_t index, const PartOutcome& outcome) override;
    void on_part_retry(size_t index, uint32_t attempt, const std::string& reason) override;

private:
    std::vector<PartObserver*> observers_;
};

struct PoolResult {
    std::map<size_t, PartOutcome> completed;   // Successful parts, by index
    std::map<size_t, PartOutcome> failed;      // Parts that exhausted or hit a fatal error
    size_t never_dispatched = 0;               // Left in the queue after a stop
    bool stopped_early = false;
    bool io_failure = false;                   // A failure was a source read error

    bool ok() const { return failed.empty() && never_dispatched == 0; }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Fixed set of worker threads draining a shared FIFO of part indices.
///
/// Each worker reads its part with ChunkReader, hashes it and sends it with
/// VaultClient::upload_part, retrying transient failures under the policy.
/// The first permanent failure raises the stop flag: nothing new is dequeued
/// and no further retries start, but attempts already on the wire finish.
class UploadWorkerPool {
public:
    UploadWorkerPool(VaultClient& client, const ChunkReader& reader,
                     RetryPolicy policy, PartObserver* observer = nullptr,
                     Sleeper sleeper = {});

    UploadWorkerPool(const UploadWorkerPool&) = delete;
    UploadWorkerPool& operator=(const UploadWorkerPool&) = delete;

    /// Upload the given indices with exactly `concurrency` threads. Returns
    /// after every worker has joined.
    PoolResult run(const std::string& vault, const std::string& upload_id,
                   const std::vector<size_t>& indices, size_t concurrency);

    /// Upload every part of the reader.
    PoolResult run(const std::string& vault, const std::string& upload_id,
                   size_t concurrency);

private:
    void worker_loop(const std::string& vault, const std::string& upload_id);
    PartOutcome upload_one(const std::string& vault, const std::string& upload_id,
                           size_t index);
    PartOutcome attempt_part(const std::string& vault, const std::string& upload_id,
                             size_t index);

    VaultClient& client_;
    const ChunkReader& reader_;
    RetryPolicy policy_;
    PartObserver* observer_;
    Sleeper sleeper_;

    std::mutex queue_mutex_;
    std::deque<size_t> queue_;

    std::mutex results_mutex_;
    PoolResult results_;

    std::atomic<bool> stop_{false};
};

} // namespace glacierup
