#include "glacierup/upload_pool.hpp"
#include "glacierup/errors.hpp"
#include "glacierup/logging.hpp"

#include <algorithm>
#include <numeric>
#include <system_error>
#include <thread>

namespace glacierup {

std::chrono::milliseconds RetryPolicy::backoff_for(uint32_t attempt) const {
    if (attempt == 0 || initial_backoff.count() <= 0) {
        return std::chrono::milliseconds(0);
    }
    auto delay = initial_backoff;
    for (uint32_t i = 1; i < attempt && delay < max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_backoff);
}

// --- ObserverList ---

void ObserverList::add(PartObserver* observer) {
    if (observer) observers_.push_back(observer);
}

void ObserverList::on_part_completed(size_t index, const PartOutcome& outcome) {
    for (auto* o : observers_) o->on_part_completed(index, outcome);
}

void ObserverList::on_part_retry(size_t index, uint32_t attempt, const std::string& reason) {
    for (auto* o : observers_) o->on_part_retry(index, attempt, reason);
}

// --- UploadWorkerPool ---

UploadWorkerPool::UploadWorkerPool(VaultClient& client, const ChunkReader& reader,
                                   RetryPolicy policy, PartObserver* observer,
                                   Sleeper sleeper)
    : client_(client)
    , reader_(reader)
    , policy_(policy)
    , observer_(observer)
    , sleeper_(std::move(sleeper)) {
    if (policy_.max_attempts == 0) policy_.max_attempts = 1;
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

PoolResult UploadWorkerPool::run(const std::string& vault, const std::string& upload_id,
                                 size_t concurrency) {
    std::vector<size_t> all(reader_.part_count());
    std::iota(all.begin(), all.end(), size_t{0});
    return run(vault, upload_id, all, concurrency);
}

PoolResult UploadWorkerPool::run(const std::string& vault, const std::string& upload_id,
                                 const std::vector<size_t>& indices, size_t concurrency) {
    if (concurrency == 0) concurrency = 1;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.assign(indices.begin(), indices.end());
    }
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        results_ = PoolResult{};
    }
    stop_.store(false);

    log_debug("Starting %zu upload workers for %zu parts", concurrency, indices.size());

    std::vector<std::thread> workers;
    workers.reserve(concurrency);
    for (size_t i = 0; i < concurrency; ++i) {
        try {
            workers.emplace_back(&UploadWorkerPool::worker_loop, this, std::cref(vault),
                                 std::cref(upload_id));
        } catch (const std::system_error& e) {
            // Workers already running must be joined; carry on with them
            if (workers.empty()) throw;
            log_warn("Started only %zu of %zu upload workers: %s", workers.size(),
                     concurrency, e.what());
            break;
        }
    }
    for (auto& t : workers) {
        t.join();
    }

    PoolResult result;
    {
        std::lock_guard<std::mutex> lock(results_mutex_);
        result = std::move(results_);
        results_ = PoolResult{};
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        result.never_dispatched = queue_.size();
        queue_.clear();
    }
    result.stopped_early = stop_.load();
    return result;
}

void UploadWorkerPool::worker_loop(const std::string& vault, const std::string& upload_id) {
    while (!stop_.load()) {
        size_t index;
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            if (queue_.empty()) break;
            index = queue_.front();
            queue_.pop_front();
        }

        PartOutcome outcome = upload_one(vault, upload_id, index);

        if (!outcome.success) {
            stop_.store(true);
        }
        {
            std::lock_guard<std::mutex> lock(results_mutex_);
            if (outcome.success) {
                results_.completed[index] = outcome;
            } else {
                if (outcome.io_error) results_.io_failure = true;
                results_.failed[index] = outcome;
            }
        }
        if (observer_) {
            observer_->on_part_completed(index, outcome);
        }
    }
}

PartOutcome UploadWorkerPool::upload_one(const std::string& vault, const std::string& upload_id,
                                         size_t index) {
    // Exceptions must not escape a worker thread; record them as a fatal outcome
    try {
        return attempt_part(vault, upload_id, index);
    } catch (const std::exception& e) {
        PartOutcome outcome;
        outcome.index = index;
        outcome.error = std::string("unexpected error: ") + e.what();
        log_error("Part %zu: %s", index, outcome.error.c_str());
        return outcome;
    }
}

PartOutcome UploadWorkerPool::attempt_part(const std::string& vault, const std::string& upload_id,
                                           size_t index) {
    PartOutcome outcome;
    outcome.index = index;
    outcome.range = reader_.part_range(index);
    auto start = std::chrono::steady_clock::now();

    for (uint32_t attempt = 1; ; ++attempt) {
        outcome.attempts = attempt;

        std::vector<uint8_t> data;
        try {
            data = reader_.read_part(index);
        } catch (const IoError& e) {
            outcome.io_error = true;
            outcome.error = e.what();
            break;
        }

        Digest digest = PartHasher::digest_of(data);
        std::string local_hash = to_hex(digest);
        auto response = client_.upload_part(vault, upload_id, outcome.range, data, local_hash);

        bool retryable = false;
        std::string reason;
        if (response.status.ok()) {
            if (response.tree_hash.empty() || response.tree_hash == local_hash) {
                outcome.success = true;
                outcome.digest = digest;
                outcome.error.clear();
                break;
            }
            reason = "remote tree hash " + response.tree_hash +
                     " differs from local " + local_hash;
            retryable = policy_.retry_digest_mismatch;
        } else {
            reason = response.status.message;
            switch (response.status.kind) {
                case RemoteErrorKind::Transient:
                    retryable = true;
                    break;
                case RemoteErrorKind::ChecksumMismatch:
                    retryable = policy_.retry_digest_mismatch;
                    break;
                default:
                    retryable = false;
                    break;
            }
        }

        outcome.error = reason;
        if (!retryable) {
            log_error("Part %zu failed (%s): %s", index,
                      remote_error_to_string(response.status.kind), reason.c_str());
            break;
        }
        if (attempt >= policy_.max_attempts) {
            outcome.error = "giving up after " + std::to_string(attempt) + " attempts: " + reason;
            log_error("Part %zu: %s", index, outcome.error.c_str());
            break;
        }
        if (stop_.load()) {
            outcome.error = "upload stopped before retry: " + reason;
            break;
        }

        log_debug("Part %zu attempt %u failed, retrying: %s", index, attempt, reason.c_str());
        if (observer_) {
            observer_->on_part_retry(index, attempt, reason);
        }
        sleeper_(policy_.backoff_for(attempt));
    }

    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return outcome;
}

} // namespace glacierup
