#pragma once

#include "glacierup/upload_pool.hpp"

#include <mutex>

namespace glacierup {

/// Logs "Uploaded part i of n (x%)" as parts finish, and each retry.
class ProgressLogger : public PartObserver {
public:
    /// @param total_parts  Parts in the whole session.
    /// @param already_done Parts recovered from a resumed session.
    explicit ProgressLogger(size_t total_parts, size_t already_done = 0)
        : total_(total_parts), done_(already_done) {}

    void on_part_completed(size_t index, const PartOutcome& outcome) override;
    void on_part_retry(size_t index, uint32_t attempt, const std::string& reason) override;

    size_t done() const;

private:
    size_t total_;
    size_t done_;
    mutable std::mutex mutex_;
};

} // namespace glacierup
