#include "glacierup/progress.hpp"
#include "glacierup/logging.hpp"

namespace glacierup {

void ProgressLogger::on_part_completed(size_t index, const PartOutcome& outcome) {
    if (!outcome.success) {
        log_error("Part %zu failed after %u attempts: %s", index + 1, outcome.attempts,
                  outcome.error.c_str());
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ++done_;
    double pct = total_ ? 100.0 * static_cast<double>(done_) / static_cast<double>(total_) : 100.0;
    log_info("Uploaded part %zu of %zu (%.2f%%)", index + 1, total_, pct);
}

void ProgressLogger::on_part_retry(size_t index, uint32_t attempt, const std::string& reason) {
    log_warn("Part %zu attempt %u failed, will try again: %s", index + 1, attempt, reason.c_str());
}

size_t ProgressLogger::done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
}

} // namespace glacierup
