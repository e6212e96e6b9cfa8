#pragma once

#include "glacierup/upload_pool.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace glacierup {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports upload and retrieval metrics to a Prometheus textfile for
/// node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. Also observes the upload pool, so it can be handed to an
/// UploadContext directly.
class MetricsExporter : public PartObserver {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter() override;

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    // PartObserver
    void on_part_completed(size_t index, const PartOutcome& outcome) override;
    void on_part_retry(size_t index, uint32_t attempt, const std::string& reason) override;

    void set_parts_pending(size_t count);

    // --- Counter accessors ---
    prometheus::Counter& parts_success() { return *parts_success_; }
    prometheus::Counter& parts_failure() { return *parts_failure_; }
    prometheus::Counter& part_retries_total() { return *part_retries_total_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& sessions_success() { return *sessions_success_; }
    prometheus::Counter& sessions_failure() { return *sessions_failure_; }
    prometheus::Counter& job_polls_total() { return *job_polls_total_; }
    prometheus::Counter& job_output_bytes_total() { return *job_output_bytes_total_; }

    // --- Gauge accessors ---
    prometheus::Gauge& parts_pending() { return *parts_pending_; }

    // --- Histogram accessors ---
    prometheus::Histogram& part_upload_duration() { return *part_upload_duration_; }

private:
    void writer_loop();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // --- Counters ---
    prometheus::Counter* parts_success_;
    prometheus::Counter* parts_failure_;
    prometheus::Counter* part_retries_total_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* sessions_success_;
    prometheus::Counter* sessions_failure_;
    prometheus::Counter* job_polls_total_;
    prometheus::Counter* job_output_bytes_total_;

    // --- Gauges ---
    prometheus::Gauge* parts_pending_;
    std::mutex pending_mutex_;
    size_t pending_count_ = 0;   // Guarded by pending_mutex_; mirrored into the gauge

    // --- Histograms ---
    prometheus::Histogram* part_upload_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

} // namespace glacierup
