#include "glacierup/metrics.hpp"
#include "glacierup/logging.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace glacierup {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& parts_family = prometheus::BuildCounter()
        .Name("glacierup_parts_total")
        .Help("Parts that reached a final outcome")
        .Labels(labels)
        .Register(*registry_);
    parts_success_ = &parts_family.Add({{"result", "success"}});
    parts_failure_ = &parts_family.Add({{"result", "failure"}});

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    part_retries_total_ = &counter_reg("glacierup_part_retries_total", "Part upload retries");
    upload_bytes_total_ = &counter_reg("glacierup_upload_bytes_total", "Bytes of parts uploaded");
    job_polls_total_ = &counter_reg("glacierup_job_polls_total", "Job status requests");
    job_output_bytes_total_ = &counter_reg("glacierup_job_output_bytes_total",
                                           "Bytes of job output downloaded");

    auto& sessions_family = prometheus::BuildCounter()
        .Name("glacierup_sessions_total")
        .Help("Upload sessions finished")
        .Labels(labels)
        .Register(*registry_);
    sessions_success_ = &sessions_family.Add({{"result", "success"}});
    sessions_failure_ = &sessions_family.Add({{"result", "failure"}});

    // --- Gauges ---

    parts_pending_ = &prometheus::BuildGauge()
        .Name("glacierup_parts_pending")
        .Help("Parts of the current session not yet finished")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    part_upload_duration_ = &prometheus::BuildHistogram()
        .Name("glacierup_part_upload_duration_seconds")
        .Help("Time to upload one part, retries included")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    write_file();
}

void MetricsExporter::on_part_completed(size_t /*index*/, const PartOutcome& outcome) {
    if (outcome.success) {
        parts_success_->Increment();
        upload_bytes_total_->Increment(static_cast<double>(outcome.range.length));
        part_upload_duration_->Observe(std::chrono::duration<double>(outcome.elapsed).count());
    } else {
        parts_failure_->Increment();
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (pending_count_ > 0) --pending_count_;
    parts_pending_->Set(static_cast<double>(pending_count_));
}

void MetricsExporter::set_parts_pending(size_t count) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_count_ = count;
    parts_pending_->Set(static_cast<double>(count));
}

void MetricsExporter::on_part_retry(size_t /*index*/, uint32_t /*attempt*/,
                                    const std::string& /*reason*/) {
    part_retries_total_->Increment();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_warn("Failed writing metrics file %s", tmp_path.c_str());
        return;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename metrics file to %s: %s", prom_file_path_.c_str(),
                 ec.message().c_str());
    }
}

} // namespace glacierup
