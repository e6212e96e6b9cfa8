#include "glacierup/chunk_reader.hpp"
#include "glacierup/config.hpp"
#include "glacierup/errors.hpp"
#include "glacierup/logging.hpp"
#include "glacierup/metrics.hpp"
#include "glacierup/multipart_upload.hpp"
#include "glacierup/progress.hpp"
#include "glacierup/retrieval.hpp"
#include "glacierup/vault_client.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <unistd.h>

using namespace glacierup;
using json = nlohmann::json;

namespace {

int report_failure(const char* what, const RemoteStatus& status) {
    log_error("%s failed (%s): %s", what, remote_error_to_string(status.kind),
              status.message.c_str());
    return 1;
}

RetryPolicy retry_policy_from(const AppConfig& config) {
    RetryPolicy policy;
    policy.max_attempts = config.max_retries;
    policy.retry_digest_mismatch = !config.fail_on_digest_mismatch;
    return policy;
}

void print_receipt(const ArchiveReceipt& receipt) {
    std::cout << "Local tree hash:  " << receipt.tree_hash << "\n"
              << "Remote tree hash: "
              << (receipt.remote_tree_hash.empty() ? "(not reported)" : receipt.remote_tree_hash)
              << "\n"
              << "Location:         " << receipt.location << "\n"
              << "Archive ID:       " << receipt.archive_id << std::endl;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_upload(const AppConfig& config, VaultClient& client, MetricsExporter* metrics) {
    ObserverList observers;
    if (metrics) observers.add(metrics);

    UploadContext context;
    context.client = &client;
    context.vault = config.vault;
    context.description = config.description;
    context.concurrency = config.upload_threads;
    context.retry = retry_policy_from(config);
    context.observer = &observers;

    std::error_code ec;
    uint64_t size = std::filesystem::file_size(config.file, ec);
    if (ec) {
        throw IoError("Cannot stat " + config.file.string() + ": " + ec.message());
    }

    ArchiveReceipt receipt;
    if (config.upload_id.empty() && !config.force_multipart && size > 0 &&
        size <= config.single_request_threshold) {
        log_info("Uploading %s (%lu bytes) in a single request", config.file.c_str(),
                 static_cast<unsigned long>(size));
        receipt = upload_in_single_request(context, config.file);
        if (metrics) metrics->upload_bytes_total().Increment(static_cast<double>(size));
    } else {
        uint64_t part_size = config.part_size_bytes();
        if (!config.upload_id.empty()) {
            uint64_t remote = remote_part_size(context, config.upload_id);
            if (remote != part_size) {
                log_info("Upload %s uses part size %lu; ignoring --part-size",
                         config.upload_id.c_str(), static_cast<unsigned long>(remote));
            }
            part_size = remote;
        }
        ChunkReader reader(config.file, part_size);
        MultipartUploadOrchestrator orchestrator(context, reader);

        UploadSession session = config.upload_id.empty()
            ? orchestrator.initiate()
            : orchestrator.resume(config.upload_id);

        ProgressLogger progress(session.part_count, session.outcomes.size());
        observers.add(&progress);
        if (metrics) metrics->set_parts_pending(session.part_count - session.outcomes.size());

        orchestrator.upload(session);
        receipt = orchestrator.finalize(session);
    }

    print_receipt(receipt);
    return 0;
}

int cmd_list_uploads(const AppConfig& config, VaultClient& client) {
    json uploads = json::array();
    std::string marker;
    do {
        auto page = client.list_multipart_uploads(config.vault, marker);
        if (!page.status.ok()) return report_failure("list-uploads", page.status);
        for (const auto& u : page.uploads) {
            uploads.push_back({
                {"MultipartUploadId", u.upload_id},
                {"ArchiveDescription", u.description},
                {"CreationDate", u.creation_date},
                {"PartSizeInBytes", u.part_size},
                {"VaultARN", u.vault_arn},
            });
        }
        marker = page.marker;
    } while (!marker.empty());

    std::cout << uploads.dump(2) << std::endl;
    return 0;
}

int cmd_list_parts(const AppConfig& config, VaultClient& client) {
    json result;
    json parts = json::array();
    std::string marker;
    do {
        auto page = client.list_parts(config.vault, config.upload_id, marker);
        if (!page.status.ok()) return report_failure("list-parts", page.status);
        result["MultipartUploadId"] = page.upload_id;
        result["ArchiveDescription"] = page.description;
        result["PartSizeInBytes"] = page.part_size;
        for (const auto& p : page.parts) {
            parts.push_back({
                {"RangeInBytes", std::to_string(p.range.offset) + "-" +
                                 std::to_string(p.range.last())},
                {"SHA256TreeHash", p.tree_hash},
            });
        }
        marker = page.marker;
    } while (!marker.empty());

    result["Parts"] = parts;
    std::cout << result.dump(2) << std::endl;
    return 0;
}

int cmd_init_retrieval(const AppConfig& config, VaultClient& client, JobKind kind) {
    RetrievalJobPoller poller(client, config.vault, retry_policy_from(config));

    JobRequest request;
    request.kind = kind;
    request.archive_id = config.archive_id;
    request.description = config.description;
    request.tier = config.tier;
    request.inventory_format = config.inventory_format;

    std::cout << "Job ID: " << poller.initiate(request) << std::endl;
    return 0;
}

json job_status_json(const JobStatus& status) {
    json j = {
        {"JobId", status.job_id},
        {"Action", status.kind == JobKind::ArchiveRetrieval ? "ArchiveRetrieval"
                                                            : "InventoryRetrieval"},
        {"Completed", status.completed},
        {"StatusCode", job_status_to_string(status.code)},
        {"CreationDate", status.creation_date},
    };
    if (!status.message.empty()) j["StatusMessage"] = status.message;
    if (!status.completion_date.empty()) j["CompletionDate"] = status.completion_date;
    if (status.output_size > 0) j["OutputSizeInBytes"] = status.output_size;
    if (!status.output_tree_hash.empty()) j["SHA256TreeHash"] = status.output_tree_hash;
    return j;
}

int cmd_describe_job(const AppConfig& config, VaultClient& client, MetricsExporter* metrics) {
    RetrievalJobPoller poller(client, config.vault, retry_policy_from(config));
    auto status = poller.poll(config.job_id);
    if (metrics) metrics->job_polls_total().Increment();
    std::cout << job_status_json(status).dump(2) << std::endl;
    return 0;
}

int cmd_get_job_output(const AppConfig& config, VaultClient& client, MetricsExporter* metrics) {
    RetrievalJobPoller poller(client, config.vault, retry_policy_from(config),
                              config.segment_size_bytes());

    log_info("Checking job status...");
    auto status = poller.poll(config.job_id);
    if (metrics) metrics->job_polls_total().Increment();
    log_info("Job status: %s", job_status_to_string(status.code));

    if (!status.completed) {
        if (!config.wait) {
            log_info("Exiting.");
            return 0;
        }
        PollPolicy policy;
        policy.interval = std::chrono::seconds(config.poll_interval_secs);
        policy.timeout = std::chrono::seconds(config.poll_timeout_secs);
        status = poller.wait_for_completion(config.job_id, policy);
        log_info("Job status: %s", job_status_to_string(status.code));
    }

    log_info("Retrieving job data...");
    auto stream = poller.fetch_output(config.job_id);

    if (status.kind == JobKind::ArchiveRetrieval) {
        uint64_t written = write_job_output(stream, config.output_file, [&](size_t n) {
            if (metrics) metrics->job_output_bytes_total().Increment(static_cast<double>(n));
        });
        log_info("Wrote %lu bytes to %s", static_cast<unsigned long>(written),
                 config.output_file.c_str());
        return 0;
    }

    // Inventory: JSON is pretty-printed, CSV is printed as-is
    std::string body;
    while (auto segment = stream.next()) {
        body.append(segment->begin(), segment->end());
        if (metrics) metrics->job_output_bytes_total().Increment(static_cast<double>(segment->size()));
    }
    if (stream.content_type() == "application/json") {
        std::cout << json::parse(body).dump(2) << std::endl;
    } else {
        std::cout << body << std::flush;
    }
    return 0;
}

int cmd_abort_upload(const AppConfig& config, VaultClient& client) {
    auto status = client.abort_multipart_upload(config.vault, config.upload_id);
    if (!status.ok()) return report_failure("abort-upload", status);
    log_info("Aborted multipart upload %s", config.upload_id.c_str());
    return 0;
}

int cmd_delete_archive(const AppConfig& config, VaultClient& client) {
    auto status = client.delete_archive(config.vault, config.archive_id);
    if (!status.ok()) return report_failure("delete-archive", status);
    log_info("Deleted archive %s", config.archive_id.c_str());
    return 0;
}

int dispatch(const AppConfig& config, VaultClient& client, MetricsExporter* metrics) {
    const auto& cmd = config.command;
    if (cmd == "upload") {
        int rc = 1;
        try {
            rc = cmd_upload(config, client, metrics);
        } catch (const std::exception&) {
            if (metrics) metrics->sessions_failure().Increment();
            throw;
        }
        if (metrics) metrics->sessions_success().Increment();
        return rc;
    }
    if (cmd == "list-uploads") return cmd_list_uploads(config, client);
    if (cmd == "list-parts") return cmd_list_parts(config, client);
    if (cmd == "init-archive-retrieval")
        return cmd_init_retrieval(config, client, JobKind::ArchiveRetrieval);
    if (cmd == "init-inventory-retrieval")
        return cmd_init_retrieval(config, client, JobKind::InventoryRetrieval);
    if (cmd == "describe-job") return cmd_describe_job(config, client, metrics);
    if (cmd == "get-job-output") return cmd_get_job_output(config, client, metrics);
    if (cmd == "abort-upload") return cmd_abort_upload(config, client);
    if (cmd == "delete-archive") return cmd_delete_archive(config, client);

    log_error("Unknown command: %s", cmd.c_str());
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config_opt = AppConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (!log) {
            std::cerr << "Cannot open log file " << config.log_file << ": "
                      << strerror(errno) << "\n";
            return 1;
        }
        dup2(fileno(log), STDOUT_FILENO);
        dup2(fileno(log), STDERR_FILENO);
        fclose(log);
    }

    set_verbose(config.verbose);
    for (const auto& line : config.describe()) {
        log_debug("  %s", line.c_str());
    }

    try {
        auto client = VaultClientFactory::create(config.backend.type, config.backend.params);

        std::unique_ptr<MetricsExporter> metrics;
        if (!config.metrics_file.empty()) {
            metrics = std::make_unique<MetricsExporter>(
                config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
                std::map<std::string, std::string>{{"vault", config.vault}});
            metrics->start();
        }

        int rc = dispatch(config, *client, metrics.get());
        if (metrics) metrics->stop();
        return rc;
    } catch (const GlacierError& e) {
        log_error("%s", e.describe().c_str());
        return 1;
    } catch (const std::exception& e) {
        log_error("%s", e.what());
        return 1;
    }
}
