#pragma once

#include "glacierup/vault_client.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

namespace glacierup {

/// Filesystem-backed vault that enforces the service's rules.
///
/// Layout under the root directory:
///   <vault>/archives/<id>.data, <id>.json
///   <vault>/uploads/<id>/meta.json, part-<offset>
///   <vault>/jobs/<id>.json, <id>.out (inventory output)
///
/// A vault exists when its directory exists. Jobs complete `job_delay` after
/// initiation; an archive retrieval fails if its archive is gone by then.
class LocalVaultClient : public VaultClient {
public:
    struct Config {
        std::filesystem::path root;
        std::chrono::seconds job_delay{0};
        size_t list_limit = 1000;
        bool create_vaults = false;  // Create missing vault directories on first use
    };

    explicit LocalVaultClient(const Config& config);

    std::string type_name() const override { return "local"; }

    /// Create an empty vault. Returns false if it already existed.
    bool create_vault(const std::string& vault);

    InitiateUploadResult initiate_multipart_upload(
        const std::string& vault, uint64_t part_size,
        const std::string& description) override;

    UploadPartResult upload_part(
        const std::string& vault, const std::string& upload_id,
        const ByteRange& range, std::span<const uint8_t> data,
        const std::string& tree_hash) override;

    ArchiveResult complete_multipart_upload(
        const std::string& vault, const std::string& upload_id,
        uint64_t archive_size, const std::string& tree_hash) override;

    RemoteStatus abort_multipart_upload(
        const std::string& vault, const std::string& upload_id) override;

    ListUploadsResult list_multipart_uploads(
        const std::string& vault, const std::string& marker = {}) override;

    ListPartsResult list_parts(
        const std::string& vault, const std::string& upload_id,
        const std::string& marker = {}) override;

    ArchiveResult upload_archive(
        const std::string& vault, std::span<const uint8_t> data,
        const std::string& tree_hash, const std::string& description) override;

    RemoteStatus delete_archive(
        const std::string& vault, const std::string& archive_id) override;

    InitiateJobResult initiate_job(
        const std::string& vault, const JobRequest& request) override;

    JobDescription describe_job(
        const std::string& vault, const std::string& job_id) override;

    JobOutputResult get_job_output(
        const std::string& vault, const std::string& job_id,
        const std::optional<ByteRange>& range = std::nullopt) override;

private:
    std::filesystem::path vault_dir(const std::string& vault) const;
    RemoteStatus check_vault(const std::string& vault);
    std::string location(const std::string& vault, const std::string& kind,
                         const std::string& id) const;

    // Moves a job to its terminal state once its delay has elapsed.
    // Caller holds mutex_. Returns error string (empty = success).
    std::string settle_job(const std::string& vault, const std::string& job_id);

    ArchiveResult store_archive(const std::string& vault,
                                const std::filesystem::path& data_file,
                                uint64_t size, const std::string& tree_hash,
                                const std::string& description);

    Config config_;
    std::mutex mutex_;
};

} // namespace glacierup
