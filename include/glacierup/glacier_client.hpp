#pragma once

#include "glacierup/constants.hpp"
#include "glacierup/http.hpp"
#include "glacierup/vault_client.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace glacierup {

/// VaultClient speaking the Glacier REST API (version 2012-06-01) over
/// libcurl, signed with AWS SigV4.
class GlacierClient : public VaultClient {
public:
    struct Config {
        std::string region = constants::DEFAULT_REGION;
        std::string endpoint;    // Empty = https://glacier.<region>.amazonaws.com
        std::string account_id = constants::DEFAULT_ACCOUNT_ID;
        std::string access_key;
        std::string secret_key;
        std::string session_token;
        bool verify_ssl = true;
        std::string ca_bundle;
        uint32_t connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
        uint32_t request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;
        uint32_t list_limit = constants::DEFAULT_LIST_LIMIT;
    };

    explicit GlacierClient(const Config& config);
    ~GlacierClient() override;

    std::string type_name() const override { return "glacier"; }

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

    /// Base URL of a vault, e.g. https://glacier.us-east-1.amazonaws.com/-/vaults/photos
    std::string vault_url(const std::string& vault) const;

    /// Map an HTTP response to a RemoteStatus. Network failures, 408, 429
    /// and 5xx are Transient; the service's JSON error body refines the rest.
    static RemoteStatus classify_response(const net::HttpResponse& response);

private:
    net::HttpRequest make_request(net::HttpMethod method, const std::string& url) const;
    net::HttpResponse send(net::HttpRequest& request) const;

    struct Credentials;

    Config config_;
    std::unique_ptr<Credentials> credentials_;
    std::unique_ptr<net::AwsSigV4Signer> signer_;
    std::unique_ptr<net::HttpClient> http_client_;
};

} // namespace glacierup
