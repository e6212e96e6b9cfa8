#include "glacierup/glacier_client.hpp"
#include "glacierup/logging.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstring>
#include <stdexcept>

namespace glacierup {

using json = nlohmann::json;

namespace {

// ============================================================================
// SecureString - zeroes its buffer on destruction
// ============================================================================

class SecureString {
public:
    SecureString() = default;
    explicit SecureString(std::string s) : data_(std::move(s)) {}

    SecureString(const SecureString&) = delete;
    SecureString& operator=(const SecureString&) = delete;

    ~SecureString() { secure_clear(); }

    const std::string& str() const { return data_; }
    bool empty() const { return data_.empty(); }

private:
    void secure_clear() {
        if (!data_.empty()) {
            // volatile keeps the compiler from eliding the stores
            volatile char* p = const_cast<volatile char*>(data_.data());
            size_t len = data_.size();
            while (len--) {
                *p++ = 0;
            }
            data_.clear();
            data_.shrink_to_fit();
        }
    }

    std::string data_;
};

void wipe(std::string& s) {
    if (!s.empty()) {
        volatile char* p = const_cast<volatile char*>(s.data());
        size_t len = s.size();
        while (len--) {
            *p++ = 0;
        }
        s.clear();
    }
}

std::string json_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

uint64_t json_u64(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return 0;
    return it->get<uint64_t>();
}

// "0-4194303" -> {0, 4194304}
std::optional<ByteRange> parse_range(const std::string& s) {
    size_t dash = s.find('-');
    if (dash == std::string::npos) return std::nullopt;
    try {
        uint64_t first = std::stoull(s.substr(0, dash));
        uint64_t last = std::stoull(s.substr(dash + 1));
        if (last < first) return std::nullopt;
        return ByteRange{first, last - first + 1};
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

RemoteStatus parse_failure(const net::HttpResponse& response, const char* what) {
    RemoteStatus status = GlacierClient::classify_response(response);
    if (status.ok()) {
        status = RemoteStatus::failure(RemoteErrorKind::Other,
            std::string(what) + ": malformed response");
    }
    return status;
}

} // namespace

struct GlacierClient::Credentials {
    explicit Credentials(std::string token) : session_token(std::move(token)) {}

    SecureString session_token;
};

GlacierClient::GlacierClient(const Config& config)
    : config_(config)
    , credentials_(std::make_unique<Credentials>(config.session_token)) {
    signer_ = std::make_unique<net::AwsSigV4Signer>(
        config_.access_key, config_.secret_key, config_.region, "glacier");

    // The signer holds its own copy; nothing else needs the raw secrets
    wipe(config_.access_key);
    wipe(config_.secret_key);
    wipe(config_.session_token);

    net::HttpClientConfig http_config;
    http_client_ = std::make_unique<net::HttpClient>(http_config);
}

GlacierClient::~GlacierClient() = default;

std::string GlacierClient::vault_url(const std::string& vault) const {
    std::string base = config_.endpoint;
    if (base.empty()) {
        base = "https://glacier." + config_.region + ".amazonaws.com";
    }
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + config_.account_id + "/vaults/" + net::url_encode(vault);
}

RemoteStatus GlacierClient::classify_response(const net::HttpResponse& response) {
    if (response.is_network_error) {
        return RemoteStatus::failure(RemoteErrorKind::Transient,
            "network error: " + response.error);
    }
    if (response.ok()) {
        return RemoteStatus::success();
    }

    std::string code;
    std::string message;
    if (!response.body.empty()) {
        json body = json::parse(response.body.begin(), response.body.end(), nullptr, false);
        if (!body.is_discarded() && body.is_object()) {
            code = json_string(body, "code");
            message = json_string(body, "message");
        }
    }
    if (message.empty()) {
        message = response.error.empty() ? response.body_string() : response.error;
    }

    std::string text = "HTTP " + std::to_string(response.status_code);
    if (!code.empty()) text += " " + code;
    if (!message.empty()) text += ": " + message;

    int status = response.status_code;
    if (net::is_retryable_status(status) ||
        code == "ThrottlingException" || code == "RequestTimeoutException" ||
        code == "ServiceUnavailableException") {
        return RemoteStatus::failure(RemoteErrorKind::Transient, text);
    }
    if (status == 404 || code == "ResourceNotFoundException") {
        return RemoteStatus::failure(RemoteErrorKind::NotFound, text);
    }
    if (status == 401 || status == 403 ||
        code == "AccessDeniedException" || code == "UnrecognizedClientException" ||
        code == "MissingAuthenticationTokenException") {
        return RemoteStatus::failure(RemoteErrorKind::AccessDenied, text);
    }
    if (code == "InvalidParameterValueException" &&
        (message.find("hecksum") != std::string::npos ||
         message.find("tree hash") != std::string::npos)) {
        return RemoteStatus::failure(RemoteErrorKind::ChecksumMismatch, text);
    }
    if (status == 400 || code == "InvalidParameterValueException" ||
        code == "MissingParameterValueException") {
        return RemoteStatus::failure(RemoteErrorKind::InvalidParameter, text);
    }
    return RemoteStatus::failure(RemoteErrorKind::Other, text);
}

net::HttpRequest GlacierClient::make_request(net::HttpMethod method,
                                             const std::string& url) const {
    net::HttpRequest request;
    request.method = method;
    request.url = url;
    request.headers.set("x-amz-glacier-version", constants::GLACIER_API_VERSION);
    request.connect_timeout = std::chrono::seconds(config_.connect_timeout_secs);
    request.total_timeout = std::chrono::seconds(config_.request_timeout_secs);
    request.verify_ssl = config_.verify_ssl;
    request.ca_bundle_path = config_.ca_bundle;
    return request;
}

net::HttpResponse GlacierClient::send(net::HttpRequest& request) const {
    if (!credentials_->session_token.empty()) {
        signer_->sign_with_token(request, credentials_->session_token.str());
    } else {
        signer_->sign(request);
    }
    auto response = http_client_->execute(request);
    log_debug("%s %s -> %d in %lld ms", net::http_method_to_string(request.method),
              request.url.c_str(), response.status_code,
              static_cast<long long>(response.total_time.count()));
    return response;
}

// ============================================================================
// Multipart upload
// ============================================================================

InitiateUploadResult GlacierClient::initiate_multipart_upload(
    const std::string& vault, uint64_t part_size, const std::string& description) {
    InitiateUploadResult result;

    auto request = make_request(net::HttpMethod::POST, vault_url(vault) + "/multipart-uploads");
    request.headers.set("x-amz-part-size", std::to_string(part_size));
    if (!description.empty()) {
        request.headers.set("x-amz-archive-description", description);
    }

    auto response = send(request);
    result.status = classify_response(response);
    if (!result.status.ok()) return result;

    result.upload_id = response.headers.get("x-amz-multipart-upload-id").value_or("");
    result.location = response.headers.get("Location").value_or("");
    if (result.upload_id.empty()) {
        result.status = parse_failure(response, "initiate multipart upload");
    }
    return result;
}

UploadPartResult GlacierClient::upload_part(
    const std::string& vault, const std::string& upload_id,
    const ByteRange& range, std::span<const uint8_t> data,
    const std::string& tree_hash) {
    UploadPartResult result;

    auto request = make_request(net::HttpMethod::PUT,
        vault_url(vault) + "/multipart-uploads/" + net::url_encode(upload_id));
    request.body_view = data;
    request.headers.set_content_type("application/octet-stream");
    request.headers.set("Content-Range", "bytes " + std::to_string(range.offset) + "-" +
                                         std::to_string(range.last()) + "/*");
    request.headers.set("x-amz-sha256-tree-hash", tree_hash);
    request.headers.set("x-amz-content-sha256", net::sha256_hex(data));

    auto response = send(request);
    result.status = classify_response(response);
    if (result.status.ok()) {
        result.tree_hash = response.headers.get("x-amz-sha256-tree-hash").value_or("");
    }
    return result;
}

ArchiveResult GlacierClient::complete_multipart_upload(
    const std::string& vault, const std::string& upload_id,
    uint64_t archive_size, const std::string& tree_hash) {
    ArchiveResult result;

    auto request = make_request(net::HttpMethod::POST,
        vault_url(vault) + "/multipart-uploads/" + net::url_encode(upload_id));
    request.headers.set("x-amz-archive-size", std::to_string(archive_size));
    request.headers.set("x-amz-sha256-tree-hash", tree_hash);

    auto response = send(request);
    result.status = classify_response(response);
    if (!result.status.ok()) return result;

    result.archive_id = response.headers.get("x-amz-archive-id").value_or("");
    result.tree_hash = response.headers.get("x-amz-sha256-tree-hash").value_or("");
    result.location = response.headers.get("Location").value_or("");
    if (result.archive_id.empty()) {
        result.status = parse_failure(response, "complete multipart upload");
    }
    return result;
}

RemoteStatus GlacierClient::abort_multipart_upload(
    const std::string& vault, const std::string& upload_id) {
    auto request = make_request(net::HttpMethod::DELETE,
        vault_url(vault) + "/multipart-uploads/" + net::url_encode(upload_id));
    return classify_response(send(request));
}

ListUploadsResult GlacierClient::list_multipart_uploads(
    const std::string& vault, const std::string& marker) {
    ListUploadsResult result;

    std::string url = vault_url(vault) + "/multipart-uploads?limit=" +
                      std::to_string(config_.list_limit);
    if (!marker.empty()) url += "&marker=" + net::url_encode(marker);

    auto request = make_request(net::HttpMethod::GET, url);
    auto response = send(request);
    result.status = classify_response(response);
    if (!result.status.ok()) return result;

    json body = json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        result.status = parse_failure(response, "list multipart uploads");
        return result;
    }

    result.marker = json_string(body, "Marker");
    if (auto it = body.find("UploadsList"); it != body.end() && it->is_array()) {
        for (const auto& u : *it) {
            MultipartUploadInfo info;
            info.upload_id = json_string(u, "MultipartUploadId");
            info.description = json_string(u, "ArchiveDescription");
            info.creation_date = json_string(u, "CreationDate");
            info.part_size = json_u64(u, "PartSizeInBytes");
            info.vault_arn = json_string(u, "VaultARN");
            result.uploads.push_back(std::move(info));
        }
    }
    return result;
}

ListPartsResult GlacierClient::list_parts(
    const std::string& vault, const std::string& upload_id, const std::string& marker) {
    ListPartsResult result;

    std::string url = vault_url(vault) + "/multipart-uploads/" + net::url_encode(upload_id) +
                      "?limit=" + std::to_string(config_.list_limit);
    if (!marker.empty()) url += "&marker=" + net::url_encode(marker);

    auto request = make_request(net::HttpMethod::GET, url);
    auto response = send(request);
    result.status = classify_response(response);
    if (!result.status.ok()) return result;

    json body = json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        result.status = parse_failure(response, "list parts");
        return result;
    }

    result.upload_id = json_string(body, "MultipartUploadId");
    result.description = json_string(body, "ArchiveDescription");
    result.part_size = json_u64(body, "PartSizeInBytes");
    result.marker = json_string(body, "Marker");
    if (auto it = body.find("Parts"); it != body.end() && it->is_array()) {
        for (const auto& p : *it) {
            auto range = parse_range(json_string(p, "RangeInBytes"));
            if (!range) {
                result.status = RemoteStatus::failure(RemoteErrorKind::Other,
                    "list parts: bad RangeInBytes '" + json_string(p, "RangeInBytes") + "'");
                return result;
            }
            result.parts.push_back({*range, json_string(p, "SHA256TreeHash")});
        }
    }
    return result;
}

// ============================================================================
// Archives
// ============================================================================

ArchiveResult GlacierClient::upload_archive(
    const std::string& vault, std::span<const uint8_t> data,
    const std::string& tree_hash, const std::string& description) {
    ArchiveResult result;

    auto request = make_request(net::HttpMethod::POST, vault_url(vault) + "/archives");
    request.body_view = data;
    request.headers.set_content_type("application/octet-stream");
    request.headers.set("x-amz-sha256-tree-hash", tree_hash);
    request.headers.set("x-amz-content-sha256", net::sha256_hex(data));
    if (!description.empty()) {
        request.headers.set("x-amz-archive-description", description);
    }

    auto response = send(request);
    result.status = classify_response(response);
    if (!result.status.ok()) return result;

    result.archive_id = response.headers.get("x-amz-archive-id").value_or("");
    result.tree_hash = response.headers.get("x-amz-sha256-tree-hash").value_or("");
    result.location = response.headers.get("Location").value_or("");
    if (result.archive_id.empty()) {
        result.status = parse_failure(response, "upload archive");
    }
    return result;
}

RemoteStatus GlacierClient::delete_archive(
    const std::string& vault, const std::string& archive_id) {
    auto request = make_request(net::HttpMethod::DELETE,
        vault_url(vault) + "/archives/" + net::url_encode(archive_id));
    return classify_response(send(request));
}

// ============================================================================
// Jobs
// ============================================================================

InitiateJobResult GlacierClient::initiate_job(
    const std::string& vault, const JobRequest& job) {
    InitiateJobResult result;

    json params;
    params["Type"] = job_kind_to_string(job.kind);
    if (job.kind == JobKind::ArchiveRetrieval) {
        params["ArchiveId"] = job.archive_id;
    } else {
        params["Format"] = job.inventory_format;
    }
    if (!job.description.empty()) params["Description"] = job.description;
    if (!job.tier.empty()) params["Tier"] = job.tier;

    auto request = make_request(net::HttpMethod::POST, vault_url(vault) + "/jobs");
    request.set_json_body(params.dump());

    auto response = send(request);
    result.status = classify_response(response);
    if (!result.status.ok()) return result;

    result.job_id = response.headers.get("x-amz-job-id").value_or("");
    result.location = response.headers.get("Location").value_or("");
    if (result.job_id.empty()) {
        result.status = parse_failure(response, "initiate job");
    }
    return result;
}

JobDescription GlacierClient::describe_job(
    const std::string& vault, const std::string& job_id) {
    JobDescription result;
    result.job_id = job_id;

    auto request = make_request(net::HttpMethod::GET,
        vault_url(vault) + "/jobs/" + net::url_encode(job_id));
    auto response = send(request);
    result.status = classify_response(response);
    if (!result.status.ok()) return result;

    json body = json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        result.status = parse_failure(response, "describe job");
        return result;
    }

    result.kind = json_string(body, "Action") == "InventoryRetrieval"
        ? JobKind::InventoryRetrieval : JobKind::ArchiveRetrieval;
    if (auto it = body.find("Completed"); it != body.end() && it->is_boolean()) {
        result.completed = it->get<bool>();
    }
    std::string code = json_string(body, "StatusCode");
    if (code == "Succeeded") {
        result.status_code = JobStatusCode::Succeeded;
    } else if (code == "Failed") {
        result.status_code = JobStatusCode::Failed;
    } else {
        result.status_code = JobStatusCode::InProgress;
    }
    result.status_message = json_string(body, "StatusMessage");
    result.creation_date = json_string(body, "CreationDate");
    result.completion_date = json_string(body, "CompletionDate");
    if (result.kind == JobKind::InventoryRetrieval) {
        result.output_size = json_u64(body, "InventorySizeInBytes");
    } else {
        result.output_size = json_u64(body, "ArchiveSizeInBytes");
        result.output_tree_hash = json_string(body, "SHA256TreeHash");
    }
    return result;
}

JobOutputResult GlacierClient::get_job_output(
    const std::string& vault, const std::string& job_id,
    const std::optional<ByteRange>& range) {
    JobOutputResult result;

    auto request = make_request(net::HttpMethod::GET,
        vault_url(vault) + "/jobs/" + net::url_encode(job_id) + "/output");
    if (range) {
        request.headers.set("Range", "bytes=" + std::to_string(range->offset) + "-" +
                                     std::to_string(range->last()));
    }

    auto response = send(request);
    result.status = classify_response(response);
    if (!result.status.ok()) return result;

    result.content_type = response.headers.content_type().value_or("application/octet-stream");
    result.tree_hash = response.headers.get("x-amz-sha256-tree-hash").value_or("");
    result.data = std::move(response.body);
    return result;
}

} // namespace glacierup
