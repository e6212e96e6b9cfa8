#include "glacierup/vault_client.hpp"
#include "glacierup/glacier_client.hpp"
#include "glacierup/local_vault.hpp"

#include <stdexcept>

namespace glacierup {

const char* remote_error_to_string(RemoteErrorKind kind) {
    switch (kind) {
        case RemoteErrorKind::None: return "none";
        case RemoteErrorKind::NotFound: return "not-found";
        case RemoteErrorKind::AccessDenied: return "access-denied";
        case RemoteErrorKind::InvalidParameter: return "invalid-parameter";
        case RemoteErrorKind::ChecksumMismatch: return "checksum-mismatch";
        case RemoteErrorKind::Transient: return "transient";
        case RemoteErrorKind::Other: return "other";
    }
    return "unknown";
}

const char* job_kind_to_string(JobKind kind) {
    switch (kind) {
        case JobKind::ArchiveRetrieval: return "archive-retrieval";
        case JobKind::InventoryRetrieval: return "inventory-retrieval";
    }
    return "archive-retrieval";
}

const char* job_status_to_string(JobStatusCode code) {
    switch (code) {
        case JobStatusCode::InProgress: return "InProgress";
        case JobStatusCode::Succeeded: return "Succeeded";
        case JobStatusCode::Failed: return "Failed";
    }
    return "InProgress";
}

// ============================================================================
// VaultClientFactory implementation
// ============================================================================

namespace {

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

uint64_t parse_number(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        uint64_t n = std::stoull(value, &pos);
        if (pos == value.size()) return n;
    } catch (const std::exception&) {
        // fall through to the error below
    }
    throw std::invalid_argument("backend parameter '" + key +
                                "' must be a non-negative integer, got '" + value + "'");
}

} // namespace

std::unique_ptr<VaultClient> VaultClientFactory::create(
    const std::string& type,
    const std::map<std::string, std::string>& params) {

    if (type == "local") {
        LocalVaultClient::Config local_config;

        auto it = params.find("path");
        if (it == params.end() || it->second.empty()) {
            throw std::invalid_argument("Local backend requires 'path' config");
        }
        local_config.root = it->second;

        if ((it = params.find("job_delay")) != params.end()) {
            local_config.job_delay = std::chrono::seconds(parse_number(it->first, it->second));
        }
        if ((it = params.find("list_limit")) != params.end()) {
            local_config.list_limit = parse_number(it->first, it->second);
        }
        if ((it = params.find("create_vaults")) != params.end()) {
            local_config.create_vaults = parse_bool(it->second);
        }

        return std::make_unique<LocalVaultClient>(local_config);
    }

    if (type == "glacier") {
        GlacierClient::Config glacier_config;

        auto it = params.find("region");
        if (it != params.end() && !it->second.empty()) glacier_config.region = it->second;
        if ((it = params.find("endpoint")) != params.end()) glacier_config.endpoint = it->second;
        if ((it = params.find("account_id")) != params.end() && !it->second.empty()) {
            glacier_config.account_id = it->second;
        }
        if ((it = params.find("access_key")) != params.end()) glacier_config.access_key = it->second;
        if ((it = params.find("secret_key")) != params.end()) glacier_config.secret_key = it->second;
        if ((it = params.find("session_token")) != params.end()) {
            glacier_config.session_token = it->second;
        }
        if ((it = params.find("verify_ssl")) != params.end()) {
            glacier_config.verify_ssl = parse_bool(it->second);
        }
        if ((it = params.find("ca_bundle")) != params.end()) glacier_config.ca_bundle = it->second;
        if ((it = params.find("connect_timeout")) != params.end()) {
            glacier_config.connect_timeout_secs =
                static_cast<uint32_t>(parse_number(it->first, it->second));
        }
        if ((it = params.find("request_timeout")) != params.end()) {
            glacier_config.request_timeout_secs =
                static_cast<uint32_t>(parse_number(it->first, it->second));
        }
        if ((it = params.find("list_limit")) != params.end()) {
            glacier_config.list_limit = static_cast<uint32_t>(parse_number(it->first, it->second));
        }

        if (glacier_config.access_key.empty() || glacier_config.secret_key.empty()) {
            throw std::invalid_argument(
                "Glacier backend requires 'access_key' and 'secret_key' "
                "(or AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY)");
        }

        return std::make_unique<GlacierClient>(glacier_config);
    }

    throw std::invalid_argument("Unknown vault backend type: " + type);
}

} // namespace glacierup
