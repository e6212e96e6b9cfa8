#include "glacierup/local_vault.hpp"
#include "glacierup/constants.hpp"
#include "glacierup/tree_hash.hpp"

#include <nlohmann/json.hpp>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace glacierup {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::string new_id() {
    unsigned char buf[24];
    if (RAND_bytes(buf, sizeof(buf)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    static const char* kHex = "0123456789ABCDEF";
    std::string id;
    id.reserve(sizeof(buf) * 2);
    for (unsigned char b : buf) {
        id += kHex[b >> 4];
        id += kHex[b & 0x0f];
    }
    return id;
}

// Ids are generated above; anything else cannot name a stored object
bool is_safe_id(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

bool is_valid_vault_name(const std::string& name) {
    if (name.empty() || name.size() > 255) return false;
    if (name == "." || name == "..") return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
}

int64_t now_epoch() {
    return static_cast<int64_t>(std::time(nullptr));
}

std::string iso_time(int64_t epoch) {
    std::time_t t = static_cast<std::time_t>(epoch);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S.000Z");
    return oss.str();
}

RemoteStatus fail(RemoteErrorKind kind, const std::string& message) {
    return RemoteStatus::failure(kind, message);
}

// Write to temp file then rename. Returns error string (empty = success).
std::string write_file_atomic(const fs::path& path, std::span<const uint8_t> data) {
    auto temp_path = path.string() + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return "cannot create " + temp_path;
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file) {
            std::error_code rm_ec;
            fs::remove(temp_path, rm_ec);
            return "cannot write " + temp_path;
        }
    }
    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(temp_path, rm_ec);
        return "cannot rename " + temp_path + ": " + ec.message();
    }
    return "";
}

std::string write_json(const fs::path& path, const json& j) {
    std::string text = j.dump(2);
    return write_file_atomic(path, std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::optional<json> read_json(const fs::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    return j;
}

std::optional<std::vector<uint8_t>> read_file_range(const fs::path& path,
                                                    uint64_t offset, uint64_t length) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    file.seekg(static_cast<std::streamoff>(offset));
    std::vector<uint8_t> data(length);
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    if (!file) return std::nullopt;
    return data;
}

std::string csv_field(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

struct StoredPart {
    uint64_t offset;
    uint64_t length;
    std::string tree_hash;
};

std::vector<StoredPart> sorted_parts(const json& meta) {
    std::vector<StoredPart> parts;
    if (auto it = meta.find("parts"); it != meta.end() && it->is_object()) {
        for (const auto& [key, value] : it->items()) {
            parts.push_back({std::stoull(key),
                             value.value("length", uint64_t{0}),
                             value.value("tree_hash", std::string())});
        }
    }
    std::sort(parts.begin(), parts.end(),
              [](const StoredPart& a, const StoredPart& b) { return a.offset < b.offset; });
    return parts;
}

} // namespace

LocalVaultClient::LocalVaultClient(const Config& config)
    : config_(config) {
    if (config_.root.empty()) {
        throw std::invalid_argument("local vault requires a root path");
    }
    config_.root = fs::absolute(config_.root);
    fs::create_directories(config_.root);
    if (config_.list_limit == 0) config_.list_limit = 1;
}

bool LocalVaultClient::create_vault(const std::string& vault) {
    if (!is_valid_vault_name(vault)) {
        throw std::invalid_argument("invalid vault name: " + vault);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return fs::create_directories(vault_dir(vault));
}

fs::path LocalVaultClient::vault_dir(const std::string& vault) const {
    return config_.root / vault;
}

RemoteStatus LocalVaultClient::check_vault(const std::string& vault) {
    if (!is_valid_vault_name(vault)) {
        return fail(RemoteErrorKind::InvalidParameter, "invalid vault name: " + vault);
    }
    auto dir = vault_dir(vault);
    if (fs::is_directory(dir)) {
        return RemoteStatus::success();
    }
    if (config_.create_vaults) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return fail(RemoteErrorKind::Other, "cannot create vault: " + ec.message());
        }
        return RemoteStatus::success();
    }
    return fail(RemoteErrorKind::NotFound, "Vault not found: " + vault);
}

std::string LocalVaultClient::location(const std::string& vault, const std::string& kind,
                                       const std::string& id) const {
    return "/" + std::string(constants::DEFAULT_ACCOUNT_ID) + "/vaults/" + vault +
           "/" + kind + "/" + id;
}

// ============================================================================
// Multipart upload
// ============================================================================

InitiateUploadResult LocalVaultClient::initiate_multipart_upload(
    const std::string& vault, uint64_t part_size, const std::string& description) {
    InitiateUploadResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    if (!is_valid_part_size(part_size)) {
        result.status = fail(RemoteErrorKind::InvalidParameter,
            "Invalid part size: " + std::to_string(part_size) +
            ". Part size must be a power of two between 1MB and 4GB.");
        return result;
    }

    std::string id = new_id();
    auto dir = vault_dir(vault) / "uploads" / id;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        result.status = fail(RemoteErrorKind::Other, "cannot create upload: " + ec.message());
        return result;
    }

    json meta;
    meta["upload_id"] = id;
    meta["description"] = description;
    meta["part_size"] = part_size;
    meta["created"] = now_epoch();
    meta["parts"] = json::object();
    if (auto err = write_json(dir / "meta.json", meta); !err.empty()) {
        result.status = fail(RemoteErrorKind::Other, err);
        return result;
    }

    result.upload_id = id;
    result.location = location(vault, "multipart-uploads", id);
    return result;
}

UploadPartResult LocalVaultClient::upload_part(
    const std::string& vault, const std::string& upload_id,
    const ByteRange& range, std::span<const uint8_t> data,
    const std::string& tree_hash) {
    UploadPartResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    auto dir = vault_dir(vault) / "uploads" / upload_id;
    auto meta = is_safe_id(upload_id) ? read_json(dir / "meta.json") : std::nullopt;
    if (!meta) {
        result.status = fail(RemoteErrorKind::NotFound, "Multipart upload not found: " + upload_id);
        return result;
    }

    uint64_t part_size = meta->value("part_size", uint64_t{0});
    if (range.length == 0 || data.size() != range.length) {
        result.status = fail(RemoteErrorKind::InvalidParameter,
            "Content-Range length " + std::to_string(range.length) +
            " does not match body length " + std::to_string(data.size()));
        return result;
    }
    if (range.offset % part_size != 0 || range.length > part_size) {
        result.status = fail(RemoteErrorKind::InvalidParameter,
            "Content-Range bytes " + std::to_string(range.offset) + "-" +
            std::to_string(range.last()) + " is not aligned to the part size " +
            std::to_string(part_size));
        return result;
    }

    std::string computed = to_hex(PartHasher::digest_of(data));
    if (computed != tree_hash) {
        result.status = fail(RemoteErrorKind::ChecksumMismatch,
            "Checksum mismatch: expected " + tree_hash + " but was " + computed);
        return result;
    }

    std::string offset_key = std::to_string(range.offset);
    if (auto err = write_file_atomic(dir / ("part-" + offset_key), data); !err.empty()) {
        result.status = fail(RemoteErrorKind::Other, err);
        return result;
    }

    (*meta)["parts"][offset_key] = {{"length", range.length}, {"tree_hash", computed}};
    if (auto err = write_json(dir / "meta.json", *meta); !err.empty()) {
        result.status = fail(RemoteErrorKind::Other, err);
        return result;
    }

    result.tree_hash = computed;
    return result;
}

ArchiveResult LocalVaultClient::complete_multipart_upload(
    const std::string& vault, const std::string& upload_id,
    uint64_t archive_size, const std::string& tree_hash) {
    ArchiveResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    auto dir = vault_dir(vault) / "uploads" / upload_id;
    auto meta = is_safe_id(upload_id) ? read_json(dir / "meta.json") : std::nullopt;
    if (!meta) {
        result.status = fail(RemoteErrorKind::NotFound, "Multipart upload not found: " + upload_id);
        return result;
    }

    uint64_t part_size = meta->value("part_size", uint64_t{0});
    auto parts = sorted_parts(*meta);

    // Parts must tile [0, archive_size) with only the last one short
    uint64_t expected = 0;
    for (size_t i = 0; i < parts.size(); ++i) {
        bool last = (i + 1 == parts.size());
        if (parts[i].offset != expected || (!last && parts[i].length != part_size)) {
            result.status = fail(RemoteErrorKind::InvalidParameter,
                "Uploaded parts are not contiguous at byte " + std::to_string(expected));
            return result;
        }
        expected += parts[i].length;
    }
    if (archive_size == 0 || expected != archive_size) {
        result.status = fail(RemoteErrorKind::InvalidParameter,
            "Archive size " + std::to_string(archive_size) +
            " does not match the uploaded bytes " + std::to_string(expected));
        return result;
    }

    std::error_code ec;
    fs::create_directories(vault_dir(vault) / "archives", ec);
    auto assembled = vault_dir(vault) / "archives" / ("assemble-" + upload_id + ".tmp");
    TreeHashAccumulator acc;
    {
        std::ofstream out(assembled, std::ios::binary | std::ios::trunc);
        if (!out) {
            result.status = fail(RemoteErrorKind::Other, "cannot create " + assembled.string());
            return result;
        }
        for (const auto& part : parts) {
            auto bytes = read_file_range(dir / ("part-" + std::to_string(part.offset)),
                                         0, part.length);
            if (!bytes) {
                out.close();
                fs::remove(assembled, ec);
                result.status = fail(RemoteErrorKind::Other,
                    "part at offset " + std::to_string(part.offset) + " is unreadable");
                return result;
            }
            acc.update(*bytes);
            out.write(reinterpret_cast<const char*>(bytes->data()),
                      static_cast<std::streamsize>(bytes->size()));
        }
        if (!out) {
            out.close();
            fs::remove(assembled, ec);
            result.status = fail(RemoteErrorKind::Other, "cannot write " + assembled.string());
            return result;
        }
    }

    std::string computed = to_hex(acc.finish());
    if (computed != tree_hash) {
        fs::remove(assembled, ec);
        result.status = fail(RemoteErrorKind::ChecksumMismatch,
            "Checksum mismatch: expected " + tree_hash + " but was " + computed);
        return result;
    }

    result = store_archive(vault, assembled, archive_size, computed,
                           meta->value("description", std::string()));
    if (result.status.ok()) {
        fs::remove_all(dir, ec);
    }
    return result;
}

RemoteStatus LocalVaultClient::abort_multipart_upload(
    const std::string& vault, const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto status = check_vault(vault);
    if (!status.ok()) return status;

    auto dir = vault_dir(vault) / "uploads" / upload_id;
    if (!is_safe_id(upload_id) || !fs::exists(dir / "meta.json")) {
        return fail(RemoteErrorKind::NotFound, "Multipart upload not found: " + upload_id);
    }
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        return fail(RemoteErrorKind::Other, "cannot remove upload: " + ec.message());
    }
    return RemoteStatus::success();
}

ListUploadsResult LocalVaultClient::list_multipart_uploads(
    const std::string& vault, const std::string& marker) {
    ListUploadsResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    std::vector<std::pair<int64_t, MultipartUploadInfo>> all;
    auto uploads_dir = vault_dir(vault) / "uploads";
    if (fs::is_directory(uploads_dir)) {
        for (const auto& entry : fs::directory_iterator(uploads_dir)) {
            auto meta = read_json(entry.path() / "meta.json");
            if (!meta) continue;
            MultipartUploadInfo info;
            info.upload_id = meta->value("upload_id", std::string());
            info.description = meta->value("description", std::string());
            int64_t created = meta->value("created", int64_t{0});
            info.creation_date = iso_time(created);
            info.part_size = meta->value("part_size", uint64_t{0});
            info.vault_arn = "arn:aws:glacier:local:" + std::string(constants::DEFAULT_ACCOUNT_ID) +
                             ":vaults/" + vault;
            all.emplace_back(created, std::move(info));
        }
    }
    std::sort(all.begin(), all.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first < b.first;
        return a.second.upload_id < b.second.upload_id;
    });

    size_t start = 0;
    if (!marker.empty()) {
        auto it = std::find_if(all.begin(), all.end(),
                               [&](const auto& e) { return e.second.upload_id == marker; });
        if (it == all.end()) {
            result.status = fail(RemoteErrorKind::InvalidParameter, "Invalid marker: " + marker);
            return result;
        }
        start = static_cast<size_t>(it - all.begin());
    }

    size_t end = std::min(all.size(), start + config_.list_limit);
    for (size_t i = start; i < end; ++i) {
        result.uploads.push_back(all[i].second);
    }
    if (end < all.size()) {
        result.marker = all[end].second.upload_id;
    }
    return result;
}

ListPartsResult LocalVaultClient::list_parts(
    const std::string& vault, const std::string& upload_id, const std::string& marker) {
    ListPartsResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    auto dir = vault_dir(vault) / "uploads" / upload_id;
    auto meta = is_safe_id(upload_id) ? read_json(dir / "meta.json") : std::nullopt;
    if (!meta) {
        result.status = fail(RemoteErrorKind::NotFound, "Multipart upload not found: " + upload_id);
        return result;
    }

    result.upload_id = upload_id;
    result.description = meta->value("description", std::string());
    result.part_size = meta->value("part_size", uint64_t{0});

    auto parts = sorted_parts(*meta);
    size_t start = 0;
    if (!marker.empty()) {
        auto it = std::find_if(parts.begin(), parts.end(), [&](const StoredPart& p) {
            return std::to_string(p.offset) == marker;
        });
        if (it == parts.end()) {
            result.status = fail(RemoteErrorKind::InvalidParameter, "Invalid marker: " + marker);
            return result;
        }
        start = static_cast<size_t>(it - parts.begin());
    }

    size_t end = std::min(parts.size(), start + config_.list_limit);
    for (size_t i = start; i < end; ++i) {
        result.parts.push_back({ByteRange{parts[i].offset, parts[i].length}, parts[i].tree_hash});
    }
    if (end < parts.size()) {
        result.marker = std::to_string(parts[end].offset);
    }
    return result;
}

// ============================================================================
// Archives
// ============================================================================

ArchiveResult LocalVaultClient::store_archive(const std::string& vault,
                                              const fs::path& data_file,
                                              uint64_t size, const std::string& tree_hash,
                                              const std::string& description) {
    ArchiveResult result;
    std::string id = new_id();
    auto archives = vault_dir(vault) / "archives";

    std::error_code ec;
    fs::rename(data_file, archives / (id + ".data"), ec);
    if (ec) {
        result.status = fail(RemoteErrorKind::Other, "cannot store archive: " + ec.message());
        fs::remove(data_file, ec);
        return result;
    }

    json meta;
    meta["ArchiveId"] = id;
    meta["ArchiveDescription"] = description;
    meta["CreationDate"] = iso_time(now_epoch());
    meta["Size"] = size;
    meta["SHA256TreeHash"] = tree_hash;
    if (auto err = write_json(archives / (id + ".json"), meta); !err.empty()) {
        fs::remove(archives / (id + ".data"), ec);
        result.status = fail(RemoteErrorKind::Other, err);
        return result;
    }

    result.archive_id = id;
    result.tree_hash = tree_hash;
    result.location = location(vault, "archives", id);
    return result;
}

ArchiveResult LocalVaultClient::upload_archive(
    const std::string& vault, std::span<const uint8_t> data,
    const std::string& tree_hash, const std::string& description) {
    ArchiveResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    std::string computed = to_hex(PartHasher::digest_of(data));
    if (computed != tree_hash) {
        result.status = fail(RemoteErrorKind::ChecksumMismatch,
            "Checksum mismatch: expected " + tree_hash + " but was " + computed);
        return result;
    }

    auto archives = vault_dir(vault) / "archives";
    std::error_code ec;
    fs::create_directories(archives, ec);
    auto staged = archives / ("upload-" + new_id() + ".tmp");
    if (auto err = write_file_atomic(staged, data); !err.empty()) {
        result.status = fail(RemoteErrorKind::Other, err);
        return result;
    }
    return store_archive(vault, staged, data.size(), computed, description);
}

RemoteStatus LocalVaultClient::delete_archive(
    const std::string& vault, const std::string& archive_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto status = check_vault(vault);
    if (!status.ok()) return status;

    auto archives = vault_dir(vault) / "archives";
    if (!is_safe_id(archive_id) || !fs::exists(archives / (archive_id + ".data"))) {
        return fail(RemoteErrorKind::NotFound, "Archive not found: " + archive_id);
    }
    std::error_code ec;
    fs::remove(archives / (archive_id + ".data"), ec);
    fs::remove(archives / (archive_id + ".json"), ec);
    return RemoteStatus::success();
}

// ============================================================================
// Jobs
// ============================================================================

InitiateJobResult LocalVaultClient::initiate_job(
    const std::string& vault, const JobRequest& request) {
    InitiateJobResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    if (!request.tier.empty() && request.tier != "Expedited" &&
        request.tier != "Standard" && request.tier != "Bulk") {
        result.status = fail(RemoteErrorKind::InvalidParameter, "Invalid tier: " + request.tier);
        return result;
    }

    json job;
    std::string id = new_id();
    job["JobId"] = id;
    job["JobDescription"] = request.description;
    job["Tier"] = request.tier.empty() ? "Standard" : request.tier;
    job["created"] = now_epoch();
    job["CreationDate"] = iso_time(now_epoch());
    job["Completed"] = false;
    job["StatusCode"] = "InProgress";
    job["StatusMessage"] = "";

    if (request.kind == JobKind::ArchiveRetrieval) {
        if (request.archive_id.empty()) {
            result.status = fail(RemoteErrorKind::InvalidParameter,
                "Archive retrieval requires an archive id");
            return result;
        }
        auto archive = is_safe_id(request.archive_id)
            ? read_json(vault_dir(vault) / "archives" / (request.archive_id + ".json"))
            : std::nullopt;
        if (!archive) {
            result.status = fail(RemoteErrorKind::NotFound,
                "Archive not found: " + request.archive_id);
            return result;
        }
        job["Action"] = "ArchiveRetrieval";
        job["ArchiveId"] = request.archive_id;
        job["ArchiveSizeInBytes"] = archive->value("Size", uint64_t{0});
        job["SHA256TreeHash"] = archive->value("SHA256TreeHash", std::string());
    } else {
        if (request.inventory_format != "JSON" && request.inventory_format != "CSV") {
            result.status = fail(RemoteErrorKind::InvalidParameter,
                "Invalid inventory format: " + request.inventory_format);
            return result;
        }
        job["Action"] = "InventoryRetrieval";
        job["Format"] = request.inventory_format;
    }

    auto jobs = vault_dir(vault) / "jobs";
    std::error_code ec;
    fs::create_directories(jobs, ec);
    if (auto err = write_json(jobs / (id + ".json"), job); !err.empty()) {
        result.status = fail(RemoteErrorKind::Other, err);
        return result;
    }

    result.job_id = id;
    result.location = location(vault, "jobs", id);
    return result;
}

std::string LocalVaultClient::settle_job(const std::string& vault, const std::string& job_id) {
    auto jobs = vault_dir(vault) / "jobs";
    auto job = read_json(jobs / (job_id + ".json"));
    if (!job) return "job record is unreadable: " + job_id;
    if (job->value("Completed", false)) return "";

    int64_t created = job->value("created", int64_t{0});
    if (now_epoch() - created < config_.job_delay.count()) return "";

    auto archives = vault_dir(vault) / "archives";
    if (job->value("Action", std::string()) == "ArchiveRetrieval") {
        std::string archive_id = job->value("ArchiveId", std::string());
        if (fs::exists(archives / (archive_id + ".data"))) {
            (*job)["StatusCode"] = "Succeeded";
            (*job)["StatusMessage"] = "Succeeded";
        } else {
            (*job)["StatusCode"] = "Failed";
            (*job)["StatusMessage"] = "Archive was deleted before the job completed";
        }
    } else {
        // Snapshot of the archives present right now
        std::vector<json> entries;
        if (fs::is_directory(archives)) {
            for (const auto& entry : fs::directory_iterator(archives)) {
                if (entry.path().extension() != ".json") continue;
                if (auto meta = read_json(entry.path())) entries.push_back(std::move(*meta));
            }
        }
        std::sort(entries.begin(), entries.end(), [](const json& a, const json& b) {
            auto ka = a.value("CreationDate", std::string()) + a.value("ArchiveId", std::string());
            auto kb = b.value("CreationDate", std::string()) + b.value("ArchiveId", std::string());
            return ka < kb;
        });

        std::string output;
        if (job->value("Format", std::string("JSON")) == "CSV") {
            output = "ArchiveId,ArchiveDescription,CreationDate,Size,SHA256TreeHash\n";
            for (const auto& e : entries) {
                output += e.value("ArchiveId", std::string()) + "," +
                          csv_field(e.value("ArchiveDescription", std::string())) + "," +
                          e.value("CreationDate", std::string()) + "," +
                          std::to_string(e.value("Size", uint64_t{0})) + "," +
                          e.value("SHA256TreeHash", std::string()) + "\n";
            }
        } else {
            json inventory;
            inventory["VaultARN"] = "arn:aws:glacier:local:" +
                                    std::string(constants::DEFAULT_ACCOUNT_ID) + ":vaults/" + vault;
            inventory["InventoryDate"] = iso_time(now_epoch());
            inventory["ArchiveList"] = entries;
            output = inventory.dump();
        }

        auto err = write_file_atomic(jobs / (job_id + ".out"), std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(output.data()), output.size()));
        if (err.empty()) {
            (*job)["StatusCode"] = "Succeeded";
            (*job)["StatusMessage"] = "Succeeded";
            (*job)["InventorySizeInBytes"] = output.size();
        } else {
            (*job)["StatusCode"] = "Failed";
            (*job)["StatusMessage"] = err;
        }
    }

    (*job)["Completed"] = true;
    (*job)["CompletionDate"] = iso_time(now_epoch());
    return write_json(jobs / (job_id + ".json"), *job);
}

JobDescription LocalVaultClient::describe_job(
    const std::string& vault, const std::string& job_id) {
    JobDescription result;
    result.job_id = job_id;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    auto path = vault_dir(vault) / "jobs" / (job_id + ".json");
    if (!is_safe_id(job_id) || !fs::exists(path)) {
        result.status = fail(RemoteErrorKind::NotFound, "Job not found: " + job_id);
        return result;
    }
    if (auto err = settle_job(vault, job_id); !err.empty()) {
        result.status = fail(RemoteErrorKind::Other, err);
        return result;
    }

    auto job = read_json(path);
    if (!job) {
        result.status = fail(RemoteErrorKind::Other, "job record is unreadable: " + job_id);
        return result;
    }

    result.kind = job->value("Action", std::string()) == "InventoryRetrieval"
        ? JobKind::InventoryRetrieval : JobKind::ArchiveRetrieval;
    result.completed = job->value("Completed", false);
    std::string code = job->value("StatusCode", std::string("InProgress"));
    result.status_code = code == "Succeeded" ? JobStatusCode::Succeeded
                       : code == "Failed" ? JobStatusCode::Failed
                       : JobStatusCode::InProgress;
    result.status_message = job->value("StatusMessage", std::string());
    result.creation_date = job->value("CreationDate", std::string());
    result.completion_date = job->value("CompletionDate", std::string());
    if (result.kind == JobKind::InventoryRetrieval) {
        result.output_size = job->value("InventorySizeInBytes", uint64_t{0});
    } else {
        result.output_size = job->value("ArchiveSizeInBytes", uint64_t{0});
        result.output_tree_hash = job->value("SHA256TreeHash", std::string());
    }
    return result;
}

JobOutputResult LocalVaultClient::get_job_output(
    const std::string& vault, const std::string& job_id,
    const std::optional<ByteRange>& range) {
    JobOutputResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    result.status = check_vault(vault);
    if (!result.status.ok()) return result;

    auto jobs = vault_dir(vault) / "jobs";
    if (!is_safe_id(job_id) || !fs::exists(jobs / (job_id + ".json"))) {
        result.status = fail(RemoteErrorKind::NotFound, "Job not found: " + job_id);
        return result;
    }
    if (auto err = settle_job(vault, job_id); !err.empty()) {
        result.status = fail(RemoteErrorKind::Other, err);
        return result;
    }
    auto job = read_json(jobs / (job_id + ".json"));
    if (!job) {
        result.status = fail(RemoteErrorKind::Other, "job record is unreadable: " + job_id);
        return result;
    }
    if (!job->value("Completed", false) ||
        job->value("StatusCode", std::string()) != "Succeeded") {
        result.status = fail(RemoteErrorKind::InvalidParameter,
            "The job is not currently available for download: " + job_id);
        return result;
    }

    fs::path source;
    if (job->value("Action", std::string()) == "ArchiveRetrieval") {
        source = vault_dir(vault) / "archives" / (job->value("ArchiveId", std::string()) + ".data");
        result.content_type = "application/octet-stream";
    } else {
        source = jobs / (job_id + ".out");
        result.content_type = job->value("Format", std::string("JSON")) == "CSV"
            ? "text/csv" : "application/json";
    }

    std::error_code ec;
    uint64_t size = fs::file_size(source, ec);
    if (ec) {
        result.status = fail(RemoteErrorKind::NotFound, "Job output is gone: " + job_id);
        return result;
    }

    ByteRange want{0, size};
    if (range) {
        if (range->length == 0 || range->end() > size) {
            result.status = fail(RemoteErrorKind::InvalidParameter,
                "Range bytes=" + std::to_string(range->offset) + "-" +
                std::to_string(range->last()) + " is not satisfiable (size " +
                std::to_string(size) + ")");
            return result;
        }
        want = *range;
    }

    auto data = read_file_range(source, want.offset, want.length);
    if (!data) {
        result.status = fail(RemoteErrorKind::Other, "cannot read job output: " + job_id);
        return result;
    }

    // The service only returns a tree hash for tree-hash-aligned ranges
    bool aligned = want.offset % constants::TREE_HASH_CHUNK_SIZE == 0 &&
                   (want.end() % constants::TREE_HASH_CHUNK_SIZE == 0 || want.end() == size);
    if (aligned) {
        result.tree_hash = to_hex(PartHasher::digest_of(*data));
    }
    result.data = std::move(*data);
    return result;
}

} // namespace glacierup
