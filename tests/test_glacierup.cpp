// Test suite for glacier-upload.
//
// Tests:
//   1. Tree hash known answers and composition
//   2. ChunkReader partitioning and short-read detection
//   3. LocalVaultClient service rules
//   4. UploadWorkerPool retry, exhaustion and stop behaviour
//   5. MultipartUploadOrchestrator end to end against a local vault
//      - Part counts, out-of-order completion, transient retries
//      - Exhausted retries, checksum mismatch, digest-mismatch policy
//      - Source I/O failure, resume
//   6. RetrievalJobPoller: not ready, failed job, segmented output, inventory
//   7. AppConfig CLI parsing, JSON loading, validation
//   8. MetricsExporter textfile output
//   9. Glacier HTTP plumbing: error classification, SigV4, URLs

#include "glacierup/chunk_reader.hpp"
#include "glacierup/config.hpp"
#include "glacierup/errors.hpp"
#include "glacierup/glacier_client.hpp"
#include "glacierup/http.hpp"
#include "glacierup/local_vault.hpp"
#include "glacierup/logging.hpp"
#include "glacierup/metrics.hpp"
#include "glacierup/multipart_upload.hpp"
#include "glacierup/progress.hpp"
#include "glacierup/retrieval.hpp"
#include "glacierup/tree_hash.hpp"
#include "glacierup/upload_pool.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace glacierup;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

constexpr uint64_t MiB = 1024 * 1024;
constexpr const char* VAULT = "test-vault";

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Deterministic pseudo-random bytes.
static std::vector<uint8_t> make_bytes(uint64_t size, uint32_t seed = 1) {
    std::vector<uint8_t> out(size);
    uint32_t x = seed * 2654435761u + 1;
    for (auto& b : out) {
        x = x * 1664525u + 1013904223u;
        b = static_cast<uint8_t>(x >> 24);
    }
    return out;
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::vector<uint8_t>& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(reinterpret_cast<const char*>(content.data()),
              static_cast<std::streamsize>(content.size()));
}

/// Write text content to a file.
static void write_text(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::trunc);
    ofs << content;
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

static Digest digest_of(const std::string& s) {
    return PartHasher::sha256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(s.data()), s.size()));
}

static Digest hash_pair(const Digest& a, const Digest& b) {
    std::vector<uint8_t> buf(a.begin(), a.end());
    buf.insert(buf.end(), b.begin(), b.end());
    return PartHasher::sha256(buf);
}

static void no_sleep(std::chrono::milliseconds) {}

static LocalVaultClient::Config local_config(const fs::path& root,
                                             std::chrono::seconds job_delay = std::chrono::seconds(0)) {
    LocalVaultClient::Config config;
    config.root = root;
    config.job_delay = job_delay;
    return config;
}

/// Number of in-progress multipart uploads in the vault.
static size_t count_uploads(VaultClient& client) {
    auto result = client.list_multipart_uploads(VAULT);
    return result.uploads.size();
}

/// Argument vector for AppConfig::from_args.
struct Args {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    Args(std::initializer_list<std::string> args) : storage(args) {
        for (auto& s : storage) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char** argv() { return ptrs.data(); }
};

/// Wraps a LocalVaultClient and injects failures into upload_part.
class FlakyVaultClient : public VaultClient {
public:
    explicit FlakyVaultClient(VaultClient& inner) : inner_(inner) {}

    // Part index -> number of leading attempts that fail
    std::map<size_t, int> transient_failures;
    std::map<size_t, int> corrupt_failures;   // Bytes altered before forwarding
    std::set<size_t> always_transient;
    std::set<size_t> fatal_parts;

    // Sleep before forwarding part i by (part_count - i) * step
    std::chrono::milliseconds reverse_step{0};
    size_t part_count = 0;
    uint64_t part_size = MiB;

    bool wrong_final_hash = false;
    bool fail_abort = false;

    // Sleep before forwarding every part
    std::chrono::milliseconds per_call_delay{0};

    // list_parts answers with this failure when set
    std::optional<RemoteErrorKind> list_parts_failure;

    // get_job_output call number (1-based) answered with a denial; 0 for none
    int failing_output_call = 0;

    std::atomic<int> abort_calls{0};
    std::atomic<int> complete_calls{0};

    int attempts_for(size_t index) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = attempts_.find(index);
        return it == attempts_.end() ? 0 : it->second;
    }

    std::vector<size_t> completion_order() {
        std::lock_guard<std::mutex> lock(mutex_);
        return completed_;
    }

    // Successful parts per worker thread
    std::map<std::thread::id, size_t> parts_by_thread() {
        std::lock_guard<std::mutex> lock(mutex_);
        return by_thread_;
    }

    size_t upload_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (auto& [i, c] : attempts_) n += static_cast<size_t>(c);
        return n;
    }

    std::string type_name() const override { return "flaky"; }

    InitiateUploadResult initiate_multipart_upload(
        const std::string& vault, uint64_t size, const std::string& description) override {
        return inner_.initiate_multipart_upload(vault, size, description);
    }

    UploadPartResult upload_part(const std::string& vault, const std::string& upload_id,
                                 const ByteRange& range, std::span<const uint8_t> data,
                                 const std::string& tree_hash) override {
        size_t index = static_cast<size_t>(range.offset / part_size);
        int attempt;
        bool transient = false;
        bool corrupt = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            attempt = ++attempts_[index];
            if (always_transient.count(index)) transient = true;
            auto t = transient_failures.find(index);
            if (t != transient_failures.end() && attempt <= t->second) transient = true;
            auto c = corrupt_failures.find(index);
            if (c != corrupt_failures.end() && attempt <= c->second) corrupt = true;
        }

        if (reverse_step.count() > 0 && part_count > index) {
            std::this_thread::sleep_for(reverse_step * static_cast<int>(part_count - index));
        }
        if (per_call_delay.count() > 0) {
            std::this_thread::sleep_for(per_call_delay);
        }

        UploadPartResult result;
        if (fatal_parts.count(index)) {
            result.status = RemoteStatus::failure(RemoteErrorKind::AccessDenied, "injected denial");
            return result;
        }
        if (transient) {
            result.status = RemoteStatus::failure(RemoteErrorKind::Transient, "HTTP 503 injected");
            return result;
        }
        if (corrupt) {
            std::vector<uint8_t> altered(data.begin(), data.end());
            altered[0] ^= 0xff;
            result = inner_.upload_part(vault, upload_id, range, altered, tree_hash);
        } else {
            result = inner_.upload_part(vault, upload_id, range, data, tree_hash);
        }
        if (result.status.ok()) {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_.push_back(index);
            ++by_thread_[std::this_thread::get_id()];
        }
        return result;
    }

    ArchiveResult complete_multipart_upload(const std::string& vault, const std::string& upload_id,
                                            uint64_t archive_size,
                                            const std::string& tree_hash) override {
        ++complete_calls;
        std::string hash = tree_hash;
        if (wrong_final_hash) hash = std::string(64, '0');
        return inner_.complete_multipart_upload(vault, upload_id, archive_size, hash);
    }

    RemoteStatus abort_multipart_upload(const std::string& vault,
                                        const std::string& upload_id) override {
        ++abort_calls;
        if (fail_abort) {
            return RemoteStatus::failure(RemoteErrorKind::Transient, "abort refused");
        }
        return inner_.abort_multipart_upload(vault, upload_id);
    }

    ListUploadsResult list_multipart_uploads(const std::string& vault,
                                             const std::string& marker) override {
        return inner_.list_multipart_uploads(vault, marker);
    }

    ListPartsResult list_parts(const std::string& vault, const std::string& upload_id,
                               const std::string& marker) override {
        if (list_parts_failure) {
            ListPartsResult result;
            result.status = RemoteStatus::failure(*list_parts_failure, "injected list failure");
            return result;
        }
        return inner_.list_parts(vault, upload_id, marker);
    }

    ArchiveResult upload_archive(const std::string& vault, std::span<const uint8_t> data,
                                 const std::string& tree_hash,
                                 const std::string& description) override {
        return inner_.upload_archive(vault, data, tree_hash, description);
    }

    RemoteStatus delete_archive(const std::string& vault, const std::string& archive_id) override {
        return inner_.delete_archive(vault, archive_id);
    }

    InitiateJobResult initiate_job(const std::string& vault, const JobRequest& request) override {
        return inner_.initiate_job(vault, request);
    }

    JobDescription describe_job(const std::string& vault, const std::string& job_id) override {
        return inner_.describe_job(vault, job_id);
    }

    JobOutputResult get_job_output(const std::string& vault, const std::string& job_id,
                                   const std::optional<ByteRange>& range) override {
        if (++output_calls_ == failing_output_call) {
            JobOutputResult result;
            result.status = RemoteStatus::failure(RemoteErrorKind::AccessDenied,
                                                  "injected output denial");
            return result;
        }
        return inner_.get_job_output(vault, job_id, range);
    }

private:
    VaultClient& inner_;
    std::mutex mutex_;
    std::map<size_t, int> attempts_;
    std::vector<size_t> completed_;
    std::map<std::thread::id, size_t> by_thread_;
    std::atomic<int> output_calls_{0};
};

static UploadContext make_context(VaultClient& client, size_t concurrency,
                                  uint32_t max_attempts = 5) {
    UploadContext context;
    context.client = &client;
    context.vault = VAULT;
    context.description = "test archive";
    context.concurrency = concurrency;
    context.retry.max_attempts = max_attempts;
    context.retry.initial_backoff = std::chrono::milliseconds(1);
    context.retry.max_backoff = std::chrono::milliseconds(4);
    context.sleeper = no_sleep;
    return context;
}

/// Read the stored archive back through a retrieval job.
static std::vector<uint8_t> retrieve_archive(VaultClient& client, const std::string& archive_id,
                                             uint64_t segment_size = 16 * MiB) {
    RetrievalJobPoller poller(client, VAULT, RetryPolicy{}, segment_size, no_sleep);
    JobRequest request;
    request.kind = JobKind::ArchiveRetrieval;
    request.archive_id = archive_id;
    auto job_id = poller.initiate(request);
    auto stream = poller.fetch_output(job_id);
    std::vector<uint8_t> out;
    while (auto segment = stream.next()) {
        out.insert(out.end(), segment->begin(), segment->end());
    }
    return out;
}

// ---------------------------------------------------------------------------
// 1. Tree hash
// ---------------------------------------------------------------------------

static void test_tree_hash() {
    std::cout << "\n=== Tree hash ===" << std::endl;

    {
        TEST(sha256_known_answers);
        ASSERT_EQ(to_hex(digest_of("")),
                  std::string("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"),
                  "sha256 of empty string");
        ASSERT_EQ(to_hex(digest_of("abc")),
                  std::string("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"),
                  "sha256 of abc");
        PASS();
    }
    {
        TEST(small_input_is_plain_sha256);
        auto data = make_bytes(MiB);
        ASSERT_TRUE(PartHasher::digest_of(data) == PartHasher::sha256(data),
                    "1MB input hashes to its sha256");
        std::vector<uint8_t> empty;
        ASSERT_EQ(to_hex(PartHasher::digest_of(empty)), to_hex(digest_of("")),
                  "empty input hashes to sha256 of empty string");
        PASS();
    }
    {
        TEST(three_chunks_promote_odd_leaf);
        auto data = make_bytes(3 * MiB, 7);
        std::span<const uint8_t> all(data);
        auto h0 = PartHasher::sha256(all.subspan(0, MiB));
        auto h1 = PartHasher::sha256(all.subspan(MiB, MiB));
        auto h2 = PartHasher::sha256(all.subspan(2 * MiB, MiB));
        auto expected = hash_pair(hash_pair(h0, h1), h2);
        ASSERT_TRUE(PartHasher::digest_of(data) == expected, "tree of three leaves");
        PASS();
    }
    {
        TEST(combine_is_order_sensitive);
        auto a = digest_of("a");
        auto b = digest_of("b");
        ASSERT_TRUE(PartHasher::combine({a, b}) != PartHasher::combine({b, a}),
                    "swapping digests changes the result");
        ASSERT_TRUE(PartHasher::combine({a}) == a, "single digest is promoted unchanged");
        PASS();
    }
    {
        TEST(combine_rejects_empty);
        bool threw = false;
        try {
            PartHasher::combine({});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "empty combine should throw");
        PASS();
    }
    {
        TEST(part_digests_compose_to_archive_hash);
        auto data = make_bytes(10 * MiB + MiB / 2, 3);
        std::span<const uint8_t> all(data);
        for (uint64_t part : {MiB, 2 * MiB, 4 * MiB, 8 * MiB}) {
            std::vector<Digest> parts;
            for (uint64_t off = 0; off < data.size(); off += part) {
                parts.push_back(PartHasher::digest_of(
                    all.subspan(off, std::min<uint64_t>(part, data.size() - off))));
            }
            ASSERT_TRUE(PartHasher::combine(parts) == PartHasher::digest_of(data),
                        "part size " + std::to_string(part) + " composes");
        }
        PASS();
    }
    {
        TEST(accumulator_matches_with_odd_slices);
        auto data = make_bytes(5 * MiB + 123, 9);
        TreeHashAccumulator acc;
        size_t off = 0;
        size_t step = 333333;
        while (off < data.size()) {
            size_t n = std::min(step, data.size() - off);
            acc.update(std::span<const uint8_t>(data).subspan(off, n));
            off += n;
            step = step * 3 % 1500000 + 1;
        }
        ASSERT_EQ(acc.bytes(), data.size(), "byte count");
        ASSERT_TRUE(acc.finish() == PartHasher::digest_of(data), "streamed hash matches");
        PASS();
    }
    {
        TEST(hex_round_trip_and_rejects);
        auto d = digest_of("abc");
        auto parsed = from_hex(to_hex(d));
        ASSERT_TRUE(parsed && *parsed == d, "hex parses back");
        ASSERT_TRUE(!from_hex("abc"), "short hex rejected");
        ASSERT_TRUE(!from_hex(std::string(64, 'z')), "non-hex rejected");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. ChunkReader
// ---------------------------------------------------------------------------

static void test_chunk_reader() {
    std::cout << "\n=== ChunkReader ===" << std::endl;
    auto tmpdir = make_temp_dir("glacierup-reader");

    {
        TEST(exact_partition);
        auto path = tmpdir / "exact.bin";
        write_file(path, make_bytes(10 * MiB));
        ChunkReader reader(path, MiB);
        ASSERT_EQ(reader.part_count(), size_t{10}, "10MB / 1MB parts");
        ASSERT_TRUE(reader.part_range(9) == (ByteRange{9 * MiB, MiB}), "last range");
        PASS();
    }
    {
        TEST(uneven_partition);
        auto path = tmpdir / "uneven.bin";
        auto data = make_bytes(10 * MiB + MiB / 2, 2);
        write_file(path, data);
        ChunkReader reader(path, MiB);
        ASSERT_EQ(reader.part_count(), size_t{11}, "10.5MB / 1MB parts");
        ASSERT_TRUE(reader.part_range(10) == (ByteRange{10 * MiB, MiB / 2}), "short last part");
        auto last = reader.read_part(10);
        ASSERT_EQ(last.size(), MiB / 2, "last part length");
        ASSERT_TRUE(std::equal(last.begin(), last.end(), data.begin() + 10 * MiB),
                    "last part bytes");
        PASS();
    }
    {
        TEST(empty_file_has_no_parts);
        auto path = tmpdir / "empty.bin";
        write_file(path, {});
        ChunkReader reader(path, MiB);
        ASSERT_EQ(reader.part_count(), size_t{0}, "no parts");
        PASS();
    }
    {
        TEST(bad_part_size_rejected);
        auto path = tmpdir / "exact.bin";
        bool threw = false;
        try {
            ChunkReader reader(path, 3 * MiB);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "3MB part size should be rejected");
        ASSERT_TRUE(!is_valid_part_size(MiB / 2), "512KB invalid");
        ASSERT_TRUE(is_valid_part_size(4096 * MiB), "4GB valid");
        ASSERT_TRUE(!is_valid_part_size(8192 * MiB), "8GB invalid");
        PASS();
    }
    {
        TEST(out_of_range_index);
        ChunkReader reader(tmpdir / "exact.bin", MiB);
        bool threw = false;
        try {
            reader.part_range(10);
        } catch (const std::out_of_range&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "index 10 of 10 should throw");
        PASS();
    }
    {
        TEST(missing_file_is_io_error);
        bool threw = false;
        try {
            ChunkReader reader(tmpdir / "nope.bin", MiB);
        } catch (const IoError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "missing file should throw IoError");
        PASS();
    }
    {
        TEST(short_read_detected);
        auto path = tmpdir / "shrink.bin";
        write_file(path, make_bytes(4 * MiB));
        ChunkReader reader(path, MiB);
        ASSERT_TRUE(truncate(path.c_str(), 2 * MiB + 10) == 0, "truncate");
        bool threw = false;
        try {
            reader.read_part(3);
        } catch (const IoError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "reading past new end should throw IoError");
        auto first = reader.read_part(0);
        ASSERT_EQ(first.size(), MiB, "intact part still readable");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 3. LocalVaultClient
// ---------------------------------------------------------------------------

static void test_local_vault() {
    std::cout << "\n=== LocalVaultClient ===" << std::endl;
    auto tmpdir = make_temp_dir("glacierup-vault");
    LocalVaultClient vault(local_config(tmpdir));

    {
        TEST(missing_vault_not_found);
        auto r = vault.initiate_multipart_upload("absent", MiB, "");
        ASSERT_TRUE(r.status.kind == RemoteErrorKind::NotFound, "absent vault");
        ASSERT_TRUE(vault.create_vault(VAULT), "vault created");
        ASSERT_TRUE(!vault.create_vault(VAULT), "second create reports existing");
        PASS();
    }
    {
        TEST(part_rules_enforced);
        auto init = vault.initiate_multipart_upload(VAULT, MiB, "rules");
        ASSERT_TRUE(init.status.ok(), "initiate: " + init.status.message);

        auto data = make_bytes(MiB);
        auto hash = to_hex(PartHasher::digest_of(data));

        auto misaligned = vault.upload_part(VAULT, init.upload_id, {100, MiB}, data, hash);
        ASSERT_TRUE(misaligned.status.kind == RemoteErrorKind::InvalidParameter, "misaligned offset");

        auto bad_hash = vault.upload_part(VAULT, init.upload_id, {0, MiB}, data,
                                          std::string(64, 'a'));
        ASSERT_TRUE(bad_hash.status.kind == RemoteErrorKind::ChecksumMismatch, "wrong part hash");

        auto good = vault.upload_part(VAULT, init.upload_id, {0, MiB}, data, hash);
        ASSERT_TRUE(good.status.ok(), "good part: " + good.status.message);
        ASSERT_EQ(good.tree_hash, hash, "remote echoes part hash");

        auto gap = vault.complete_multipart_upload(VAULT, init.upload_id, 2 * MiB, hash);
        ASSERT_TRUE(!gap.status.ok(), "missing second part must not complete");

        ASSERT_TRUE(vault.abort_multipart_upload(VAULT, init.upload_id).ok(), "abort");
        auto again = vault.abort_multipart_upload(VAULT, init.upload_id);
        ASSERT_TRUE(again.kind == RemoteErrorKind::NotFound, "second abort not found");
        PASS();
    }
    {
        TEST(list_parts_paginates);
        LocalVaultClient::Config cfg = local_config(tmpdir);
        cfg.list_limit = 2;
        LocalVaultClient paged(cfg);
        auto init = paged.initiate_multipart_upload(VAULT, MiB, "paged");
        auto data = make_bytes(MiB, 5);
        auto hash = to_hex(PartHasher::digest_of(data));
        for (uint64_t i = 0; i < 5; ++i) {
            auto r = paged.upload_part(VAULT, init.upload_id, {i * MiB, MiB}, data, hash);
            ASSERT_TRUE(r.status.ok(), "part upload");
        }
        size_t seen = 0;
        size_t pages = 0;
        std::string marker;
        do {
            auto page = paged.list_parts(VAULT, init.upload_id, marker);
            ASSERT_TRUE(page.status.ok(), "list page: " + page.status.message);
            ASSERT_EQ(page.part_size, MiB, "part size reported");
            seen += page.parts.size();
            marker = page.marker;
            ++pages;
        } while (!marker.empty() && pages < 10);
        ASSERT_EQ(seen, size_t{5}, "all parts listed");
        ASSERT_EQ(pages, size_t{3}, "three pages of two");
        ASSERT_TRUE(paged.abort_multipart_upload(VAULT, init.upload_id).ok(), "cleanup");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 4. UploadWorkerPool
// ---------------------------------------------------------------------------

static void test_upload_pool() {
    std::cout << "\n=== UploadWorkerPool ===" << std::endl;
    auto tmpdir = make_temp_dir("glacierup-pool");
    LocalVaultClient local(local_config(tmpdir / "vaults"));
    local.create_vault(VAULT);

    auto path = tmpdir / "src.bin";
    write_file(path, make_bytes(5 * MiB));
    ChunkReader reader(path, MiB);

    RetryPolicy fast;
    fast.max_attempts = 3;
    fast.initial_backoff = std::chrono::milliseconds(1);

    {
        TEST(backoff_doubles_and_caps);
        RetryPolicy p;
        p.initial_backoff = std::chrono::milliseconds(100);
        p.max_backoff = std::chrono::milliseconds(350);
        ASSERT_EQ(p.backoff_for(1).count(), 100, "first retry");
        ASSERT_EQ(p.backoff_for(2).count(), 200, "second retry");
        ASSERT_EQ(p.backoff_for(3).count(), 350, "capped");
        ASSERT_EQ(p.backoff_for(30).count(), 350, "stays capped");
        PASS();
    }
    {
        TEST(transient_then_success);
        FlakyVaultClient flaky(local);
        flaky.transient_failures[2] = 2;
        auto init = flaky.initiate_multipart_upload(VAULT, MiB, "");

        std::vector<std::chrono::milliseconds> sleeps;
        std::mutex sleeps_mutex;
        Sleeper sleeper = [&](std::chrono::milliseconds d) {
            std::lock_guard<std::mutex> lock(sleeps_mutex);
            sleeps.push_back(d);
        };
        UploadWorkerPool pool(flaky, reader, fast, nullptr, sleeper);
        auto result = pool.run(VAULT, init.upload_id, 3);
        ASSERT_TRUE(result.ok(), "all parts should succeed");
        ASSERT_EQ(result.completed.size(), size_t{5}, "five parts");
        ASSERT_EQ(result.completed.at(2).attempts, 3u, "part 2 took three attempts");
        ASSERT_EQ(sleeps.size(), size_t{2}, "two backoffs");
        ASSERT_TRUE(sleeps[1] > sleeps[0], "backoff grows");
        flaky.abort_multipart_upload(VAULT, init.upload_id);
        PASS();
    }
    {
        TEST(exhaustion_stops_pool);
        FlakyVaultClient flaky(local);
        flaky.always_transient.insert(0);
        auto init = flaky.initiate_multipart_upload(VAULT, MiB, "");

        UploadWorkerPool pool(flaky, reader, fast, nullptr, no_sleep);
        auto result = pool.run(VAULT, init.upload_id, 1);
        ASSERT_TRUE(!result.ok(), "pool should fail");
        ASSERT_TRUE(result.stopped_early, "stop flag raised");
        ASSERT_EQ(result.failed.size(), size_t{1}, "one failed part");
        ASSERT_EQ(result.failed.at(0).attempts, 3u, "max attempts used");
        ASSERT_EQ(result.never_dispatched, size_t{4}, "remaining parts never dequeued");
        ASSERT_TRUE(!result.io_failure, "not an io failure");
        flaky.abort_multipart_upload(VAULT, init.upload_id);
        PASS();
    }
    {
        TEST(fatal_error_not_retried);
        FlakyVaultClient flaky(local);
        flaky.fatal_parts.insert(1);
        auto init = flaky.initiate_multipart_upload(VAULT, MiB, "");
        UploadWorkerPool pool(flaky, reader, fast, nullptr, no_sleep);
        auto result = pool.run(VAULT, init.upload_id, std::vector<size_t>{1}, 2);
        ASSERT_EQ(result.failed.size(), size_t{1}, "part failed");
        ASSERT_EQ(flaky.attempts_for(1), 1, "access denied is not retried");
        flaky.abort_multipart_upload(VAULT, init.upload_id);
        PASS();
    }
    {
        TEST(observer_sees_every_part);
        struct Counter : PartObserver {
            std::atomic<int> completed{0};
            std::atomic<int> retries{0};
            void on_part_completed(size_t, const PartOutcome&) override { ++completed; }
            void on_part_retry(size_t, uint32_t, const std::string&) override { ++retries; }
        } a, b;
        ObserverList list;
        list.add(&a);
        list.add(&b);
        list.add(nullptr);

        FlakyVaultClient flaky(local);
        flaky.transient_failures[4] = 1;
        auto init = flaky.initiate_multipart_upload(VAULT, MiB, "");
        UploadWorkerPool pool(flaky, reader, fast, &list, no_sleep);
        auto result = pool.run(VAULT, init.upload_id, 4);
        ASSERT_TRUE(result.ok(), "upload ok");
        ASSERT_EQ(a.completed.load(), 5, "first observer saw five parts");
        ASSERT_EQ(b.completed.load(), 5, "second observer saw five parts");
        ASSERT_EQ(a.retries.load(), 1, "one retry reported");
        flaky.abort_multipart_upload(VAULT, init.upload_id);
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 5. MultipartUploadOrchestrator
// ---------------------------------------------------------------------------

static void test_orchestrator() {
    std::cout << "\n=== MultipartUploadOrchestrator ===" << std::endl;
    auto tmpdir = make_temp_dir("glacierup-orch");
    LocalVaultClient local(local_config(tmpdir / "vaults"));
    local.create_vault(VAULT);

    auto ten = tmpdir / "ten.bin";
    auto ten_data = make_bytes(10 * MiB, 11);
    write_file(ten, ten_data);

    {
        TEST(ten_megabytes_four_workers);
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(local, 4), reader);
        auto receipt = orch.run();
        ASSERT_NOT_EMPTY(receipt.archive_id, "archive id");
        ASSERT_EQ(receipt.tree_hash, to_hex(PartHasher::digest_of(ten_data)), "archive tree hash");
        ASSERT_EQ(receipt.remote_tree_hash, receipt.tree_hash, "remote agrees");
        ASSERT_EQ(receipt.size, 10 * MiB, "size");
        ASSERT_EQ(count_uploads(local), size_t{0}, "no session left behind");
        auto back = retrieve_archive(local, receipt.archive_id);
        ASSERT_TRUE(back == ten_data, "stored bytes match source");
        PASS();
    }
    {
        TEST(parts_spread_across_four_workers);
        FlakyVaultClient flaky(local);
        flaky.per_call_delay = std::chrono::milliseconds(50);
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(flaky, 4), reader);
        orch.run();
        auto by_thread = flaky.parts_by_thread();
        ASSERT_EQ(by_thread.size(), size_t{4}, "four workers sent parts");
        size_t total = 0;
        for (const auto& [id, parts] : by_thread) {
            ASSERT_TRUE(parts >= 2 && parts <= 3, "each worker sends two or three parts");
            total += parts;
        }
        ASSERT_EQ(total, size_t{10}, "every part sent once");
        PASS();
    }
    {
        TEST(part_limit_checked_before_initiate);
        auto huge = tmpdir / "huge.bin";
        write_file(huge, {});
        fs::resize_file(huge, (constants::MAX_PARTS_PER_UPLOAD + 1) * MiB);
        ChunkReader reader(huge, MiB);
        ASSERT_EQ(reader.part_count(), constants::MAX_PARTS_PER_UPLOAD + 1, "one part too many");
        ASSERT_EQ(min_part_size_for(reader.total_size()), 2 * MiB, "two megabyte parts fit");
        ASSERT_EQ(min_part_size_for(constants::MAX_PARTS_PER_UPLOAD * MiB), MiB, "exact fit");
        MultipartUploadOrchestrator orch(make_context(local, 2), reader);
        size_t before = count_uploads(local);
        bool threw = false;
        try {
            orch.initiate();
        } catch (const InitiationError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::NothingCreated, "nothing created");
            ASSERT_TRUE(std::string(e.what()).find(std::to_string(2 * MiB)) != std::string::npos,
                        "message suggests a part size");
        }
        ASSERT_TRUE(threw, "InitiationError expected");
        ASSERT_EQ(count_uploads(local), before, "no session opened");
        fs::remove(huge);
        PASS();
    }
    {
        TEST(ten_and_a_half_megabytes_eleven_parts);
        auto path = tmpdir / "tenhalf.bin";
        auto data = make_bytes(10 * MiB + MiB / 2, 12);
        write_file(path, data);
        ChunkReader reader(path, MiB);
        MultipartUploadOrchestrator orch(make_context(local, 3), reader);
        auto session = orch.initiate();
        ASSERT_EQ(session.part_count, size_t{11}, "eleven parts");
        ASSERT_TRUE(session.state == SessionState::Initiated, "initiated");
        orch.upload(session);
        ASSERT_EQ(session.outcomes.size(), size_t{11}, "eleven outcomes");
        ASSERT_EQ(session.outcomes.at(10).range.length, MiB / 2, "short last part");
        auto receipt = orch.finalize(session);
        ASSERT_TRUE(session.state == SessionState::Finalized, "finalized");
        ASSERT_EQ(receipt.tree_hash, to_hex(PartHasher::digest_of(data)), "tree hash");
        PASS();
    }
    {
        TEST(reverse_completion_order);
        FlakyVaultClient flaky(local);
        flaky.part_count = 6;
        flaky.reverse_step = std::chrono::milliseconds(30);
        auto path = tmpdir / "six.bin";
        auto data = make_bytes(6 * MiB, 13);
        write_file(path, data);
        ChunkReader reader(path, MiB);
        MultipartUploadOrchestrator orch(make_context(flaky, 6), reader);
        auto receipt = orch.run();
        auto order = flaky.completion_order();
        ASSERT_EQ(order.size(), size_t{6}, "six completions");
        ASSERT_TRUE(order.front() > order.back(), "later parts finished first");
        ASSERT_EQ(receipt.tree_hash, to_hex(PartHasher::digest_of(data)),
                  "hash independent of completion order");
        PASS();
    }
    {
        TEST(transient_failures_recovered);
        FlakyVaultClient flaky(local);
        flaky.transient_failures[0] = 2;
        flaky.transient_failures[7] = 4;
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(flaky, 4, 5), reader);
        auto receipt = orch.run();
        ASSERT_EQ(flaky.attempts_for(0), 3, "part 0 attempts");
        ASSERT_EQ(flaky.attempts_for(7), 5, "part 7 attempts");
        ASSERT_EQ(flaky.abort_calls.load(), 0, "no abort");
        ASSERT_EQ(receipt.tree_hash, to_hex(PartHasher::digest_of(ten_data)), "tree hash");
        PASS();
    }
    {
        TEST(exhausted_retries_abort_once);
        FlakyVaultClient flaky(local);
        flaky.always_transient.insert(3);
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(flaky, 4, 3), reader);
        bool threw = false;
        try {
            orch.run();
        } catch (const UploadError& e) {
            threw = true;
            ASSERT_TRUE(e.parts_failed() >= 1, "at least one part failed");
            ASSERT_TRUE(e.remote_state() == RemoteState::SessionAborted, "session aborted");
            ASSERT_NOT_EMPTY(e.resource_id(), "upload id carried");
            ASSERT_TRUE(e.describe().find("aborted") != std::string::npos,
                        "message states the abort");
        }
        ASSERT_TRUE(threw, "UploadError expected");
        ASSERT_EQ(flaky.abort_calls.load(), 1, "abort exactly once");
        ASSERT_EQ(flaky.attempts_for(3), 3, "bounded attempts");
        ASSERT_EQ(flaky.complete_calls.load(), 0, "never completed");
        ASSERT_EQ(count_uploads(local), size_t{0}, "session gone");
        PASS();
    }
    {
        TEST(abort_failure_is_reported);
        FlakyVaultClient flaky(local);
        flaky.fatal_parts.insert(0);
        flaky.fail_abort = true;
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(flaky, 2, 3), reader);
        auto session = orch.initiate();
        bool threw = false;
        try {
            orch.upload(session);
        } catch (const UploadError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::AbortFailed, "abort failed state");
            ASSERT_TRUE(e.describe().find("Manual cleanup") != std::string::npos,
                        "message asks for cleanup");
            ASSERT_TRUE(e.describe().find(session.upload_id) != std::string::npos,
                        "message names the upload id");
        }
        ASSERT_TRUE(threw, "UploadError expected");
        ASSERT_TRUE(session.state == SessionState::Failed, "session failed");
        local.abort_multipart_upload(VAULT, session.upload_id);
        PASS();
    }
    {
        TEST(checksum_mismatch_at_finalize);
        FlakyVaultClient flaky(local);
        flaky.wrong_final_hash = true;
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(flaky, 4), reader);
        bool threw = false;
        try {
            orch.run();
        } catch (const ChecksumMismatchError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::SessionAborted, "aborted after mismatch");
        }
        ASSERT_TRUE(threw, "ChecksumMismatchError expected");
        ASSERT_EQ(flaky.complete_calls.load(), 1, "mismatch is never retried");
        ASSERT_EQ(flaky.abort_calls.load(), 1, "abort once");
        PASS();
    }
    {
        TEST(digest_mismatch_retried_by_default);
        FlakyVaultClient flaky(local);
        flaky.corrupt_failures[5] = 1;
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(flaky, 4), reader);
        auto receipt = orch.run();
        ASSERT_EQ(flaky.attempts_for(5), 2, "part 5 re-sent once");
        ASSERT_EQ(receipt.tree_hash, to_hex(PartHasher::digest_of(ten_data)), "tree hash");
        PASS();
    }
    {
        TEST(digest_mismatch_fatal_when_disabled);
        FlakyVaultClient flaky(local);
        flaky.corrupt_failures[5] = 1;
        ChunkReader reader(ten, MiB);
        auto context = make_context(flaky, 4);
        context.retry.retry_digest_mismatch = false;
        MultipartUploadOrchestrator orch(context, reader);
        bool threw = false;
        try {
            orch.run();
        } catch (const UploadError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "UploadError expected");
        ASSERT_EQ(flaky.attempts_for(5), 1, "no second attempt");
        ASSERT_EQ(flaky.abort_calls.load(), 1, "abort once");
        PASS();
    }
    {
        TEST(source_shrink_is_io_error);
        auto path = tmpdir / "shrink.bin";
        write_file(path, make_bytes(4 * MiB, 14));
        ChunkReader reader(path, MiB);
        FlakyVaultClient flaky(local);
        MultipartUploadOrchestrator orch(make_context(flaky, 1), reader);
        auto session = orch.initiate();
        ASSERT_TRUE(truncate(path.c_str(), MiB) == 0, "truncate");
        bool threw = false;
        try {
            orch.upload(session);
        } catch (const IoError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::SessionAborted, "aborted");
        }
        ASSERT_TRUE(threw, "IoError expected");
        ASSERT_EQ(flaky.abort_calls.load(), 1, "abort once");
        PASS();
    }
    {
        TEST(empty_source_rejected);
        auto path = tmpdir / "empty.bin";
        write_file(path, {});
        ChunkReader reader(path, MiB);
        MultipartUploadOrchestrator orch(make_context(local, 2), reader);
        bool threw = false;
        try {
            orch.initiate();
        } catch (const InitiationError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::NothingCreated, "nothing created");
        }
        ASSERT_TRUE(threw, "InitiationError expected");
        PASS();
    }
    {
        TEST(missing_vault_is_initiation_error);
        ChunkReader reader(ten, MiB);
        auto context = make_context(local, 2);
        context.vault = "no-such-vault";
        MultipartUploadOrchestrator orch(context, reader);
        bool threw = false;
        try {
            orch.run();
        } catch (const InitiationError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "InitiationError expected");
        PASS();
    }
    {
        TEST(resume_skips_uploaded_parts);
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator first(make_context(local, 2), reader);
        auto session = first.initiate();

        UploadWorkerPool pool(local, reader, RetryPolicy{}, nullptr, no_sleep);
        auto partial = pool.run(VAULT, session.upload_id, std::vector<size_t>{0, 1, 2, 5, 9}, 2);
        ASSERT_TRUE(partial.ok(), "partial upload");

        FlakyVaultClient flaky(local);
        MultipartUploadOrchestrator second(make_context(flaky, 3), reader);
        auto resumed = second.resume(session.upload_id);
        ASSERT_EQ(resumed.outcomes.size(), size_t{5}, "five parts recovered");
        ASSERT_EQ(resumed.outcomes.at(5).attempts, 0u, "recovered parts have no attempts");
        second.upload(resumed);
        ASSERT_EQ(flaky.upload_calls(), size_t{5}, "only missing parts sent");
        ASSERT_EQ(flaky.attempts_for(0), 0, "part 0 not re-sent");
        auto receipt = second.finalize(resumed);
        ASSERT_EQ(receipt.tree_hash, to_hex(PartHasher::digest_of(ten_data)), "tree hash");
        ASSERT_EQ(receipt.upload_id, session.upload_id, "same session");
        PASS();
    }
    {
        TEST(resume_unknown_upload_fails);
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(local, 2), reader);
        bool threw = false;
        try {
            orch.run_resume(std::string(48, 'A'));
        } catch (const InitiationError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::NothingCreated, "nothing created");
        }
        ASSERT_TRUE(threw, "InitiationError expected");
        PASS();
    }
    {
        TEST(resume_part_size_mismatch_fails);
        ChunkReader one(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(local, 2), one);
        auto session = orch.initiate();
        ChunkReader two(ten, 2 * MiB);
        MultipartUploadOrchestrator other(make_context(local, 2), two);
        bool threw = false;
        try {
            other.resume(session.upload_id);
        } catch (const InitiationError& e) {
            threw = true;
            ASSERT_TRUE(std::string(e.what()).find("part size") != std::string::npos,
                        "message names part size");
            ASSERT_TRUE(e.remote_state() == RemoteState::SessionOpen, "session left open");
            ASSERT_EQ(e.resource_id(), session.upload_id, "upload id carried");
            auto text = e.describe();
            ASSERT_TRUE(text.find("left open") != std::string::npos, "describe says left open");
            ASSERT_TRUE(text.find(session.upload_id) != std::string::npos, "describe names id");
            ASSERT_TRUE(text.find("Nothing was created") == std::string::npos,
                        "describe does not claim nothing exists");
        }
        ASSERT_TRUE(threw, "InitiationError expected");
        ASSERT_TRUE(local.list_parts(VAULT, session.upload_id).status.ok(), "session still open");
        ASSERT_EQ(remote_part_size(make_context(local, 2), session.upload_id), MiB,
                  "part size read from the session");
        ASSERT_TRUE(orch.abort(session), "cleanup");
        PASS();
    }
    {
        TEST(resume_list_failure_leaves_session_open);
        ChunkReader reader(ten, MiB);
        MultipartUploadOrchestrator orch(make_context(local, 2), reader);
        auto session = orch.initiate();

        FlakyVaultClient flaky(local);
        flaky.list_parts_failure = RemoteErrorKind::Transient;
        MultipartUploadOrchestrator resumer(make_context(flaky, 2), reader);
        bool threw = false;
        try {
            resumer.resume(session.upload_id);
        } catch (const InitiationError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::SessionOpen, "session left open");
            ASSERT_EQ(e.resource_id(), session.upload_id, "upload id carried");
        }
        ASSERT_TRUE(threw, "InitiationError expected");

        threw = false;
        try {
            remote_part_size(make_context(flaky, 2), session.upload_id);
        } catch (const InitiationError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::SessionOpen, "part size lookup too");
        }
        ASSERT_TRUE(threw, "InitiationError expected from part size lookup");
        ASSERT_EQ(flaky.abort_calls.load(), 0, "resume never aborts");
        ASSERT_TRUE(orch.abort(session), "cleanup");
        PASS();
    }
    {
        TEST(resume_read_failure_leaves_session_open);
        auto shrink = tmpdir / "shrink.bin";
        write_file(shrink, ten_data);
        ChunkReader reader(shrink, MiB);
        MultipartUploadOrchestrator orch(make_context(local, 2), reader);
        auto session = orch.initiate();
        orch.upload(session);

        ChunkReader stale(shrink, MiB);
        fs::resize_file(shrink, 5 * MiB);
        MultipartUploadOrchestrator resumer(make_context(local, 2), stale);
        bool threw = false;
        try {
            resumer.resume(session.upload_id);
        } catch (const IoError& e) {
            threw = true;
            ASSERT_TRUE(e.remote_state() == RemoteState::SessionOpen, "session left open");
            ASSERT_EQ(e.resource_id(), session.upload_id, "upload id carried");
        }
        ASSERT_TRUE(threw, "IoError expected");
        ASSERT_TRUE(orch.abort(session), "cleanup");
        PASS();
    }
    {
        TEST(single_request_upload);
        auto path = tmpdir / "small.bin";
        auto data = make_bytes(3 * MiB + 17, 15);
        write_file(path, data);
        auto receipt = upload_in_single_request(make_context(local, 1), path);
        ASSERT_NOT_EMPTY(receipt.archive_id, "archive id");
        ASSERT_EQ(receipt.tree_hash, to_hex(PartHasher::digest_of(data)), "tree hash");
        ASSERT_TRUE(receipt.upload_id.empty(), "no multipart session");
        ASSERT_TRUE(retrieve_archive(local, receipt.archive_id) == data, "stored bytes");
        PASS();
    }
    {
        TEST(progress_logger_counts);
        ProgressLogger progress(4, 1);
        PartOutcome ok;
        ok.success = true;
        progress.on_part_completed(1, ok);
        progress.on_part_completed(2, ok);
        PartOutcome bad;
        progress.on_part_completed(3, bad);
        ASSERT_EQ(progress.done(), size_t{3}, "failed parts are not counted");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 6. RetrievalJobPoller
// ---------------------------------------------------------------------------

static void test_retrieval() {
    std::cout << "\n=== RetrievalJobPoller ===" << std::endl;
    auto tmpdir = make_temp_dir("glacierup-retrieval");
    LocalVaultClient local(local_config(tmpdir / "vaults"));
    local.create_vault(VAULT);

    auto path = tmpdir / "archive.bin";
    auto data = make_bytes(5 * MiB + MiB / 2, 21);
    write_file(path, data);
    auto receipt = upload_in_single_request(make_context(local, 1), path);

    {
        TEST(archive_job_requires_id);
        RetrievalJobPoller poller(local, VAULT);
        JobRequest request;
        bool threw = false;
        try {
            poller.initiate(request);
        } catch (const InitiationError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "InitiationError expected");
        PASS();
    }
    {
        TEST(unknown_archive_is_initiation_error);
        RetrievalJobPoller poller(local, VAULT);
        JobRequest request;
        request.archive_id = std::string(48, 'B');
        bool threw = false;
        try {
            poller.initiate(request);
        } catch (const InitiationError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "InitiationError expected");
        PASS();
    }
    {
        TEST(not_ready_before_delay);
        LocalVaultClient slow(local_config(tmpdir / "vaults", std::chrono::seconds(3600)));
        RetrievalJobPoller poller(slow, VAULT, RetryPolicy{}, 16 * MiB, no_sleep);
        JobRequest request;
        request.archive_id = receipt.archive_id;
        auto job_id = poller.initiate(request);

        auto status = poller.poll(job_id);
        ASSERT_TRUE(!status.completed, "still running");
        ASSERT_TRUE(status.code == JobStatusCode::InProgress, "in progress");

        bool not_ready = false;
        try {
            poller.fetch_output(job_id);
        } catch (const NotReadyError&) {
            not_ready = true;
        }
        ASSERT_TRUE(not_ready, "NotReadyError expected");
        PASS();
    }
    {
        TEST(wait_times_out);
        LocalVaultClient slow(local_config(tmpdir / "vaults", std::chrono::seconds(3600)));
        RetrievalJobPoller poller(slow, VAULT);
        JobRequest request;
        request.kind = JobKind::InventoryRetrieval;
        auto job_id = poller.initiate(request);

        int sleeps = 0;
        PollPolicy policy;
        policy.interval = std::chrono::seconds(5);
        policy.timeout = std::chrono::seconds(10);
        bool timed_out = false;
        try {
            poller.wait_for_completion(job_id, policy,
                                       [&](std::chrono::milliseconds) { ++sleeps; });
        } catch (const RetrievalError&) {
            timed_out = true;
        }
        ASSERT_TRUE(timed_out, "RetrievalError expected");
        ASSERT_EQ(sleeps, 2, "slept for the whole timeout at the fixed interval");
        PASS();
    }
    {
        TEST(wait_returns_completed_job);
        RetrievalJobPoller poller(local, VAULT);
        JobRequest request;
        request.archive_id = receipt.archive_id;
        auto job_id = poller.initiate(request);
        int sleeps = 0;
        auto status = poller.wait_for_completion(job_id, PollPolicy{},
                                                 [&](std::chrono::milliseconds) { ++sleeps; });
        ASSERT_TRUE(status.succeeded(), "succeeded");
        ASSERT_EQ(sleeps, 0, "no sleep needed");
        ASSERT_EQ(status.output_size, data.size(), "output size known");
        PASS();
    }
    {
        TEST(failed_job_raises_job_failed);
        auto other = tmpdir / "doomed.bin";
        write_file(other, make_bytes(MiB, 22));
        auto doomed = upload_in_single_request(make_context(local, 1), other);

        RetrievalJobPoller poller(local, VAULT);
        JobRequest request;
        request.archive_id = doomed.archive_id;
        auto job_id = poller.initiate(request);
        ASSERT_TRUE(local.delete_archive(VAULT, doomed.archive_id).ok(), "delete archive");

        auto status = poller.poll(job_id);
        ASSERT_TRUE(status.failed(), "job failed");

        bool job_failed = false;
        bool not_ready = false;
        try {
            poller.fetch_output(job_id);
        } catch (const NotReadyError&) {
            not_ready = true;
        } catch (const JobFailedError&) {
            job_failed = true;
        }
        ASSERT_TRUE(job_failed && !not_ready, "JobFailedError expected");
        PASS();
    }
    {
        TEST(segmented_output_matches_archive);
        RetrievalJobPoller poller(local, VAULT, RetryPolicy{}, 2 * MiB + 5, no_sleep);
        ASSERT_EQ(poller.segment_size(), 2 * MiB, "segment size aligned down");
        JobRequest request;
        request.archive_id = receipt.archive_id;
        auto job_id = poller.initiate(request);
        auto stream = poller.fetch_output(job_id);

        std::vector<uint8_t> out;
        size_t segments = 0;
        while (auto segment = stream.next()) {
            ASSERT_TRUE(segment->size() <= 2 * MiB, "segment bounded");
            out.insert(out.end(), segment->begin(), segment->end());
            ++segments;
        }
        ASSERT_EQ(segments, size_t{3}, "three segments");
        ASSERT_TRUE(out == data, "bytes match");
        ASSERT_TRUE(stream.exhausted(), "exhausted");
        ASSERT_TRUE(stream.verified(), "tree hash verified");
        ASSERT_EQ(stream.content_type(), std::string("application/octet-stream"), "content type");
        ASSERT_TRUE(!stream.next(), "stays exhausted");

        auto again = poller.fetch_output(job_id);
        auto first = again.next();
        ASSERT_TRUE(first && first->size() == 2 * MiB, "repeat fetch starts over");
        PASS();
    }
    {
        TEST(failed_output_leaves_no_file);
        FlakyVaultClient flaky(local);
        flaky.failing_output_call = 2;
        RetrievalJobPoller poller(flaky, VAULT, RetryPolicy{}, 2 * MiB, no_sleep);
        JobRequest request;
        request.archive_id = receipt.archive_id;
        auto job_id = poller.initiate(request);
        auto out_path = tmpdir / "restored.bin";

        auto stream = poller.fetch_output(job_id);
        size_t written = 0;
        bool threw = false;
        try {
            write_job_output(stream, out_path, [&](size_t n) { written += n; });
        } catch (const RetrievalError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "RetrievalError expected");
        ASSERT_EQ(written, 2 * MiB, "first segment was written before the failure");
        ASSERT_TRUE(!fs::exists(out_path), "partial file removed");

        auto retry = poller.fetch_output(job_id);
        ASSERT_EQ(write_job_output(retry, out_path), data.size(), "second attempt completes");
        ASSERT_TRUE(read_file(out_path) == std::string(data.begin(), data.end()),
                    "restored bytes match");

        auto again = poller.fetch_output(job_id);
        threw = false;
        try {
            write_job_output(again, out_path);
        } catch (const IoError&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "existing file is not overwritten");
        ASSERT_EQ(fs::file_size(out_path), data.size(), "existing file untouched");
        PASS();
    }
    {
        TEST(json_inventory);
        RetrievalJobPoller poller(local, VAULT);
        JobRequest request;
        request.kind = JobKind::InventoryRetrieval;
        auto job_id = poller.initiate(request);
        auto stream = poller.fetch_output(job_id);
        std::string body;
        while (auto segment = stream.next()) body.append(segment->begin(), segment->end());
        ASSERT_EQ(stream.content_type(), std::string("application/json"), "json content type");
        auto j = nlohmann::json::parse(body);
        ASSERT_TRUE(j.contains("ArchiveList"), "has archive list");
        bool found = false;
        for (const auto& a : j["ArchiveList"]) {
            if (a["ArchiveId"] == receipt.archive_id) {
                found = true;
                ASSERT_EQ(a["SHA256TreeHash"].get<std::string>(), receipt.tree_hash,
                          "inventory tree hash");
            }
        }
        ASSERT_TRUE(found, "uploaded archive listed");
        PASS();
    }
    {
        TEST(csv_inventory);
        RetrievalJobPoller poller(local, VAULT);
        JobRequest request;
        request.kind = JobKind::InventoryRetrieval;
        request.inventory_format = "CSV";
        auto job_id = poller.initiate(request);
        auto stream = poller.fetch_output(job_id);
        std::string body;
        while (auto segment = stream.next()) body.append(segment->begin(), segment->end());
        ASSERT_EQ(stream.content_type(), std::string("text/csv"), "csv content type");
        ASSERT_TRUE(body.rfind("ArchiveId,", 0) == 0, "csv header");
        ASSERT_TRUE(body.find(receipt.archive_id) != std::string::npos, "archive listed");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 7. AppConfig
// ---------------------------------------------------------------------------

static void test_config() {
    std::cout << "\n=== AppConfig ===" << std::endl;
    auto tmpdir = make_temp_dir("glacierup-config");
    auto file = tmpdir / "data.bin";
    write_file(file, make_bytes(MiB));

    setenv("AWS_ACCESS_KEY_ID", "AKIDENV", 1);
    setenv("AWS_SECRET_ACCESS_KEY", "secretenv", 1);
    setenv("AWS_REGION", "eu-west-1", 1);
    unsetenv("AWS_SESSION_TOKEN");

    {
        TEST(upload_flags_parsed);
        Args args{"glacier-upload", "upload", "-v", "photos", "-f", file.string(),
                  "-d", "holiday", "-p", "16", "-t", "7", "--max-retries", "4"};
        auto config = AppConfig::from_args(args.argc(), args.argv());
        ASSERT_TRUE(config.has_value(), "parse should succeed");
        ASSERT_EQ(config->command, std::string("upload"), "command");
        ASSERT_EQ(config->vault, std::string("photos"), "vault");
        ASSERT_EQ(config->description, std::string("holiday"), "description");
        ASSERT_EQ(config->part_size_mb, uint64_t{16}, "part size");
        ASSERT_EQ(config->part_size_bytes(), 16 * MiB, "part size bytes");
        ASSERT_EQ(config->upload_threads, size_t{7}, "threads");
        ASSERT_EQ(config->max_retries, 4u, "retries");
        ASSERT_EMPTY(config->validate(), "valid config");
        PASS();
    }
    {
        TEST(defaults_from_environment);
        Args args{"glacier-upload", "list-uploads", "--vault-name", "photos"};
        auto config = AppConfig::from_args(args.argc(), args.argv());
        ASSERT_TRUE(config.has_value(), "parse should succeed");
        ASSERT_EQ(config->backend.type, std::string("glacier"), "default backend");
        ASSERT_EQ(config->backend.params["access_key"], std::string("AKIDENV"), "access key");
        ASSERT_EQ(config->backend.params["secret_key"], std::string("secretenv"), "secret key");
        ASSERT_EQ(config->backend.params["region"], std::string("eu-west-1"), "region");
        ASSERT_EQ(config->backend.params["request_timeout"], std::string("300"), "timeout");
        ASSERT_EQ(config->upload_threads, size_t{5}, "default threads");
        ASSERT_EQ(config->part_size_mb, uint64_t{8}, "default part size");
        PASS();
    }
    {
        TEST(cli_overrides_environment);
        Args args{"glacier-upload", "list-uploads", "-v", "x", "--access-key", "AKIDCLI",
                  "-r", "ap-south-1"};
        auto config = AppConfig::from_args(args.argc(), args.argv());
        ASSERT_TRUE(config.has_value(), "parse should succeed");
        ASSERT_EQ(config->backend.params["access_key"], std::string("AKIDCLI"), "cli key wins");
        ASSERT_EQ(config->backend.params["region"], std::string("ap-south-1"), "cli region wins");
        PASS();
    }
    {
        TEST(secrets_masked);
        Args args{"glacier-upload", "list-uploads", "-v", "x"};
        auto config = AppConfig::from_args(args.argc(), args.argv());
        ASSERT_TRUE(config.has_value(), "parse should succeed");
        auto masked = config->backend.masked_params();
        ASSERT_EQ(masked["secret_key"], std::string("****"), "secret masked");
        ASSERT_EQ(masked["region"], std::string("eu-west-1"), "region visible");
        for (const auto& line : config->describe()) {
            ASSERT_TRUE(line.find("secretenv") == std::string::npos, "secret never echoed");
        }
        PASS();
    }
    {
        TEST(bad_input_rejected);
        Args unknown_cmd{"glacier-upload", "frobnicate", "-v", "x"};
        ASSERT_TRUE(!AppConfig::from_args(unknown_cmd.argc(), unknown_cmd.argv()),
                    "unknown command");
        Args unknown_flag{"glacier-upload", "upload", "--bogus"};
        ASSERT_TRUE(!AppConfig::from_args(unknown_flag.argc(), unknown_flag.argv()),
                    "unknown flag");
        Args bad_number{"glacier-upload", "upload", "-t", "many"};
        ASSERT_TRUE(!AppConfig::from_args(bad_number.argc(), bad_number.argv()),
                    "non-numeric threads");
        Args missing_value{"glacier-upload", "upload", "-v"};
        ASSERT_TRUE(!AppConfig::from_args(missing_value.argc(), missing_value.argv()),
                    "missing value");
        Args no_command{"glacier-upload"};
        ASSERT_TRUE(!AppConfig::from_args(no_command.argc(), no_command.argv()), "no command");
        PASS();
    }
    {
        TEST(validation_rules);
        Args args{"glacier-upload", "upload", "-v", "photos", "-f", file.string(), "-p", "3"};
        auto config = AppConfig::from_args(args.argc(), args.argv());
        ASSERT_TRUE(config.has_value(), "parse should succeed");
        ASSERT_TRUE(config->validate().find("power of two") != std::string::npos, "part size");

        config->part_size_mb = 8;
        config->upload_threads = 0;
        ASSERT_NOT_EMPTY(config->validate(), "zero threads");

        config->upload_threads = 2;
        auto link = tmpdir / "link.bin";
        fs::create_symlink(file, link);
        config->file = link;
        ASSERT_TRUE(config->validate().find("symlink") != std::string::npos, "symlink rejected");

        config->file = file;
        config->vault.clear();
        ASSERT_NOT_EMPTY(config->validate(), "vault required");

        config->vault = "photos";
        config->command = "describe-job";
        ASSERT_TRUE(config->validate().find("job id") != std::string::npos, "job id required");

        config->command = "upload";
        config->tier = "Fast";
        ASSERT_TRUE(config->validate().find("tier") != std::string::npos, "tier checked");
        PASS();
    }
    {
        TEST(part_limit_validated);
        auto huge = tmpdir / "huge.bin";
        write_file(huge, {});
        fs::resize_file(huge, 10001 * MiB);
        Args args{"glacier-upload", "upload", "-v", "photos", "-f", huge.string(), "-p", "1"};
        auto config = AppConfig::from_args(args.argc(), args.argv());
        ASSERT_TRUE(config.has_value(), "parse should succeed");
        auto err = config->validate();
        ASSERT_TRUE(err.find("10001 parts") != std::string::npos, "part count reported");
        ASSERT_TRUE(err.find("--part-size 2") != std::string::npos, "larger part size suggested");

        config->part_size_mb = 2;
        ASSERT_EMPTY(config->validate(), "two megabyte parts fit");

        config->part_size_mb = 1;
        config->upload_id = "existing-upload";
        ASSERT_EMPTY(config->validate(), "resume takes part size from the remote");
        fs::remove(huge);
        PASS();
    }
    {
        TEST(backend_validation);
        BackendConfig bc;
        bc.type = "";
        ASSERT_NOT_EMPTY(bc.validate(), "empty type");
        bc.type = "ftp";
        ASSERT_TRUE(bc.validate().find("unknown") != std::string::npos, "unknown type");
        bc.type = "local";
        ASSERT_TRUE(bc.validate().find("path") != std::string::npos, "local needs path");
        bc.params["path"] = tmpdir.string();
        ASSERT_EMPTY(bc.validate(), "local with path");
        bc.type = "glacier";
        bc.params.clear();
        ASSERT_TRUE(bc.validate().find("access_key") != std::string::npos, "glacier needs key");
        PASS();
    }
    {
        TEST(json_config_overlay);
        auto json_path = tmpdir / "config.json";
        write_text(json_path, R"({
            "vault": "from-json",
            "part_size_mb": 32,
            "upload_threads": 9,
            "segment_size_mb": 4,
            "backend": {"type": "local", "path": ")" + tmpdir.string() + R"(", "job_delay": 5}
        })");
        Args args{"glacier-upload", "list-uploads", "--config", json_path.string(), "-t", "2"};
        auto config = AppConfig::from_args(args.argc(), args.argv());
        ASSERT_TRUE(config.has_value(), "parse should succeed");
        ASSERT_EQ(config->vault, std::string("from-json"), "vault from json");
        ASSERT_EQ(config->part_size_mb, uint64_t{32}, "part size from json");
        ASSERT_EQ(config->upload_threads, size_t{2}, "later flag overrides json");
        ASSERT_EQ(config->segment_size_bytes(), 4 * MiB, "segment size");
        ASSERT_EQ(config->backend.type, std::string("local"), "backend type");
        ASSERT_EQ(config->backend.params["job_delay"], std::string("5"), "numeric param kept");
        ASSERT_TRUE(config->backend.params.count("access_key") == 0, "no env credentials for local");
        ASSERT_EMPTY(config->validate(), "valid");

        auto client = VaultClientFactory::create(config->backend.type, config->backend.params);
        ASSERT_EQ(client->type_name(), std::string("local"), "factory builds local vault");
        PASS();
    }
    {
        TEST(bad_json_rejected);
        auto json_path = tmpdir / "broken.json";
        write_text(json_path, "{ not json");
        AppConfig config;
        ASSERT_TRUE(!config.load_json(json_path), "broken json");
        ASSERT_TRUE(!config.load_json(tmpdir / "missing.json"), "missing file");
        PASS();
    }
    {
        TEST(factory_rejects_bad_params);
        bool threw = false;
        try {
            VaultClientFactory::create("tape", {});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "unknown type");
        threw = false;
        try {
            VaultClientFactory::create("local", {{"path", tmpdir.string()}, {"job_delay", "soon"}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "non-numeric job delay");
        threw = false;
        try {
            VaultClientFactory::create("glacier", {{"region", "us-east-1"}});
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        ASSERT_TRUE(threw, "glacier without credentials");
        PASS();
    }

    unsetenv("AWS_ACCESS_KEY_ID");
    unsetenv("AWS_SECRET_ACCESS_KEY");
    unsetenv("AWS_REGION");
    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 8. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;
    auto tmpdir = make_temp_dir("glacierup-metrics");
    auto prom_path = tmpdir / "glacierup.prom";

    {
        TEST(observer_updates_file);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {{"vault", "photos"}});
        exporter.set_parts_pending(2);

        PartOutcome ok;
        ok.success = true;
        ok.range = {0, MiB};
        ok.elapsed = std::chrono::milliseconds(250);
        exporter.on_part_retry(0, 1, "HTTP 503");
        exporter.on_part_completed(0, ok);
        PartOutcome bad;
        exporter.on_part_completed(1, bad);
        exporter.sessions_failure().Increment();
        exporter.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("glacierup_parts_total") != std::string::npos, "parts counter");
        ASSERT_TRUE(content.find("result=\"success\"") != std::string::npos, "success label");
        ASSERT_TRUE(content.find("glacierup_part_retries_total") != std::string::npos, "retries");
        ASSERT_TRUE(content.find("glacierup_upload_bytes_total") != std::string::npos, "bytes");
        ASSERT_TRUE(content.find("glacierup_part_upload_duration_seconds") != std::string::npos,
                    "histogram");
        ASSERT_TRUE(content.find("glacierup_sessions_total") != std::string::npos, "sessions");
        ASSERT_TRUE(content.find("glacierup_parts_pending") != std::string::npos, "gauge");
        ASSERT_TRUE(content.find("vault=\"photos\"") != std::string::npos, "constant label");
        ASSERT_EQ(exporter.upload_bytes_total().Value(), static_cast<double>(MiB), "byte count");
        ASSERT_EQ(exporter.parts_failure().Value(), 1.0, "failure count");
        PASS();
    }
    {
        TEST(background_writer_replaces_atomically);
        fs::remove(prom_path);
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), {});
        exporter.start();
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!fs::exists(prom_path) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        ASSERT_TRUE(fs::exists(prom_path), "writer produced the file");
        exporter.stop();
        auto tmp_path = prom_path;
        tmp_path += ".tmp";
        ASSERT_TRUE(!fs::exists(tmp_path), ".tmp file should not persist");
        PASS();
    }
    {
        TEST(pending_gauge_under_concurrent_completions);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        exporter.set_parts_pending(3);
        PartOutcome ok;
        ok.success = true;
        exporter.on_part_completed(0, ok);
        exporter.on_part_completed(1, ok);
        ASSERT_EQ(exporter.parts_pending().Value(), 1.0, "one part left");

        exporter.set_parts_pending(160);
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&exporter, t] {
                PartOutcome outcome;
                outcome.success = (t % 2 == 0);
                for (int i = 0; i < 20; ++i) exporter.on_part_completed(0, outcome);
            });
        }
        for (auto& th : threads) th.join();
        ASSERT_EQ(exporter.parts_pending().Value(), 0.0, "every completion counted");

        exporter.on_part_completed(0, ok);
        ASSERT_EQ(exporter.parts_pending().Value(), 0.0, "never below zero");
        exporter.stop();
        PASS();
    }
    {
        TEST(scoped_timer_observes);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        {
            ScopedTimer timer(exporter.part_upload_duration());
        }
        exporter.stop();
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("glacierup_part_upload_duration_seconds_count 1") !=
                        std::string::npos,
                    "one observation");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 9. Glacier HTTP plumbing
// ---------------------------------------------------------------------------

static net::HttpResponse make_response(int status, const std::string& body) {
    net::HttpResponse r;
    r.status_code = status;
    r.body.assign(body.begin(), body.end());
    return r;
}

static net::HttpRequest make_put(const std::string& url) {
    net::HttpRequest request;
    request.method = net::HttpMethod::PUT;
    request.url = url;
    return request;
}

static void test_glacier_http() {
    std::cout << "\n=== Glacier HTTP ===" << std::endl;

    {
        TEST(error_classification);
        net::HttpResponse network;
        network.is_network_error = true;
        network.error = "Couldn't connect to server";
        ASSERT_TRUE(GlacierClient::classify_response(network).kind == RemoteErrorKind::Transient,
                    "network error transient");
        ASSERT_TRUE(GlacierClient::classify_response(make_response(200, "")).ok(), "200 ok");
        ASSERT_TRUE(GlacierClient::classify_response(make_response(503, "")).transient(),
                    "503 transient");
        ASSERT_TRUE(GlacierClient::classify_response(make_response(429, "")).transient(),
                    "429 transient");
        ASSERT_TRUE(GlacierClient::classify_response(make_response(408, "")).transient(),
                    "408 transient");
        ASSERT_TRUE(GlacierClient::classify_response(
                        make_response(404, R"({"code":"ResourceNotFoundException","message":"Vault not found"})"))
                        .kind == RemoteErrorKind::NotFound, "404 not found");
        ASSERT_TRUE(GlacierClient::classify_response(make_response(403, "")).kind ==
                        RemoteErrorKind::AccessDenied, "403 denied");
        ASSERT_TRUE(GlacierClient::classify_response(
                        make_response(400, R"({"code":"InvalidParameterValueException","message":"Checksum mismatch: expected a but was b"})"))
                        .kind == RemoteErrorKind::ChecksumMismatch, "checksum mismatch");
        ASSERT_TRUE(GlacierClient::classify_response(
                        make_response(400, R"({"code":"InvalidParameterValueException","message":"Invalid part size"})"))
                        .kind == RemoteErrorKind::InvalidParameter, "invalid parameter");
        ASSERT_TRUE(GlacierClient::classify_response(
                        make_response(400, R"({"code":"ThrottlingException","message":"slow down"})"))
                        .transient(), "throttling transient");
        auto status = GlacierClient::classify_response(
            make_response(404, R"({"code":"ResourceNotFoundException","message":"Vault not found"})"));
        ASSERT_TRUE(status.message.find("Vault not found") != std::string::npos,
                    "service message kept");
        PASS();
    }
    {
        TEST(sigv4_authorization_header);
        net::AwsSigV4Signer signer("AKIDEXAMPLE", "wJalrXUtnFEMI/K7MDENG/bPxRfiCYEXAMPLEKEY",
                                   "us-east-1", "glacier");
        auto request = make_put("https://glacier.us-east-1.amazonaws.com/-/vaults/examplevault");
        request.headers.set("x-amz-glacier-version", "2012-06-01");
        auto copy = request;
        signer.sign_at(request, "20120525T002453Z");
        signer.sign_at(copy, "20120525T002453Z");

        auto auth = request.headers.get("authorization");
        ASSERT_TRUE(auth.has_value(), "authorization set");
        ASSERT_TRUE(auth->rfind("AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20120525/us-east-1/"
                                "glacier/aws4_request", 0) == 0, "credential scope");
        ASSERT_TRUE(auth->find("x-amz-glacier-version") != std::string::npos,
                    "glacier version header signed");
        ASSERT_TRUE(auth->find("host;") != std::string::npos, "host signed");
        ASSERT_EQ(*auth, *copy.headers.get("authorization"), "signing is deterministic");
        ASSERT_EQ(*request.headers.get("x-amz-date"), std::string("20120525T002453Z"), "date");
        ASSERT_EQ(*request.headers.get("host"), std::string("glacier.us-east-1.amazonaws.com"),
                  "host header");

        net::AwsSigV4Signer other("AKIDEXAMPLE", "different", "us-east-1", "glacier");
        auto third = make_put("https://glacier.us-east-1.amazonaws.com/-/vaults/examplevault");
        third.headers.set("x-amz-glacier-version", "2012-06-01");
        other.sign_at(third, "20120525T002453Z");
        ASSERT_TRUE(*third.headers.get("authorization") != *auth, "secret affects signature");
        PASS();
    }
    {
        TEST(borrowed_body_signs_like_owned_body);
        net::AwsSigV4Signer signer("AKIDEXAMPLE", "secret", "us-east-1", "glacier");
        auto part = make_bytes(MiB, 31);
        const std::string url = "https://glacier.us-east-1.amazonaws.com/-/vaults/v/multipart-uploads/U";

        auto owned = make_put(url);
        owned.body = part;
        auto borrowed = make_put(url);
        borrowed.body_view = part;

        ASSERT_TRUE(borrowed.body.empty(), "borrowed request holds no copy");
        ASSERT_TRUE(borrowed.payload().data() == part.data(), "payload points at caller buffer");
        ASSERT_EQ(borrowed.payload().size(), part.size(), "payload size");

        signer.sign_at(owned, "20120525T002453Z");
        signer.sign_at(borrowed, "20120525T002453Z");
        ASSERT_EQ(*borrowed.headers.get("x-amz-content-sha256"), net::sha256_hex(part),
                  "payload hash over borrowed bytes");
        ASSERT_EQ(*borrowed.headers.get("authorization"), *owned.headers.get("authorization"),
                  "same signature as an owned body");
        PASS();
    }
    {
        TEST(url_helpers);
        auto url = net::ParsedUrl::parse("https://example.com:8443/a/b?x=1");
        ASSERT_TRUE(url.has_value(), "parsed");
        ASSERT_EQ(url->host, std::string("example.com"), "host");
        ASSERT_EQ(url->port, 8443, "port");
        ASSERT_EQ(url->path, std::string("/a/b"), "path");
        ASSERT_EQ(url->authority(), std::string("example.com:8443"), "authority");
        ASSERT_EQ(net::url_encode("a b/c"), std::string("a%20b%2Fc"), "encoding");
        ASSERT_EQ(net::sha256_hex({}),
                  std::string("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"),
                  "empty payload hash");
        PASS();
    }
    {
        TEST(vault_url_layout);
        GlacierClient::Config config;
        config.region = "eu-west-1";
        config.access_key = "AKID";
        config.secret_key = "secret";
        GlacierClient client(config);
        ASSERT_EQ(client.vault_url("photos"),
                  std::string("https://glacier.eu-west-1.amazonaws.com/-/vaults/photos"),
                  "default endpoint");

        config.endpoint = "http://localhost:9000/";
        config.account_id = "123456789012";
        GlacierClient custom(config);
        ASSERT_EQ(custom.vault_url("photos"),
                  std::string("http://localhost:9000/123456789012/vaults/photos"),
                  "custom endpoint");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "glacier-upload test suite" << std::endl;
    std::cout << "=========================" << std::endl;

    test_tree_hash();
    test_chunk_reader();
    test_local_vault();
    test_upload_pool();
    test_orchestrator();
    test_retrieval();
    test_config();
    test_metrics();
    test_glacier_http();

    std::cout << "\n=========================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
