#include "glacierup/retrieval.hpp"
#include "glacierup/errors.hpp"
#include "glacierup/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <thread>
#include <unistd.h>

namespace glacierup {

namespace {

void real_sleep(std::chrono::milliseconds d) {
    std::this_thread::sleep_for(d);
}

} // namespace

// ============================================================================
// JobOutputStream
// ============================================================================

JobOutputStream::JobOutputStream(VaultClient& client, std::string vault, JobStatus status,
                                 uint64_t segment_size, RetryPolicy retry, Sleeper sleeper)
    : client_(client)
    , vault_(std::move(vault))
    , status_(std::move(status))
    , segment_size_(segment_size)
    , retry_(retry)
    , sleeper_(std::move(sleeper)) {
    if (retry_.max_attempts == 0) retry_.max_attempts = 1;
    if (!sleeper_) sleeper_ = real_sleep;
}

JobOutputResult JobOutputStream::fetch(const std::optional<ByteRange>& range) {
    JobOutputResult result;
    for (uint32_t attempt = 1; ; ++attempt) {
        result = client_.get_job_output(vault_, status_.job_id, range);
        if (!result.status.transient() || attempt >= retry_.max_attempts) {
            break;
        }
        log_warn("Fetching output of job %s failed, retrying (attempt %u): %s",
                 status_.job_id.c_str(), attempt, result.status.message.c_str());
        sleeper_(retry_.backoff_for(attempt));
    }
    if (!result.status.ok()) {
        throw RetrievalError("Failed to get output of job " + status_.job_id + " (" +
                                 remote_error_to_string(result.status.kind) + "): " +
                                 result.status.message,
                             status_.job_id);
    }
    if (content_type_.empty()) content_type_ = result.content_type;
    return result;
}

std::optional<std::vector<uint8_t>> JobOutputStream::next() {
    if (done_) return std::nullopt;

    // Size not reported: the output can only be fetched whole
    if (status_.output_size == 0) {
        auto result = fetch(std::nullopt);
        done_ = true;
        if (result.data.empty()) return std::nullopt;
        accumulator_.update(result.data);
        offset_ = result.data.size();
        return std::move(result.data);
    }

    if (offset_ >= status_.output_size) {
        done_ = true;
        return std::nullopt;
    }

    ByteRange range{offset_, std::min(segment_size_, status_.output_size - offset_)};
    auto result = fetch(range);
    if (result.data.size() != range.length) {
        throw RetrievalError("Job " + status_.job_id + " returned " +
                                 std::to_string(result.data.size()) + " bytes for range " +
                                 std::to_string(range.offset) + "-" +
                                 std::to_string(range.last()) + ", expected " +
                                 std::to_string(range.length),
                             status_.job_id);
    }
    if (!result.tree_hash.empty() && result.tree_hash != to_hex(PartHasher::digest_of(result.data))) {
        throw RetrievalError("Tree hash mismatch in output segment at offset " +
                                 std::to_string(range.offset) + " of job " + status_.job_id,
                             status_.job_id);
    }

    accumulator_.update(result.data);
    offset_ += range.length;
    if (offset_ >= status_.output_size) done_ = true;
    return std::move(result.data);
}

bool JobOutputStream::verified() const {
    if (!done_ || status_.output_tree_hash.empty()) return false;
    return to_hex(accumulator_.finish()) == status_.output_tree_hash;
}

// ============================================================================
// RetrievalJobPoller
// ============================================================================

RetrievalJobPoller::RetrievalJobPoller(VaultClient& client, std::string vault,
                                       RetryPolicy retry, uint64_t segment_size,
                                       Sleeper sleeper)
    : client_(client)
    , vault_(std::move(vault))
    , retry_(retry)
    , segment_size_(segment_size)
    , sleeper_(std::move(sleeper)) {
    segment_size_ -= segment_size_ % constants::TREE_HASH_CHUNK_SIZE;
    if (segment_size_ == 0) segment_size_ = constants::TREE_HASH_CHUNK_SIZE;
    if (!sleeper_) sleeper_ = real_sleep;
}

std::string RetrievalJobPoller::initiate(const JobRequest& request) {
    if (request.kind == JobKind::ArchiveRetrieval && request.archive_id.empty()) {
        throw InitiationError("Archive retrieval requires an archive id",
                              RemoteState::NotApplicable);
    }

    auto result = client_.initiate_job(vault_, request);
    if (!result.status.ok()) {
        throw InitiationError(std::string("Failed to initiate ") +
                                  job_kind_to_string(request.kind) + " job in vault '" +
                                  vault_ + "' (" + remote_error_to_string(result.status.kind) +
                                  "): " + result.status.message,
                              RemoteState::NotApplicable);
    }

    log_info("Initiated %s job %s", job_kind_to_string(request.kind), result.job_id.c_str());
    return result.job_id;
}

JobStatus RetrievalJobPoller::poll(const std::string& job_id) {
    auto desc = client_.describe_job(vault_, job_id);
    if (!desc.status.ok()) {
        throw RetrievalError("Failed to describe job " + job_id + " (" +
                                 remote_error_to_string(desc.status.kind) + "): " +
                                 desc.status.message,
                             job_id);
    }

    JobStatus status;
    status.job_id = desc.job_id.empty() ? job_id : desc.job_id;
    status.kind = desc.kind;
    status.code = desc.status_code;
    status.completed = desc.completed;
    status.message = desc.status_message;
    status.creation_date = desc.creation_date;
    status.completion_date = desc.completion_date;
    status.output_size = desc.output_size;
    status.output_tree_hash = desc.output_tree_hash;

    log_debug("Job %s: %s", job_id.c_str(), job_status_to_string(status.code));
    return status;
}

JobStatus RetrievalJobPoller::wait_for_completion(const std::string& job_id,
                                                  const PollPolicy& policy,
                                                  const Sleeper& sleeper) {
    const Sleeper& sleep = sleeper ? sleeper : sleeper_;
    auto interval = std::max(policy.interval, std::chrono::seconds(1));
    std::chrono::seconds waited{0};

    while (true) {
        JobStatus status = poll(job_id);
        if (status.completed) {
            return status;
        }
        if (policy.timeout.count() > 0 && waited >= policy.timeout) {
            throw RetrievalError("Timed out after " + std::to_string(waited.count()) +
                                     "s waiting for job " + job_id,
                                 job_id);
        }
        log_info("Job %s is %s, checking again in %llds", job_id.c_str(),
                 job_status_to_string(status.code),
                 static_cast<long long>(interval.count()));
        sleep(std::chrono::duration_cast<std::chrono::milliseconds>(interval));
        waited += interval;
    }
}

JobOutputStream RetrievalJobPoller::fetch_output(const std::string& job_id) {
    JobStatus status = poll(job_id);
    if (!status.completed) {
        throw NotReadyError("Job " + job_id + " has not completed yet (" +
                                job_status_to_string(status.code) + ")",
                            job_id);
    }
    if (status.failed()) {
        throw JobFailedError("Job " + job_id + " failed: " + status.message, job_id);
    }
    return JobOutputStream(client_, vault_, std::move(status), segment_size_, retry_, sleeper_);
}

// ============================================================================
// Output file
// ============================================================================

namespace {

std::string write_all(int fd, const std::vector<uint8_t>& data) {
    const uint8_t* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::string("write failed: ") + strerror(errno);
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return "";
}

void drain_to_fd(JobOutputStream& stream, int fd, const std::filesystem::path& path,
                 const std::function<void(size_t)>& on_segment) {
    while (auto segment = stream.next()) {
        if (auto err = write_all(fd, *segment); !err.empty()) {
            throw IoError("Cannot write " + path.string() + ": " + err,
                          RemoteState::NotApplicable);
        }
        if (on_segment) on_segment(segment->size());
        log_debug("Received %lu of %lu bytes",
                  static_cast<unsigned long>(stream.bytes_received()),
                  static_cast<unsigned long>(stream.total_size()));
    }
    if (!stream.expected_tree_hash().empty() && !stream.verified()) {
        throw RetrievalError("Tree hash of " + path.string() + " (" +
                                 stream.received_tree_hash() + ") does not match " +
                                 stream.expected_tree_hash(),
                             "");
    }
}

} // namespace

uint64_t write_job_output(JobOutputStream& stream, const std::filesystem::path& path,
                          const std::function<void(size_t)>& on_segment) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
    if (fd < 0) {
        throw IoError("Cannot create " + path.string() + ": " + strerror(errno),
                      RemoteState::NotApplicable);
    }

    try {
        drain_to_fd(stream, fd, path, on_segment);
    } catch (const std::exception&) {
        ::close(fd);
        ::unlink(path.c_str());
        log_warn("Removed incomplete output file %s", path.c_str());
        throw;
    }

    if (::close(fd) != 0) {
        std::string err = strerror(errno);
        ::unlink(path.c_str());
        throw IoError("Cannot write " + path.string() + ": close failed: " + err,
                      RemoteState::NotApplicable);
    }
    return stream.bytes_received();
}

} // namespace glacierup
