#include "glacierup/chunk_reader.hpp"
#include "glacierup/constants.hpp"
#include "glacierup/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace glacierup {

bool is_valid_part_size(uint64_t part_size) {
    if (part_size < constants::MIN_PART_SIZE || part_size > constants::MAX_PART_SIZE) {
        return false;
    }
    return (part_size & (part_size - 1)) == 0;
}

uint64_t min_part_size_for(uint64_t total_size) {
    for (uint64_t size = constants::MIN_PART_SIZE; size <= constants::MAX_PART_SIZE; size *= 2) {
        if ((total_size + size - 1) / size <= constants::MAX_PARTS_PER_UPLOAD) return size;
    }
    return 0;
}

ChunkReader::ChunkReader(const std::filesystem::path& path, uint64_t part_size)
    : path_(path), part_size_(part_size) {
    if (!is_valid_part_size(part_size)) {
        throw std::invalid_argument(
            "part size must be a power of two between 1MB and 4GB, got " +
            std::to_string(part_size));
    }

    fd_ = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw IoError("cannot open " + path.string() + ": " + strerror(errno));
    }

    struct stat st;
    if (fstat(fd_, &st) != 0) {
        int err = errno;
        close(fd_);
        fd_ = -1;
        throw IoError("cannot stat " + path.string() + ": " + strerror(err));
    }
    if (!S_ISREG(st.st_mode)) {
        close(fd_);
        fd_ = -1;
        throw IoError(path.string() + " is not a regular file");
    }
    total_size_ = static_cast<uint64_t>(st.st_size);
}

ChunkReader::~ChunkReader() {
    if (fd_ >= 0) {
        close(fd_);
    }
}

size_t ChunkReader::part_count() const {
    return static_cast<size_t>((total_size_ + part_size_ - 1) / part_size_);
}

ByteRange ChunkReader::part_range(size_t index) const {
    if (index >= part_count()) {
        throw std::out_of_range("part index " + std::to_string(index) +
                                " out of range (part count " +
                                std::to_string(part_count()) + ")");
    }
    ByteRange r;
    r.offset = static_cast<uint64_t>(index) * part_size_;
    r.length = std::min(part_size_, total_size_ - r.offset);
    return r;
}

std::vector<uint8_t> ChunkReader::read_part(size_t index) const {
    return read_range(part_range(index));
}

std::vector<uint8_t> ChunkReader::read_range(const ByteRange& range) const {
    std::vector<uint8_t> buf(range.length);
    uint64_t done = 0;
    while (done < range.length) {
        ssize_t n = pread(fd_, buf.data() + done, range.length - done,
                          static_cast<off_t>(range.offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("read failed on " + path_.string() + " at offset " +
                          std::to_string(range.offset + done) + ": " + strerror(errno));
        }
        if (n == 0) {
            throw IoError(path_.string() + " is shorter than expected: wanted bytes " +
                          std::to_string(range.offset) + "-" + std::to_string(range.last()) +
                          ", file ends at " + std::to_string(range.offset + done) +
                          " (source modified during upload?)");
        }
        done += static_cast<uint64_t>(n);
    }
    return buf;
}

} // namespace glacierup
