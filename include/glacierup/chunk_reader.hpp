#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace glacierup {

/// Half-open byte range [offset, offset + length).
struct ByteRange {
    uint64_t offset = 0;
    uint64_t length = 0;

    uint64_t end() const { return offset + length; }

    /// Inclusive last byte, as used by HTTP Range / Content-Range headers.
    uint64_t last() const { return offset + length - 1; }

    bool operator==(const ByteRange& other) const = default;
};

/// True if part_size is a power of two between 1MB and 4GB.
bool is_valid_part_size(uint64_t part_size);

/// Smallest valid part size that splits total_size into at most
/// MAX_PARTS_PER_UPLOAD parts. Returns 0 if even MAX_PART_SIZE is too small.
uint64_t min_part_size_for(uint64_t total_size);

/// Exposes a source file as fixed-size parts read with positioned reads.
///
/// One descriptor is shared by all callers; every read is a pread() at an
/// explicit offset, so concurrent read_part() calls never contend on a file
/// cursor. At most one part's bytes are buffered per call.
class ChunkReader {
public:
    /// Opens the file and records its size. Throws std::invalid_argument for
    /// a bad part size and IoError if the file cannot be opened or stat'ed.
    ChunkReader(const std::filesystem::path& path, uint64_t part_size);
    ~ChunkReader();

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

    const std::filesystem::path& path() const { return path_; }
    uint64_t total_size() const { return total_size_; }
    uint64_t part_size() const { return part_size_; }

    /// ceil(total_size / part_size); zero for an empty file.
    size_t part_count() const;

    /// Byte range of part `index`. Throws std::out_of_range.
    ByteRange part_range(size_t index) const;

    /// Read exactly part_range(index). Throws IoError on a read error or if the
    /// file turns out shorter than it was when opened.
    std::vector<uint8_t> read_part(size_t index) const;

    /// Read an arbitrary range, same failure rules as read_part().
    std::vector<uint8_t> read_range(const ByteRange& range) const;

private:
    std::filesystem::path path_;
    uint64_t part_size_;
    uint64_t total_size_ = 0;
    int fd_ = -1;
};

} // namespace glacierup
