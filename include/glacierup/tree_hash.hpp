#pragma once

#include "glacierup/constants.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace glacierup {

using Digest = std::array<uint8_t, constants::DIGEST_SIZE>;

/// Lowercase hex of a digest.
std::string to_hex(const Digest& digest);

/// Parse a 64-character hex digest. Returns nullopt on malformed input.
std::optional<Digest> from_hex(const std::string& hex);

/// Glacier SHA-256 tree hash primitives.
///
/// A part digest is the tree hash of the part's 1MB chunks; the session digest
/// is the same reduction applied to the part digests in index order. Because
/// part sizes are powers of two in MB, the two levels compose into exactly the
/// tree hash the service computes over the whole archive.
class PartHasher {
public:
    /// Plain SHA-256.
    static Digest sha256(std::span<const uint8_t> data);

    /// Tree hash of one contiguous byte range (1MB leaves).
    static Digest digest_of(std::span<const uint8_t> data);

    /// Pairwise reduction: hash adjacent pairs level by level, promoting an
    /// odd trailing digest unchanged. Throws std::invalid_argument on empty input.
    static Digest combine(const std::vector<Digest>& ordered);
};

/// Streaming tree hash over bytes delivered in arbitrary slices.
class TreeHashAccumulator {
public:
    void update(std::span<const uint8_t> data);

    /// Tree hash of everything fed so far. The accumulator stays usable.
    Digest finish() const;

    uint64_t bytes() const { return total_bytes_; }

private:
    std::vector<Digest> leaves_;
    std::vector<uint8_t> pending_;
    uint64_t total_bytes_ = 0;
};

} // namespace glacierup
