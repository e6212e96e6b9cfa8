#include "glacierup/tree_hash.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace glacierup {

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

Digest hash_pair(const Digest& left, const Digest& right) {
    uint8_t buf[constants::DIGEST_SIZE * 2];
    std::memcpy(buf, left.data(), left.size());
    std::memcpy(buf + left.size(), right.data(), right.size());
    return PartHasher::sha256(std::span<const uint8_t>(buf, sizeof(buf)));
}

} // namespace

std::string to_hex(const Digest& digest) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (uint8_t b : digest) {
        out += kHex[b >> 4];
        out += kHex[b & 0x0f];
    }
    return out;
}

std::optional<Digest> from_hex(const std::string& hex) {
    if (hex.size() != constants::DIGEST_SIZE * 2) return std::nullopt;
    Digest d{};
    for (size_t i = 0; i < d.size(); ++i) {
        int hi = hex_digit(hex[2 * i]);
        int lo = hex_digit(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        d[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return d;
}

Digest PartHasher::sha256(std::span<const uint8_t> data) {
    Digest d{};
    SHA256(data.data(), data.size(), d.data());
    return d;
}

Digest PartHasher::digest_of(std::span<const uint8_t> data) {
    if (data.size() <= constants::TREE_HASH_CHUNK_SIZE) {
        return sha256(data);
    }

    std::vector<Digest> leaves;
    leaves.reserve((data.size() + constants::TREE_HASH_CHUNK_SIZE - 1) /
                   constants::TREE_HASH_CHUNK_SIZE);
    for (size_t off = 0; off < data.size(); off += constants::TREE_HASH_CHUNK_SIZE) {
        size_t len = std::min(constants::TREE_HASH_CHUNK_SIZE, data.size() - off);
        leaves.push_back(sha256(data.subspan(off, len)));
    }
    return combine(leaves);
}

Digest PartHasher::combine(const std::vector<Digest>& ordered) {
    if (ordered.empty()) {
        throw std::invalid_argument("tree hash of an empty digest list");
    }

    std::vector<Digest> level = ordered;
    while (level.size() > 1) {
        std::vector<Digest> parent;
        parent.reserve((level.size() + 1) / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            if (i + 1 < level.size()) {
                parent.push_back(hash_pair(level[i], level[i + 1]));
            } else {
                parent.push_back(level[i]);
            }
        }
        level = std::move(parent);
    }
    return level.front();
}

// --- TreeHashAccumulator ---

void TreeHashAccumulator::update(std::span<const uint8_t> data) {
    total_bytes_ += data.size();
    while (!data.empty()) {
        size_t room = constants::TREE_HASH_CHUNK_SIZE - pending_.size();
        size_t take = std::min(room, data.size());
        pending_.insert(pending_.end(), data.begin(), data.begin() + take);
        data = data.subspan(take);
        if (pending_.size() == constants::TREE_HASH_CHUNK_SIZE) {
            leaves_.push_back(PartHasher::sha256(pending_));
            pending_.clear();
        }
    }
}

Digest TreeHashAccumulator::finish() const {
    if (leaves_.empty()) {
        return PartHasher::sha256(pending_);
    }
    if (pending_.empty()) {
        return PartHasher::combine(leaves_);
    }
    std::vector<Digest> all = leaves_;
    all.push_back(PartHasher::sha256(pending_));
    return PartHasher::combine(all);
}

} // namespace glacierup
