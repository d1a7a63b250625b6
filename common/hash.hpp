#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for upload integrity checks
// ============================================================

#include "platform.hpp"
#include "utils.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <algorithm>
#include <stdexcept>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 streaming state type
#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

// 16-byte (128-bit) digest, big-endian so it compares the same everywhere
using Hash128 = std::array<u8, 16>;

inline Hash128 to_hash128(XXH128_hash_t h) {
    Hash128 result;
    for (int i = 0; i < 8; ++i) {
        result[(size_t)i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[(size_t)i + 8] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

// One-shot xxh3_128 of a memory buffer
inline Hash128 xxh3_128(const void* data, size_t len) {
    return to_hash128(XXH3_128bits(data, len));
}

// Incremental xxh3_128, fed part by part as an upload streams out
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_128bits_update(state_, data, len);
    }

    Hash128 digest() const {
        return to_hash128(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

inline void to_bytes(const Hash128& h, u8 out[16]) {
    std::copy(h.begin(), h.end(), out);
}

inline Hash128 from_bytes(const u8 in[16]) {
    Hash128 h;
    std::copy(in, in + 16, h.begin());
    return h;
}

inline std::string to_hex(const Hash128& h) {
    return utils::to_hex(h.data(), h.size());
}

} // namespace hash
