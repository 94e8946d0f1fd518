#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace cs::index {

// Unsigned LEB128: 7 data bits per byte, low bits first, 0x80 set on every
// byte except the last.
constexpr size_t kMaxVarintLen64 = 10;

inline size_t putUvarint(uint8_t* buf, uint64_t v) {
    size_t i = 0;
    while (v >= 0x80) {
        buf[i++] = static_cast<uint8_t>(v) | 0x80;
        v >>= 7;
    }
    buf[i++] = static_cast<uint8_t>(v);
    return i;
}

template <typename Container>
void appendUvarint(Container& out, uint64_t v) {
    uint8_t tmp[kMaxVarintLen64];
    const size_t n = putUvarint(tmp, v);
    out.insert(out.end(), tmp, tmp + n);
}

// Returns the number of bytes consumed, or 0 if the input is truncated or the
// value does not fit in 64 bits.
inline size_t getUvarint(std::span<const uint8_t> in, uint64_t& out) {
    uint64_t v = 0;
    unsigned shift = 0;
    for (size_t i = 0; i < in.size() && i < kMaxVarintLen64; ++i) {
        const uint8_t b = in[i];
        if (b < 0x80) {
            if (i == kMaxVarintLen64 - 1 && b > 1) return 0;
            out = v | static_cast<uint64_t>(b) << shift;
            return i + 1;
        }
        v |= static_cast<uint64_t>(b & 0x7F) << shift;
        shift += 7;
    }
    return 0;
}

inline size_t uvarintLen(uint64_t v) {
    size_t n = 1;
    while (v >= 0x80) {
        v >>= 7;
        ++n;
    }
    return n;
}

}
