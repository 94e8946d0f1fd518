#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace cs::index {

// Three bytes packed big-end first: b0 << 16 | b1 << 8 | b2.
using Trigram = uint32_t;
using FileId = uint32_t;

constexpr Trigram kTrigramMask = (1u << 24) - 1;
constexpr uint32_t kTrigramSpace = 1u << 24;

constexpr Trigram makeTrigram(uint8_t a, uint8_t b, uint8_t c) {
    return static_cast<Trigram>(a) << 16 | static_cast<Trigram>(b) << 8 | c;
}

inline Trigram trigramFromString(std::string_view s) {
    return makeTrigram(static_cast<uint8_t>(s[0]), static_cast<uint8_t>(s[1]), static_cast<uint8_t>(s[2]));
}

inline std::string trigramToString(Trigram t) {
    return {static_cast<char>(t >> 16 & 0xFF), static_cast<char>(t >> 8 & 0xFF), static_cast<char>(t & 0xFF)};
}

}
