#pragma once

#include "index/Trigram.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

// Index file layout, all fixed-width integers big-endian:
//
//   "csearch index 1\n"
//   indexed paths     NUL-terminated strings, closed by an empty string
//   file names        NUL-terminated strings in FileId order, closed by an empty string
//   posting lists     trigram[3] uvarint(id - prev)... uvarint(0), prev starting at -1
//   name index        uint32 offset into the names per file, plus one end offset
//   posting index     trigram[3] uint32 count uint32 offset, sorted by trigram
//   trailer           uint32 x5 section offsets, "\ncsearch trailr\n"
namespace cs::index::format {

constexpr std::string_view MAGIC = "csearch index 1\n";
constexpr std::string_view TRAILER_MAGIC = "\ncsearch trailr\n";

constexpr size_t TRAILER_OFFSETS = 5;
constexpr size_t TRAILER_SIZE = TRAILER_OFFSETS * 4 + TRAILER_MAGIC.size();
constexpr size_t POST_ENTRY_SIZE = 3 + 4 + 4;
constexpr size_t NAME_ENTRY_SIZE = 4;

constexpr uint64_t MAX_OFFSET = UINT32_MAX;

inline uint32_t readUint32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) << 24 | static_cast<uint32_t>(p[1]) << 16 |
           static_cast<uint32_t>(p[2]) << 8 | p[3];
}

inline Trigram readTrigram(const uint8_t* p) {
    return makeTrigram(p[0], p[1], p[2]);
}

}
