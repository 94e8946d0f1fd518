#pragma once

#include <cstdint>
#include <filesystem>

namespace cs::index {

enum class MergeMode {
    // Every file of both sources; a name present in both is an error.
    Union,
    // src2 is the newer index: files of src1 under any indexed path of src2
    // are dropped first.
    Supersede
};

struct MergeStats {
    uint32_t files1 = 0;
    uint32_t files2 = 0;
    uint32_t dropped = 0;
    uint32_t files = 0;
    uint32_t trigrams = 0;
    uint64_t postings = 0;
};

// Writes the merge of two indexes to dest with file ids renumbered into one
// sorted, dense space. Posting lists are streamed trigram by trigram, so
// memory stays bounded by the two renumbering tables.
//
// Throws DuplicatePath when a name survives in both sources; dest is removed
// on any failure.
MergeStats merge(const std::filesystem::path& dest,
                 const std::filesystem::path& src1,
                 const std::filesystem::path& src2,
                 MergeMode mode = MergeMode::Union,
                 const std::filesystem::path& tmpDir = {});

}
