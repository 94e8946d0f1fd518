#pragma once

#include "index/Trigram.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace cs::index {

enum class SkipReason {
    TooLarge,
    LineTooLong,
    TooManyTrigrams,
    InvalidEncoding
};

std::string_view to_string(SkipReason reason);

constexpr uint64_t DEFAULT_MAX_FILE_LEN = static_cast<uint64_t>(1) << 30;
constexpr uint32_t DEFAULT_MAX_LINE_LEN = 2000;
constexpr uint32_t DEFAULT_MAX_TRIGRAM_COUNT = 30000;
constexpr double DEFAULT_MAX_INVALID_UTF8_RATIO = 0.1;

struct ExtractorLimits {
    uint64_t max_file_len = DEFAULT_MAX_FILE_LEN;
    uint32_t max_line_len = DEFAULT_MAX_LINE_LEN;
    uint32_t max_trigram_count = DEFAULT_MAX_TRIGRAM_COUNT;
    double max_invalid_utf8_ratio = DEFAULT_MAX_INVALID_UTF8_RATIO;
};

// Collects the distinct trigrams of one file at a time. Content is fed in
// chunks; a skip decision is sticky until the next reset().
//
// Bytes belonging to a malformed UTF-8 sequence never enter the trigram
// window, and the window restarts after them, so no trigram straddles one.
class TrigramExtractor {
public:
    explicit TrigramExtractor(ExtractorLimits limits = {});

    void reset();

    std::optional<SkipReason> feed(std::span<const uint8_t> chunk);
    std::optional<SkipReason> finish();

    std::optional<SkipReason> extract(std::string_view content);

    // Sorted after a successful finish().
    [[nodiscard]] const std::vector<Trigram>& trigrams() const { return trigrams_; }

    [[nodiscard]] uint64_t bytesSeen() const { return total_; }
    [[nodiscard]] uint64_t invalidBytes() const { return invalid_; }
    [[nodiscard]] const ExtractorLimits& limits() const { return limits_; }

private:
    void step(uint8_t c);
    void push(uint8_t c);
    void breakSequence();
    void clearSeen();

    ExtractorLimits limits_;

    // One bit per possible trigram; trigrams_ doubles as the list of set bits.
    std::vector<uint64_t> seen_;
    std::vector<Trigram> trigrams_;

    uint32_t window_ = 0;
    unsigned windowLen_ = 0;

    // In-flight multi-byte sequence.
    uint8_t seq_[4]{};
    unsigned seqLen_ = 0;
    unsigned seqNeed_ = 0;
    uint8_t nextLo_ = 0x80;
    uint8_t nextHi_ = 0xBF;

    uint64_t total_ = 0;
    uint64_t invalid_ = 0;
    uint64_t lineLen_ = 0;
    std::optional<SkipReason> skip_;
    bool finished_ = false;
};

}
