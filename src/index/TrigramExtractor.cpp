#include "index/TrigramExtractor.hpp"

#include <algorithm>

namespace cs::index {

std::string_view to_string(const SkipReason reason) {
    switch (reason) {
        case SkipReason::TooLarge: return "too large";
        case SkipReason::LineTooLong: return "line too long";
        case SkipReason::TooManyTrigrams: return "too many trigrams";
        case SkipReason::InvalidEncoding: return "invalid UTF-8";
    }
    return "unknown";
}

TrigramExtractor::TrigramExtractor(ExtractorLimits limits)
    : limits_(limits), seen_(kTrigramSpace / 64, 0) {}

void TrigramExtractor::reset() {
    clearSeen();
    window_ = 0;
    windowLen_ = 0;
    seqLen_ = 0;
    seqNeed_ = 0;
    nextLo_ = 0x80;
    nextHi_ = 0xBF;
    total_ = 0;
    invalid_ = 0;
    lineLen_ = 0;
    skip_.reset();
    finished_ = false;
}

void TrigramExtractor::clearSeen() {
    for (const Trigram t : trigrams_) seen_[t >> 6] &= ~(uint64_t{1} << (t & 63));
    trigrams_.clear();
}

std::optional<SkipReason> TrigramExtractor::extract(std::string_view content) {
    reset();
    if (const auto r = feed({reinterpret_cast<const uint8_t*>(content.data()), content.size()})) return r;
    return finish();
}

std::optional<SkipReason> TrigramExtractor::feed(std::span<const uint8_t> chunk) {
    for (const uint8_t c : chunk) {
        if (skip_) break;
        step(c);
    }
    return skip_;
}

std::optional<SkipReason> TrigramExtractor::finish() {
    if (finished_) return skip_;
    finished_ = true;
    if (skip_) return skip_;

    if (seqNeed_ > 0) breakSequence();

    if (total_ > 0 &&
        static_cast<double>(invalid_) / static_cast<double>(total_) > limits_.max_invalid_utf8_ratio) {
        skip_ = SkipReason::InvalidEncoding;
        return skip_;
    }

    std::sort(trigrams_.begin(), trigrams_.end());
    return std::nullopt;
}

void TrigramExtractor::step(const uint8_t c) {
    if (++total_ > limits_.max_file_len) {
        skip_ = SkipReason::TooLarge;
        return;
    }

    if (c == '\n') lineLen_ = 0;
    else if (++lineLen_ > limits_.max_line_len) {
        skip_ = SkipReason::LineTooLong;
        return;
    }

    if (seqNeed_ > 0) {
        if (c >= nextLo_ && c <= nextHi_) {
            seq_[seqLen_++] = c;
            nextLo_ = 0x80;
            nextHi_ = 0xBF;
            if (--seqNeed_ == 0) {
                for (unsigned i = 0; i < seqLen_; ++i) push(seq_[i]);
                seqLen_ = 0;
            }
            return;
        }
        // The sequence ended early; c starts over below.
        breakSequence();
    }

    if (c < 0x80) {
        push(c);
        return;
    }

    if (c >= 0xC2 && c <= 0xDF) {
        seqNeed_ = 1;
    } else if (c == 0xE0) {
        seqNeed_ = 2;
        nextLo_ = 0xA0;
    } else if (c == 0xED) {
        seqNeed_ = 2;
        nextHi_ = 0x9F; // no surrogates
    } else if (c >= 0xE1 && c <= 0xEF) {
        seqNeed_ = 2;
    } else if (c == 0xF0) {
        seqNeed_ = 3;
        nextLo_ = 0x90;
    } else if (c >= 0xF1 && c <= 0xF3) {
        seqNeed_ = 3;
    } else if (c == 0xF4) {
        seqNeed_ = 3;
        nextHi_ = 0x8F;
    } else {
        // stray continuation byte, overlong lead or out of range
        ++invalid_;
        windowLen_ = 0;
        return;
    }

    seq_[0] = c;
    seqLen_ = 1;
}

void TrigramExtractor::breakSequence() {
    invalid_ += seqLen_;
    seqLen_ = 0;
    seqNeed_ = 0;
    nextLo_ = 0x80;
    nextHi_ = 0xBF;
    windowLen_ = 0;
}

void TrigramExtractor::push(const uint8_t c) {
    window_ = (window_ << 8 | c) & kTrigramMask;
    if (windowLen_ < 3 && ++windowLen_ < 3) return;

    uint64_t& word = seen_[window_ >> 6];
    const uint64_t bit = uint64_t{1} << (window_ & 63);
    if (word & bit) return;
    word |= bit;
    trigrams_.push_back(window_);

    if (trigrams_.size() > limits_.max_trigram_count) skip_ = SkipReason::TooManyTrigrams;
}

}
