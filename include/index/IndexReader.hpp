#pragma once

#include "index/MappedFile.hpp"
#include "index/Trigram.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cs::index {

class IndexReader;

// Lazy, restartable range over a section of NUL-terminated strings that ends
// with an empty string (or at the end of the section).
class StringList {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::string_view;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string_view*;
        using reference = const std::string_view&;

        iterator() = default;
        iterator(const uint8_t* p, const uint8_t* end) : p_(p), end_(end) { load(); }

        reference operator*() const { return cur_; }
        pointer operator->() const { return &cur_; }

        iterator& operator++() {
            p_ = cur_.size() < static_cast<size_t>(end_ - p_) ? p_ + cur_.size() + 1 : end_;
            load();
            return *this;
        }

        iterator operator++(int) {
            auto tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const iterator& o) const { return p_ == o.p_; }

    private:
        void load();

        const uint8_t* p_ = nullptr;
        const uint8_t* end_ = nullptr;
        std::string_view cur_;
    };

    StringList() = default;
    StringList(const uint8_t* begin, const uint8_t* end) : begin_(begin), end_(end) {}

    [[nodiscard]] iterator begin() const { return {begin_, end_}; }
    [[nodiscard]] iterator end() const { return {}; }
    [[nodiscard]] bool empty() const { return begin() == end(); }

    [[nodiscard]] std::vector<std::string> toVector() const;

private:
    const uint8_t* begin_ = nullptr;
    const uint8_t* end_ = nullptr;
};

struct TrigramEntry {
    Trigram trigram = 0;
    uint32_t count = 0;
    uint32_t offset = 0; // relative to the posting lists section
};

// The file ids of one trigram, decoded one delta at a time. Iteration throws
// CorruptIndex when the stored list is truncated, not increasing, names an id
// outside the index, or disagrees with the count in the posting index.
class PostingList {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = FileId;
        using difference_type = std::ptrdiff_t;
        using pointer = const FileId*;
        using reference = const FileId&;

        iterator() = default;
        explicit iterator(const PostingList* list);

        reference operator*() const { return id_; }
        iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const iterator& o) const { return done_ == o.done_ && (done_ || pos_ == o.pos_); }

    private:
        void advance();

        const IndexReader* reader_ = nullptr;
        const uint8_t* pos_ = nullptr;
        const uint8_t* end_ = nullptr;
        uint32_t count_ = 0;
        int64_t prev_ = -1;
        uint32_t decoded_ = 0;
        FileId id_ = 0;
        bool done_ = true;
    };

    PostingList() = default;
    PostingList(const IndexReader* reader, const uint8_t* begin, const uint8_t* end, uint32_t count)
        : reader_(reader), begin_(begin), end_(end), count_(count) {}

    [[nodiscard]] iterator begin() const { return begin_ ? iterator(this) : iterator(); }
    [[nodiscard]] iterator end() const { return {}; }

    // Count recorded in the posting index.
    [[nodiscard]] uint32_t size() const { return count_; }
    [[nodiscard]] bool empty() const { return count_ == 0; }

    [[nodiscard]] std::vector<FileId> toVector() const;

private:
    friend class iterator;

    const IndexReader* reader_ = nullptr;
    const uint8_t* begin_ = nullptr; // first delta, after the trigram bytes
    const uint8_t* end_ = nullptr;   // end of the posting lists section
    uint32_t count_ = 0;
};

// Read-only view of one index file. Nothing is mutated after the constructor
// returns, so one reader can serve concurrent queries.
class IndexReader {
public:
    explicit IndexReader(std::filesystem::path path);

    IndexReader(const IndexReader&) = delete;
    IndexReader& operator=(const IndexReader&) = delete;

    [[nodiscard]] StringList indexedPaths() const;
    [[nodiscard]] StringList names() const;

    [[nodiscard]] std::string_view name(FileId id) const;
    [[nodiscard]] std::optional<FileId> fileId(std::string_view path) const;

    [[nodiscard]] PostingList postingList(Trigram t) const;
    [[nodiscard]] PostingList postingList(const TrigramEntry& entry) const;

    [[nodiscard]] TrigramEntry trigramEntry(size_t i) const;
    [[nodiscard]] std::vector<Trigram> trigrams() const;

    [[nodiscard]] uint32_t numNames() const { return numNames_; }
    [[nodiscard]] size_t numTrigrams() const { return numTrigrams_; }
    [[nodiscard]] const std::filesystem::path& path() const { return file_.path(); }

    [[noreturn]] void corrupt(const std::string& detail) const;

private:
    [[nodiscard]] uint32_t nameOffset(FileId id) const;

    MappedFile file_;
    const uint8_t* base_ = nullptr;

    uint64_t pathsOffset_ = 0;
    uint64_t namesOffset_ = 0;
    uint64_t postingsOffset_ = 0;
    uint64_t nameIndexOffset_ = 0;
    uint64_t postIndexOffset_ = 0;
    uint64_t trailerOffset_ = 0;

    uint32_t numNames_ = 0;
    size_t numTrigrams_ = 0;
};

}
