#pragma once

#include "index/Indexer.hpp"
#include "index/TrigramExtractor.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace cs::config {

constexpr static unsigned int DEFAULT_SORT_BUFFER_MB = index::DEFAULT_SORT_BUFFER_BYTES / (1024 * 1024);

struct IndexConfig {
    std::string path;    // empty: $CSEARCHINDEX or ~/.csearchindex
    std::string tmp_dir; // empty: system temp dir
    unsigned int sort_buffer_mb = DEFAULT_SORT_BUFFER_MB;
    unsigned int channel_capacity = index::DEFAULT_CHANNEL_CAPACITY;
    bool follow_symlinks = true;
};

struct LimitsConfig {
    uint64_t max_file_len = index::DEFAULT_MAX_FILE_LEN;
    uint32_t max_line_len = index::DEFAULT_MAX_LINE_LEN;
    uint32_t max_trigram_count = index::DEFAULT_MAX_TRIGRAM_COUNT;
    double max_invalid_utf8_ratio = index::DEFAULT_MAX_INVALID_UTF8_RATIO;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum cindex  = spdlog::level::info;  // progress of index builds
    spdlog::level::level_enum csearch = spdlog::level::warn;
    spdlog::level::level_enum index   = spdlog::level::warn;  // writer, reader, merger
    spdlog::level::level_enum query   = spdlog::level::warn;  // planner decisions at debug
    spdlog::level::level_enum fs      = spdlog::level::warn;  // unreadable directories, skipped entries
};

struct LoggingConfig {
    spdlog::level::level_enum console_level = spdlog::level::info;
    std::string log_file; // empty: console only
    spdlog::level::level_enum file_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    IndexConfig index;
    LimitsConfig limits;
    std::vector<std::string> exclude = {".csearchindex", ".git", ".hg", ".svn"};
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);
std::string dumpConfig(const Config& cfg);

}
