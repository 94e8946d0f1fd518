#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace cs::config;

template<>
struct convert<IndexConfig> {
    static Node encode(const IndexConfig& rhs) {
        Node node;
        node["path"] = rhs.path;
        node["tmp_dir"] = rhs.tmp_dir;
        node["sort_buffer_mb"] = rhs.sort_buffer_mb;
        node["channel_capacity"] = rhs.channel_capacity;
        node["follow_symlinks"] = rhs.follow_symlinks;
        return node;
    }

    static bool decode(const Node& node, IndexConfig& rhs) {
        if (!node.IsMap()) return false;
        const IndexConfig def;
        rhs.path = node["path"].as<std::string>(def.path);
        rhs.tmp_dir = node["tmp_dir"].as<std::string>(def.tmp_dir);
        rhs.sort_buffer_mb = node["sort_buffer_mb"].as<unsigned int>(def.sort_buffer_mb);
        rhs.channel_capacity = node["channel_capacity"].as<unsigned int>(def.channel_capacity);
        rhs.follow_symlinks = node["follow_symlinks"].as<bool>(def.follow_symlinks);
        return true;
    }
};

template<>
struct convert<LimitsConfig> {
    static Node encode(const LimitsConfig& rhs) {
        Node node;
        node["max_file_len"] = rhs.max_file_len;
        node["max_line_len"] = rhs.max_line_len;
        node["max_trigram_count"] = rhs.max_trigram_count;
        node["max_invalid_utf8_ratio"] = rhs.max_invalid_utf8_ratio;
        return node;
    }

    static bool decode(const Node& node, LimitsConfig& rhs) {
        if (!node.IsMap()) return false;
        const LimitsConfig def;
        rhs.max_file_len = node["max_file_len"].as<uint64_t>(def.max_file_len);
        rhs.max_line_len = node["max_line_len"].as<uint32_t>(def.max_line_len);
        rhs.max_trigram_count = node["max_trigram_count"].as<uint32_t>(def.max_trigram_count);
        rhs.max_invalid_utf8_ratio = node["max_invalid_utf8_ratio"].as<double>(def.max_invalid_utf8_ratio);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static spdlog::level::level_enum levelOr(const Node& node, const spdlog::level::level_enum def) {
    if (!node) return def;
    return spdlog::level::from_str(node.as<std::string>());
}

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["cindex"]  = to_std_string(spdlog::level::to_string_view(rhs.cindex));
        node["csearch"] = to_std_string(spdlog::level::to_string_view(rhs.csearch));
        node["index"]   = to_std_string(spdlog::level::to_string_view(rhs.index));
        node["query"]   = to_std_string(spdlog::level::to_string_view(rhs.query));
        node["fs"]      = to_std_string(spdlog::level::to_string_view(rhs.fs));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cindex  = levelOr(node["cindex"], spdlog::level::info);
        rhs.csearch = levelOr(node["csearch"], spdlog::level::warn);
        rhs.index   = levelOr(node["index"], spdlog::level::warn);
        rhs.query   = levelOr(node["query"], spdlog::level::warn);
        rhs.fs      = levelOr(node["fs"], spdlog::level::warn);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["console_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_level));
        node["log_file"] = rhs.log_file;
        node["file_level"] = to_std_string(spdlog::level::to_string_view(rhs.file_level));
        node["subsystem_levels"] = convert<SubsystemLogLevelsConfig>::encode(rhs.subsystem_levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_level = levelOr(node["console_level"], spdlog::level::info);
        rhs.log_file = node["log_file"].as<std::string>("");
        rhs.file_level = levelOr(node["file_level"], spdlog::level::info);
        if (node["subsystem_levels"])
            return convert<SubsystemLogLevelsConfig>::decode(node["subsystem_levels"], rhs.subsystem_levels);
        return true;
    }
};

}
