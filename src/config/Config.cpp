#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <type_traits>
#include <yaml-cpp/yaml.h>

namespace cs::config {

static void validate(const Config& cfg, const std::filesystem::path& path) {
    const auto fail = [&](const std::string& what) {
        throw std::runtime_error("Invalid config " + path.string() + ": " + what);
    };
    if (cfg.index.sort_buffer_mb == 0) fail("index.sort_buffer_mb must be positive");
    if (cfg.index.channel_capacity == 0) fail("index.channel_capacity must be positive");
    if (cfg.limits.max_invalid_utf8_ratio < 0.0 || cfg.limits.max_invalid_utf8_ratio > 1.0)
        fail("limits.max_invalid_utf8_ratio must be within [0, 1]");
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        const auto section = [&](const char* key, auto& out) {
            const auto node = root[key];
            if (!node) return;
            if (!YAML::convert<std::decay_t<decltype(out)>>::decode(node, out))
                throw std::runtime_error("Invalid config " + path.string() + ": " + key + " must be a mapping");
        };
        section("index", cfg.index);
        section("limits", cfg.limits);
        section("logging", cfg.logging);
        if (auto node = root["exclude"]) cfg.exclude = node.as<std::vector<std::string>>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config " + path.string() + ": " + e.what());
    }

    validate(cfg, path);
    return cfg;
}

std::string dumpConfig(const Config& cfg) {
    YAML::Node root;
    root["index"] = YAML::convert<IndexConfig>::encode(cfg.index);
    root["limits"] = YAML::convert<LimitsConfig>::encode(cfg.limits);
    root["exclude"] = cfg.exclude;
    root["logging"] = YAML::convert<LoggingConfig>::encode(cfg.logging);

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

}
