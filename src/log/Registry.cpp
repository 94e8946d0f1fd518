#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace cs::log {

void Registry::init() {
    init(config::ConfigRegistry::get().logging);
}

void Registry::init(const config::LoggingConfig& cfg) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cfg.console_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    if (!cfg.log_file.empty()) {
        namespace fs = std::filesystem;
        const fs::path logFile(cfg.log_file);
        if (logFile.has_parent_path() && !fs::exists(logFile.parent_path()))
            fs::create_directories(logFile.parent_path());

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(), file_max_bytes_, file_max_files_);
        file_sink_->set_level(cfg.file_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub = cfg.subsystem_levels;
    makeLogger("cindex", sub.cindex);
    makeLogger("csearch", sub.csearch);
    makeLogger("index", sub.index);
    makeLogger("query", sub.query);
    makeLogger("fs", sub.fs);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

void Registry::setVerbose() {
    if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized");
    console_sink_->set_level(spdlog::level::debug);
    for (const auto* name : {"cindex", "csearch", "index", "query", "fs"})
        get(name)->set_level(spdlog::level::debug);
}

bool Registry::isInitialized() { return initialized_; }

}
