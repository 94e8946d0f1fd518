#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace cs::config { struct LoggingConfig; }

namespace cs::log {

class Registry {
public:
    // Creates every subsystem logger from the logging config. Call once,
    // after config::ConfigRegistry::init().
    static void init();
    static void init(const config::LoggingConfig& cfg);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> cindex()  { return get("cindex"); }
    static std::shared_ptr<spdlog::logger> csearch() { return get("csearch"); }
    static std::shared_ptr<spdlog::logger> index()   { return get("index"); }
    static std::shared_ptr<spdlog::logger> query()   { return get("query"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("fs"); }

    // Drops every tool and subsystem logger to debug (--verbose).
    static void setVerbose();

    [[nodiscard]] static bool isInitialized();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

    static inline size_t file_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t file_max_files_ = 5;
};

}
