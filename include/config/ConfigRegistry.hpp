#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace cs::config {

class ConfigRegistry {
public:
    // Loads the config file once; a missing file leaves every default in place.
    static void init(const std::filesystem::path& path);
    static void init();
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace cs::config
