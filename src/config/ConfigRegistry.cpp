#include "config/ConfigRegistry.hpp"
#include "util/paths.hpp"

#include <stdexcept>

namespace cs::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path);
        initialized_ = true;
    });
}

void ConfigRegistry::init() {
    init(paths::getConfigPath());
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace cs::config
