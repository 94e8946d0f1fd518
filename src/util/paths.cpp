#include "util/paths.hpp"

#include <cstdlib>
#include <stdexcept>

namespace cs::paths {

static const char* env(const char* name) {
    const char* v = std::getenv(name);
    return v && *v ? v : nullptr;
}

std::filesystem::path getIndexPath() {
    if (const char* p = env("CSEARCHINDEX")) return p;
    if (const char* home = env("HOME")) return std::filesystem::path(home) / ".csearchindex";
    if (const char* profile = env("USERPROFILE")) return std::filesystem::path(profile) / ".csearchindex";
    throw std::runtime_error("no index path: set $CSEARCHINDEX or $HOME");
}

std::filesystem::path getConfigPath() {
    if (const char* p = env("CSEARCHCONFIG")) return p;
    if (const char* xdg = env("XDG_CONFIG_HOME")) return std::filesystem::path(xdg) / "codesearch" / "config.yaml";
    if (const char* home = env("HOME")) return std::filesystem::path(home) / ".config" / "codesearch" / "config.yaml";
    return {};
}

std::filesystem::path normalize(const std::filesystem::path& p) {
    std::error_code ec;
    auto abs = std::filesystem::absolute(p, ec);
    if (ec) abs = p;
    auto out = abs.lexically_normal();
    // "dir/" normalizes to "dir/" with an empty filename; drop the separator
    if (!out.has_filename() && out.has_parent_path() && out != out.root_path()) out = out.parent_path();
    return out;
}

}
