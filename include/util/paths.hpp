#pragma once

#include <filesystem>

namespace cs::paths {

// $CSEARCHINDEX, else $HOME/.csearchindex, else $USERPROFILE/.csearchindex.
std::filesystem::path getIndexPath();

// $CSEARCHCONFIG, else $XDG_CONFIG_HOME/codesearch/config.yaml,
// else $HOME/.config/codesearch/config.yaml.
std::filesystem::path getConfigPath();

// Absolute, lexically normal form used to de-duplicate walked paths.
std::filesystem::path normalize(const std::filesystem::path& p);

}
