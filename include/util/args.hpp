#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace cs::util {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

// Splits argv into options and positionals. "-x" and "--x" are the same
// option; keys in valueFlags consume the next argument unless given as
// --key=value. "--" ends option parsing. The last occurrence of a key wins.
CommandCall parseArgs(int argc, const char* const* argv, const std::unordered_set<std::string>& valueFlags);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);

// First option whose key is not in known, if any.
std::optional<std::string> unknownOption(const CommandCall& c, const std::unordered_set<std::string>& known);

std::optional<unsigned int> parseUInt(const std::string& s);

// Byte count with an optional K, M, G or T suffix. Throws std::invalid_argument.
uintmax_t parseSize(const std::string& s);

// Throws std::invalid_argument.
double parseRatio(const std::string& s);

}
