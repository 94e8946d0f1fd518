#include "util/args.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

namespace cs::util {

static constexpr uintmax_t KILOBYTE = 1024;
static constexpr uintmax_t MEGABYTE = KILOBYTE * KILOBYTE;
static constexpr uintmax_t GIGABYTE = KILOBYTE * MEGABYTE;
static constexpr uintmax_t TERABYTE = KILOBYTE * GIGABYTE;

// Upsert a flag (last wins)
static void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options)
        if (k == key) {
            v = val;
            return;
        }
    c.options.push_back(FlagKV{key, val});
}

CommandCall parseArgs(const int argc, const char* const* argv, const std::unordered_set<std::string>& valueFlags) {
    CommandCall call;
    if (argc > 0) call.name = argv[0];

    bool stopFlags = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (stopFlags || arg.size() < 2 || arg[0] != '-') {
            call.positionals.push_back(arg);
            continue;
        }
        if (arg == "--") {
            stopFlags = true;
            continue;
        }

        std::string key = arg.substr(arg[1] == '-' ? 2 : 1);
        std::optional<std::string> value;
        if (const auto eq = key.find('='); eq != std::string::npos) {
            value = key.substr(eq + 1);
            key.resize(eq);
        } else if (valueFlags.contains(key)) {
            if (i + 1 >= argc) throw std::invalid_argument("flag needs an argument: " + arg);
            value = argv[++i];
        }

        if (value && !valueFlags.contains(key)) throw std::invalid_argument("flag does not take a value: " + arg);
        setOpt(call, key, value);
    }

    return call;
}

std::optional<std::string> optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

bool hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options)
        if (k == key) return !v.has_value();
    return false;
}

std::optional<std::string> unknownOption(const CommandCall& c, const std::unordered_set<std::string>& known) {
    for (const auto& [k, v] : c.options)
        if (!known.contains(k)) return k;
    return std::nullopt;
}

std::optional<unsigned int> parseUInt(const std::string& s) {
    if (s.empty()) return std::nullopt;

    unsigned long long v = 0; // wide enough for overflow check
    for (const char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(c - '0');
        if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    }
    return static_cast<unsigned int>(v);
}

uintmax_t parseSize(const std::string& s) {
    if (s.empty()) throw std::invalid_argument("empty size");

    uintmax_t unit = 1;
    switch (std::toupper(static_cast<unsigned char>(s.back()))) {
        case 'T': unit = TERABYTE; break;
        case 'G': unit = GIGABYTE; break;
        case 'M': unit = MEGABYTE; break;
        case 'K': unit = KILOBYTE; break;
        default: break;
    }

    const std::string digits = unit == 1 ? s : s.substr(0, s.size() - 1);
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](const char c) { return c >= '0' && c <= '9'; }))
        throw std::invalid_argument("invalid size: " + s);

    uintmax_t n;
    try {
        n = std::stoull(digits);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("size out of range: " + s);
    }
    if (n > std::numeric_limits<uintmax_t>::max() / unit) throw std::invalid_argument("size out of range: " + s);
    return n * unit;
}

double parseRatio(const std::string& s) {
    size_t used = 0;
    double v;
    try {
        v = std::stod(s, &used);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("invalid ratio: " + s);
    }
    if (used != s.size() || v < 0.0 || v > 1.0) throw std::invalid_argument("invalid ratio: " + s);
    return v;
}

}
