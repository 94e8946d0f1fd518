#include "fs/ExcludeList.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <cerrno>
#include <cstring>
#include <fnmatch.h>
#include <fstream>
#include <stdexcept>

namespace cs::fs {

ExcludeList::ExcludeList(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) add(p);
}

void ExcludeList::add(std::string pattern) {
    boost::algorithm::trim(pattern);
    if (pattern.empty() || pattern.front() == '#') return;
    patterns_.push_back(std::move(pattern));
}

void ExcludeList::loadFile(const std::filesystem::path& file) {
    for (auto& line : readLines(file)) add(std::move(line));
}

bool ExcludeList::matches(const std::filesystem::path& path) const {
    const std::string full = path.string();
    const std::string name = path.filename().string();
    for (const auto& p : patterns_) {
        const bool whole = p.find('/') != std::string::npos;
        if (::fnmatch(p.c_str(), whole ? full.c_str() : name.c_str(), whole ? FNM_PATHNAME : 0) == 0) return true;
    }
    return false;
}

std::vector<std::string> readLines(const std::filesystem::path& file) {
    std::ifstream in(file);
    if (!in) throw std::runtime_error("open " + file.string() + ": " + std::strerror(errno));

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        boost::algorithm::trim(line);
        if (!line.empty()) lines.push_back(std::move(line));
    }
    if (in.bad()) throw std::runtime_error("read " + file.string() + ": " + std::strerror(errno));
    return lines;
}

}
