#include "fs/DirWalker.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

#include <algorithm>
#include <sys/stat.h>

namespace cs::fs {

namespace stdfs = std::filesystem;
using log::Registry;

namespace {

bool dirIdentity(const stdfs::path& dir, std::pair<uint64_t, uint64_t>& id) {
    struct stat sb{};
    if (::stat(dir.c_str(), &sb) != 0) return false;
    id = {static_cast<uint64_t>(sb.st_dev), static_cast<uint64_t>(sb.st_ino)};
    return true;
}

}

DirWalker::DirWalker(ExcludeList excludes, const WalkOptions options)
    : excludes_(std::move(excludes)), options_(options) {}

bool DirWalker::walk(const stdfs::path& root, const Visitor& visit) {
    std::error_code ec;
    const auto st = options_.follow_symlinks ? stdfs::status(root, ec) : stdfs::symlink_status(root, ec);
    if (ec) {
        ++stats_.errors;
        if (Registry::isInitialized())
            Registry::fs()->warn("[DirWalker] [walk] Cannot stat {}: {}", root.string(), ec.message());
        return true;
    }

    if (stdfs::is_directory(st)) return walkDir(root, visit);
    if (stdfs::is_regular_file(st)) {
        ++stats_.files;
        return visit(root);
    }

    if (Registry::isInitialized())
        Registry::fs()->debug("[DirWalker] [walk] Skipping {}: not a regular file or directory", root.string());
    return true;
}

std::vector<DirWalker::Entry> DirWalker::list(const stdfs::path& dir) {
    std::vector<Entry> entries;
    std::error_code ec;
    stdfs::directory_iterator it(dir, ec);
    if (ec) {
        ++stats_.errors;
        if (Registry::isInitialized())
            Registry::fs()->warn("[DirWalker] [list] Cannot read directory {}: {}", dir.string(), ec.message());
        return entries;
    }

    for (; it != stdfs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& path = it->path();

        if (excludes_.matches(path)) {
            ++stats_.excluded;
            if (Registry::isInitialized())
                Registry::fs()->debug("[DirWalker] [list] Excluded {}", path.string());
            continue;
        }

        std::error_code sec;
        const auto lst = it->symlink_status(sec);
        if (sec) {
            ++stats_.errors;
            if (Registry::isInitialized())
                Registry::fs()->warn("[DirWalker] [list] Cannot stat {}: {}", path.string(), sec.message());
            continue;
        }

        auto st = lst;
        if (stdfs::is_symlink(lst)) {
            if (!options_.follow_symlinks) continue;
            st = it->status(sec);
            if (sec) {
                if (Registry::isInitialized())
                    Registry::fs()->debug("[DirWalker] [list] Skipping broken link {}", path.string());
                continue;
            }
        }

        const std::string name = path.filename().string();
        if (stdfs::is_directory(st)) entries.push_back({name + "/", path, true});
        else if (stdfs::is_regular_file(st)) entries.push_back({name, path, false});
    }

    if (ec) {
        ++stats_.errors;
        if (Registry::isInitialized())
            Registry::fs()->warn("[DirWalker] [list] Error reading directory {}: {}", dir.string(), ec.message());
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) { return a.key < b.key; });
    return entries;
}

bool DirWalker::walkDir(const stdfs::path& dir, const Visitor& visit) {
    std::pair<uint64_t, uint64_t> id;
    const bool known = dirIdentity(dir, id);
    if (known && !active_.insert(id).second) {
        if (Registry::isInitialized())
            Registry::fs()->debug("[DirWalker] [walkDir] Skipping {}: symlink cycle", dir.string());
        return true;
    }
    ++stats_.dirs;

    bool keepGoing = true;
    for (const auto& e : list(dir)) {
        if (e.dir) keepGoing = walkDir(e.path, visit);
        else {
            ++stats_.files;
            keepGoing = visit(e.path);
        }
        if (!keepGoing) break;
    }

    if (known) active_.erase(id);
    return keepGoing;
}

std::vector<std::string> prepareRoots(const std::vector<std::string>& paths) {
    struct Root {
        std::string key;
        std::string path;
        bool dir;
    };

    std::vector<Root> roots;
    for (const auto& p : paths) {
        if (p.empty()) continue;
        const std::string abs = cs::paths::normalize(p).string();
        std::error_code ec;
        const bool dir = stdfs::is_directory(abs, ec);
        roots.push_back({dir && !abs.ends_with('/') ? abs + "/" : abs, abs, dir});
    }
    std::sort(roots.begin(), roots.end(), [](const Root& a, const Root& b) { return a.key < b.key; });

    std::vector<std::string> out;
    std::string parent; // key of the last directory root kept
    for (const auto& r : roots) {
        if (!out.empty() && r.path == out.back()) continue;
        if (!parent.empty() && r.key.starts_with(parent)) continue;
        out.push_back(r.path);
        parent = r.dir ? r.key : std::string{};
    }
    return out;
}

}
