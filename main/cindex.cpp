#include "config/ConfigRegistry.hpp"
#include "fs/DirWalker.hpp"
#include "fs/ExcludeList.hpp"
#include "index/IndexMerger.hpp"
#include "index/IndexReader.hpp"
#include "index/Indexer.hpp"
#include "index/errors.hpp"
#include "index/stats.hpp"
#include "log/Registry.hpp"
#include "util/args.hpp"
#include "util/paths.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

using namespace cs;
using log::Registry;
namespace stdfs = std::filesystem;

namespace {

std::atomic<bool> shouldExit{false};

void signalHandler(const int) { shouldExit = true; }

constexpr const auto* USAGE = R"(usage: cindex [options] [path...]

Adds the named files and directories to the index. With no paths, re-indexes
the paths already in the index.

Options:
  --list                      list the indexed paths and exit
  --reset                     discard the existing index; with no paths, just delete it
  --indexpath FILE            index file (default $CSEARCHINDEX or ~/.csearchindex)
  --config FILE               config file (default $CSEARCHCONFIG)
  --no-follow-symlinks        do not descend into symlinked directories
  --maxFileLen N              skip files larger than N bytes (K, M, G suffixes)
  --maxLineLen N              skip files with a line longer than N bytes
  --maxtrigrams N             skip files with more than N distinct trigrams
  --maxinvalidutf8ratio R     skip files whose invalid UTF-8 share exceeds R
  --exclude FILE              file of glob patterns to leave out, one per line
  --filelist FILE             file of paths to index, one per line
  --logskip                   log every skipped file
  --json                      print build statistics as JSON on stdout
  --verbose                   debug logging
  --help                      print this message
)";

const std::unordered_set<std::string> VALUE_FLAGS = {
    "indexpath", "config", "maxFileLen", "maxLineLen", "maxtrigrams", "maxinvalidutf8ratio", "exclude", "filelist"};

const std::unordered_set<std::string> KNOWN_FLAGS = {
    "indexpath", "config", "maxFileLen", "maxLineLen", "maxtrigrams", "maxinvalidutf8ratio", "exclude",
    "filelist", "list", "reset", "no-follow-symlinks", "logskip", "json", "verbose", "help"};

uint32_t uintFlag(const util::CommandCall& call, const std::string& key, const uint32_t def) {
    const auto v = util::optVal(call, key);
    if (!v) return def;
    const auto n = util::parseUInt(*v);
    if (!n) throw std::invalid_argument("--" + key + ": not a number: " + *v);
    return *n;
}

index::IndexerOptions buildOptions(const util::CommandCall& call, const config::Config& cfg) {
    index::IndexerOptions opts;

    auto& limits = opts.writer.limits;
    limits.max_file_len = cfg.limits.max_file_len;
    if (const auto v = util::optVal(call, "maxFileLen")) limits.max_file_len = util::parseSize(*v);
    limits.max_line_len = uintFlag(call, "maxLineLen", cfg.limits.max_line_len);
    limits.max_trigram_count = uintFlag(call, "maxtrigrams", cfg.limits.max_trigram_count);
    limits.max_invalid_utf8_ratio = cfg.limits.max_invalid_utf8_ratio;
    if (const auto v = util::optVal(call, "maxinvalidutf8ratio")) limits.max_invalid_utf8_ratio = util::parseRatio(*v);

    opts.writer.sort_buffer_bytes = static_cast<size_t>(cfg.index.sort_buffer_mb) * 1024 * 1024;
    opts.writer.tmp_dir = cfg.index.tmp_dir;
    opts.walk.follow_symlinks = cfg.index.follow_symlinks && !util::hasFlag(call, "no-follow-symlinks");
    opts.channel_capacity = cfg.index.channel_capacity;
    opts.log_skipped = util::hasFlag(call, "logskip");
    if (util::hasFlag(call, "verbose"))
        opts.on_file = [](const stdfs::path& p) { Registry::cindex()->debug("[cindex] [build] {}", p.string()); };
    return opts;
}

void renameOver(const stdfs::path& from, const stdfs::path& to) {
    std::error_code ec;
    stdfs::rename(from, to, ec);
    if (ec) throw index::IoError(to, "rename", ec.value());
}

void removeQuietly(const stdfs::path& p) {
    std::error_code ec;
    stdfs::remove(p, ec);
    if (ec) Registry::cindex()->warn("[cindex] Could not remove {}: {}", p.string(), ec.message());
}

int run(const util::CommandCall& call) {
    const auto cfgPath = util::optVal(call, "config");
    config::ConfigRegistry::init(cfgPath ? stdfs::path(*cfgPath) : paths::getConfigPath());
    Registry::init();
    if (util::hasFlag(call, "verbose")) Registry::setVerbose();

    const auto& cfg = config::ConfigRegistry::get();

    stdfs::path indexPath;
    if (const auto v = util::optVal(call, "indexpath")) indexPath = *v;
    else if (!cfg.index.path.empty()) indexPath = cfg.index.path;
    else indexPath = paths::getIndexPath();

    if (util::hasFlag(call, "list")) {
        const index::IndexReader reader(indexPath);
        for (const auto p : reader.indexedPaths()) fmt::print("{}\n", p);
        return EXIT_SUCCESS;
    }

    bool reset = util::hasFlag(call, "reset");

    std::vector<std::string> inputs = call.positionals;
    if (const auto v = util::optVal(call, "filelist")) {
        const auto lines = fs::readLines(*v);
        inputs.insert(inputs.end(), lines.begin(), lines.end());
    }

    if (inputs.empty()) {
        if (reset) {
            std::error_code ec;
            if (stdfs::remove(indexPath, ec)) Registry::cindex()->info("[cindex] Removed {}", indexPath.string());
            if (ec) throw index::IoError(indexPath, "remove", ec.value());
            return EXIT_SUCCESS;
        }
        if (!stdfs::exists(indexPath))
            throw std::runtime_error("no paths given and no index at " + indexPath.string());

        const index::IndexReader reader(indexPath);
        inputs = reader.indexedPaths().toVector();
        reset = true;
        Registry::cindex()->info("[cindex] Re-indexing {} paths from {}", inputs.size(), indexPath.string());
    }

    fs::ExcludeList excludes(cfg.exclude);
    if (const auto v = util::optVal(call, "exclude")) excludes.loadFile(*v);

    const auto roots = fs::prepareRoots(inputs);
    for (const auto& root : roots) Registry::cindex()->info("[cindex] Indexing {}", root);

    const stdfs::path fresh = indexPath.string() + "~";
    const stdfs::path merged = indexPath.string() + "~~";

    // the flag outlives every Indexer, so the shared_ptr only aliases it
    const std::shared_ptr<std::atomic<bool>> interruptFlag(std::shared_ptr<void>{}, &shouldExit);

    index::Indexer indexer(fresh, buildOptions(call, cfg), std::move(excludes), interruptFlag);
    if (!indexer.build(roots)) {
        Registry::cindex()->warn("[cindex] Interrupted, {} left unchanged", indexPath.string());
        return EXIT_FAILURE;
    }

    nlohmann::json report{{"index", indexPath.string()}, {"roots", roots}, {"build", indexer.stats()}};

    if (!reset && stdfs::exists(indexPath)) {
        Registry::cindex()->info("[cindex] Merging into {}", indexPath.string());
        try {
            const auto st = index::merge(merged, indexPath, fresh, index::MergeMode::Supersede, cfg.index.tmp_dir);
            Registry::cindex()->info("[cindex] {} files kept, {} replaced, {} total",
                                     st.files1 - st.dropped, st.dropped, st.files);
            report["merge"] = st;
        } catch (const std::exception&) {
            removeQuietly(fresh);
            throw;
        }
        renameOver(merged, indexPath);
        removeQuietly(fresh);
    } else {
        renameOver(fresh, indexPath);
    }

    Registry::cindex()->info("[cindex] Done: {}", indexPath.string());
    if (util::hasFlag(call, "json")) fmt::print("{}\n", report.dump(2));
    return EXIT_SUCCESS;
}

}

int main(const int argc, char* argv[]) {
    util::CommandCall call;
    try {
        call = util::parseArgs(argc, argv, VALUE_FLAGS);
    } catch (const std::invalid_argument& e) {
        std::cerr << "cindex: " << e.what() << "\n" << USAGE;
        return 2;
    }

    if (util::hasFlag(call, "help")) {
        std::cout << USAGE;
        return EXIT_SUCCESS;
    }
    if (const auto bad = util::unknownOption(call, KNOWN_FLAGS)) {
        std::cerr << "cindex: unknown option --" << *bad << "\n" << USAGE;
        return 2;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        return run(call);
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::cindex()->error("[cindex] {}", e.what());
        else std::cerr << "cindex: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
