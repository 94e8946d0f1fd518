#include "config/ConfigRegistry.hpp"
#include "index/IndexReader.hpp"
#include "index/MappedFile.hpp"
#include "index/errors.hpp"
#include "log/Registry.hpp"
#include "query/QueryEvaluator.hpp"
#include "query/RegexpAnalyzer.hpp"
#include "util/args.hpp"
#include "util/paths.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <fmt/core.h>
#include <re2/re2.h>

using namespace cs;
using log::Registry;
using re2::RE2;
using re2::StringPiece;
namespace stdfs = std::filesystem;

namespace {

constexpr int EXIT_MATCH = 0;
constexpr int EXIT_NO_MATCH = 1;
constexpr int EXIT_ERROR = 2;

constexpr const auto* USAGE = R"(usage: csearch [options] regexp

Prints the lines of indexed files matching regexp (RE2 syntax).

Options:
  -i                  case-insensitive match
  -l                  print only the names of matching files
  -c                  print only a count of matching lines per file
  -n                  print line numbers
  -h                  omit file names
  -f FILEREGEXP       search only files whose names match FILEREGEXP
  --indexpath FILE    index file (default $CSEARCHINDEX or ~/.csearchindex)
  --config FILE       config file (default $CSEARCHCONFIG)
  --brute             skip the trigram index and scan every indexed file
  --verbose           debug logging, including the trigram query
  --help              print this message
)";

const std::unordered_set<std::string> VALUE_FLAGS = {"f", "indexpath", "config"};

const std::unordered_set<std::string> KNOWN_FLAGS = {
    "i", "l", "c", "n", "h", "f", "indexpath", "config", "brute", "verbose", "help"};

struct GrepOptions {
    bool listOnly = false;
    bool countOnly = false;
    bool lineNumbers = false;
    bool omitName = false;
};

// Number of matching lines in one file, printing as it goes.
uint64_t grepFile(const RE2& re, const std::string& name, const GrepOptions& o) {
    const index::MappedFile file{stdfs::path(name)};
    const auto data = file.data();
    const StringPiece text(reinterpret_cast<const char*>(data.data()), data.size());
    const size_t size = text.size();

    uint64_t matches = 0;
    uint64_t lineno = 1;
    size_t counted = 0;
    size_t pos = 0;
    StringPiece m;

    while (pos < size && re.Match(text, pos, size, RE2::UNANCHORED, &m, 1)) {
        const auto start = static_cast<size_t>(m.data() - text.data());

        size_t lineStart = start;
        while (lineStart > pos && text[lineStart - 1] != '\n') --lineStart;
        size_t lineEnd = text.find('\n', start);
        if (lineEnd == StringPiece::npos) lineEnd = size;

        ++matches;
        if (o.listOnly) {
            fmt::print("{}\n", name);
            return matches;
        }

        if (!o.countOnly) {
            const std::string_view line(text.data() + lineStart, lineEnd - lineStart);
            if (o.lineNumbers) {
                lineno += std::count(text.data() + counted, text.data() + lineStart, '\n');
                counted = lineStart;
                if (o.omitName) fmt::print("{}:{}\n", lineno, line);
                else fmt::print("{}:{}:{}\n", name, lineno, line);
            } else {
                if (o.omitName) fmt::print("{}\n", line);
                else fmt::print("{}:{}\n", name, line);
            }
        }

        pos = lineEnd + 1;
    }

    if (o.countOnly && matches > 0) {
        if (o.omitName) fmt::print("{}\n", matches);
        else fmt::print("{}:{}\n", name, matches);
    }
    return matches;
}

std::unique_ptr<RE2> compile(const std::string& pattern, const bool neverNewline) {
    RE2::Options opts;
    opts.set_log_errors(false);
    opts.set_never_nl(neverNewline);
    auto re = std::make_unique<RE2>(pattern, opts);
    if (!re->ok()) throw std::invalid_argument("invalid regexp `" + pattern + "`: " + re->error());
    return re;
}

int run(const util::CommandCall& call) {
    const auto cfgPath = util::optVal(call, "config");
    config::ConfigRegistry::init(cfgPath ? stdfs::path(*cfgPath) : paths::getConfigPath());
    Registry::init();
    if (util::hasFlag(call, "verbose")) Registry::setVerbose();

    const auto& cfg = config::ConfigRegistry::get();

    if (call.positionals.size() != 1) {
        std::cerr << USAGE;
        return EXIT_ERROR;
    }

    // lines are matched in place, so ^ and $ anchor at line boundaries
    std::string pattern = "(?m)";
    if (util::hasFlag(call, "i")) pattern += "(?i)";
    pattern += call.positionals.front();

    const auto re = compile(pattern, true);
    std::unique_ptr<RE2> fileRe;
    if (const auto f = util::optVal(call, "f")) fileRe = compile(*f, false);

    stdfs::path indexPath;
    if (const auto v = util::optVal(call, "indexpath")) indexPath = *v;
    else if (!cfg.index.path.empty()) indexPath = cfg.index.path;
    else indexPath = paths::getIndexPath();

    const index::IndexReader reader(indexPath);

    const auto q = util::hasFlag(call, "brute") ? query::Query::all() : query::regexpQuery(pattern);
    Registry::csearch()->debug("[csearch] query: {}", q.toString());

    auto ids = query::QueryEvaluator(reader).candidates(q);
    Registry::csearch()->debug("[csearch] {} of {} files are candidates", ids.size(), reader.numNames());

    if (fileRe) {
        std::erase_if(ids, [&](const index::FileId id) {
            const auto name = reader.name(id);
            return !RE2::PartialMatch(StringPiece(name.data(), name.size()), *fileRe);
        });
        Registry::csearch()->debug("[csearch] {} candidates after the file filter", ids.size());
    }

    GrepOptions opts;
    opts.listOnly = util::hasFlag(call, "l");
    opts.countOnly = util::hasFlag(call, "c");
    opts.lineNumbers = util::hasFlag(call, "n");
    opts.omitName = util::hasFlag(call, "h");

    uint64_t matches = 0;
    for (const auto id : ids) {
        const std::string name(reader.name(id));
        try {
            matches += grepFile(*re, name, opts);
        } catch (const index::IoError& e) {
            // removed or unreadable since it was indexed
            Registry::csearch()->warn("[csearch] {}", e.what());
        }
    }

    std::fflush(stdout);
    return matches > 0 ? EXIT_MATCH : EXIT_NO_MATCH;
}

}

int main(const int argc, char* argv[]) {
    util::CommandCall call;
    try {
        call = util::parseArgs(argc, argv, VALUE_FLAGS);
    } catch (const std::invalid_argument& e) {
        std::cerr << "csearch: " << e.what() << "\n" << USAGE;
        return EXIT_ERROR;
    }

    if (util::hasFlag(call, "help")) {
        std::cout << USAGE;
        return EXIT_SUCCESS;
    }
    if (const auto bad = util::unknownOption(call, KNOWN_FLAGS)) {
        std::cerr << "csearch: unknown option -" << *bad << "\n" << USAGE;
        return EXIT_ERROR;
    }

    try {
        return run(call);
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::csearch()->error("[csearch] {}", e.what());
        else std::cerr << "csearch: " << e.what() << std::endl;
        return EXIT_ERROR;
    }
}
