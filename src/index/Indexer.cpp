#include "index/Indexer.hpp"
#include "concurrency/Channel.hpp"
#include "index/errors.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

#include <exception>
#include <thread>
#include <unordered_set>

namespace cs::index {

using log::Registry;

Indexer::Indexer(std::filesystem::path output, IndexerOptions options, fs::ExcludeList excludes,
                 std::shared_ptr<std::atomic<bool>> interruptFlag)
    : output_(std::move(output)),
      options_(std::move(options)),
      excludes_(std::move(excludes)),
      interruptFlag_(std::move(interruptFlag)) {}

bool Indexer::build(const std::vector<std::string>& roots) {
    stats_ = {};

    IndexWriter writer(output_, options_.writer);
    writer.addPaths(roots);

    concurrency::Channel<std::filesystem::path> channel(options_.channel_capacity);
    fs::DirWalker walker(excludes_, options_.walk);
    std::exception_ptr walkError;

    std::thread producer([&] {
        try {
            for (const auto& root : roots) {
                const bool more = walker.walk(root, [&](const std::filesystem::path& p) {
                    return !interrupted() && channel.send(p);
                });
                if (!more) break;
            }
        } catch (const std::exception& e) {
            if (Registry::isInitialized())
                Registry::fs()->error("[Indexer] [walk] {}", e.what());
            walkError = std::current_exception();
        }
        channel.close();
    });

    auto stopProducer = [&] {
        channel.close();
        if (producer.joinable()) producer.join();
    };

    try {
        std::unordered_set<std::string> seen;
        while (auto p = channel.receive()) {
            if (interrupted()) break;
            ++stats_.received;

            if (!seen.insert(cs::paths::normalize(*p).string()).second) {
                ++stats_.duplicates;
                continue;
            }

            try {
                const auto reason = writer.addFile(*p);
                if (reason && options_.log_skipped && Registry::isInitialized())
                    Registry::cindex()->info("[Indexer] [build] Skipped {}: {}", p->string(), to_string(*reason));
                if (options_.on_file) options_.on_file(*p);
            } catch (const IoError& e) {
                // errors on temp files abort the build
                if (e.path() != *p) throw;
                ++stats_.errors;
                if (Registry::isInitialized())
                    Registry::cindex()->warn("[Indexer] [build] {}", e.what());
            } catch (const UnsortedInput& e) {
                ++stats_.errors;
                if (Registry::isInitialized())
                    Registry::cindex()->warn("[Indexer] [build] {}", e.what());
            }
        }
    } catch (const std::exception&) {
        stopProducer();
        throw;
    }
    stopProducer();
    stats_.walk = walker.stats();

    if (walkError) std::rethrow_exception(walkError);

    if (interrupted()) {
        if (Registry::isInitialized())
            Registry::cindex()->warn("[Indexer] [build] Interrupted after {} files; {} not written",
                                     writer.stats().files, output_.string());
        std::error_code ec;
        std::filesystem::remove(output_, ec);
        return false;
    }

    writer.flush();
    stats_.writer = writer.stats();

    if (Registry::isInitialized())
        Registry::cindex()->info("[Indexer] [build] {} files indexed, {} skipped, {} unreadable, {} duplicates",
                                 stats_.writer.files, stats_.writer.skippedTotal(), stats_.errors, stats_.duplicates);
    return true;
}

}
