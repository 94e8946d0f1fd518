#include "index/stats.hpp"

#include <nlohmann/json.hpp>

void cs::fs::to_json(nlohmann::json& j, const WalkStats& s) {
    j = nlohmann::json{
        {"files", s.files},
        {"dirs", s.dirs},
        {"excluded", s.excluded},
        {"errors", s.errors},
    };
}

void cs::index::to_json(nlohmann::json& j, const WriterStats& s) {
    nlohmann::json skipped = nlohmann::json::object();
    for (const auto r : {SkipReason::TooLarge, SkipReason::LineTooLong, SkipReason::TooManyTrigrams,
                         SkipReason::InvalidEncoding})
        skipped[std::string(to_string(r))] = s.skippedFor(r);

    j = nlohmann::json{
        {"files", s.files},
        {"bytes", s.bytes},
        {"skipped", skipped},
        {"runs", s.runs},
        {"pairs", s.pairs},
        {"trigrams", s.trigrams},
        {"postings", s.postings},
        {"index_bytes", s.indexBytes},
    };
}

void cs::index::to_json(nlohmann::json& j, const IndexerStats& s) {
    j = nlohmann::json{
        {"received", s.received},
        {"duplicates", s.duplicates},
        {"errors", s.errors},
        {"writer", s.writer},
        {"walk", s.walk},
    };
}

void cs::index::to_json(nlohmann::json& j, const MergeStats& s) {
    j = nlohmann::json{
        {"files_old", s.files1},
        {"files_new", s.files2},
        {"dropped", s.dropped},
        {"files", s.files},
        {"trigrams", s.trigrams},
        {"postings", s.postings},
    };
}
