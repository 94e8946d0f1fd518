#pragma once

#include "index/IndexMerger.hpp"
#include "index/Indexer.hpp"

#include <nlohmann/json_fwd.hpp>

namespace cs::fs {

void to_json(nlohmann::json& j, const WalkStats& s);

}

namespace cs::index {

void to_json(nlohmann::json& j, const WriterStats& s);
void to_json(nlohmann::json& j, const IndexerStats& s);
void to_json(nlohmann::json& j, const MergeStats& s);

}
