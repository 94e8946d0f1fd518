#include "query/QueryEvaluator.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>

namespace cs::query {

using index::FileId;
using index::Trigram;

namespace {

Trigram toTrigram(const std::string& s) { return index::trigramFromString(s); }

}

std::vector<FileId> QueryEvaluator::candidates(const Query& q) const {
    auto ids = eval(q, nullptr);
    if (log::Registry::isInitialized())
        log::Registry::query()->debug("[QueryEvaluator] {} => {} of {} files", q.toString(), ids.size(),
                                      reader_.numNames());
    return ids;
}

std::vector<FileId> QueryEvaluator::candidates(const Query& q, const std::vector<FileId>& within) const {
    return eval(q, &within);
}

QueryEvaluator::IdList QueryEvaluator::eval(const Query& q, const IdList* within) const {
    switch (q.op) {
        case QueryOp::None:
            return {};

        case QueryOp::All: {
            if (within) return *within;
            IdList all(reader_.numNames());
            std::iota(all.begin(), all.end(), FileId{0});
            return all;
        }

        case QueryOp::And: {
            if (q.trigrams.empty() && q.subs.empty()) return eval(Query::all(), within);

            IdList list;
            bool have = false;
            for (const auto& t : q.trigrams) {
                list = have ? postingAnd(list, toTrigram(t)) : postingList(toTrigram(t), within);
                have = true;
                if (list.empty()) return {};
            }
            for (const auto& sub : q.subs) {
                IdList next = eval(sub, have ? &list : within);
                list = std::move(next);
                have = true;
                if (list.empty()) return {};
            }
            return list;
        }

        case QueryOp::Or: {
            IdList list;
            for (const auto& t : q.trigrams) list = postingOr(list, toTrigram(t), within);
            for (const auto& sub : q.subs) {
                const IdList other = eval(sub, within);
                IdList merged;
                merged.reserve(list.size() + other.size());
                std::set_union(list.begin(), list.end(), other.begin(), other.end(), std::back_inserter(merged));
                list = std::move(merged);
            }
            return list;
        }
    }
    return {};
}

QueryEvaluator::IdList QueryEvaluator::postingList(const Trigram t, const IdList* within) const {
    IdList out;
    const auto list = reader_.postingList(t);
    if (!within) {
        out.reserve(std::min<size_t>(list.size(), reader_.numNames()));
        for (auto it = list.begin(); it != list.end(); ++it) out.push_back(*it);
        return out;
    }

    auto r = within->begin();
    for (auto it = list.begin(); it != list.end() && r != within->end(); ++it) {
        while (r != within->end() && *r < *it) ++r;
        if (r != within->end() && *r == *it) out.push_back(*it);
    }
    return out;
}

QueryEvaluator::IdList QueryEvaluator::postingAnd(const IdList& list, const Trigram t) const {
    return postingList(t, &list);
}

QueryEvaluator::IdList QueryEvaluator::postingOr(const IdList& list, const Trigram t, const IdList* within) const {
    const IdList add = postingList(t, within);
    IdList out;
    out.reserve(list.size() + add.size());
    std::set_union(list.begin(), list.end(), add.begin(), add.end(), std::back_inserter(out));
    return out;
}

}
