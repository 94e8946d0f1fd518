#pragma once

#include "query/Query.hpp"
#include "query/Regexp.hpp"

#include <string_view>

namespace cs::query {

// Limits on the string sets tracked per subexpression.
constexpr size_t MAX_EXACT = 7;
constexpr size_t MAX_SET = 20;

// Bounded repetition up to this count is expanded before analysis.
constexpr int MAX_UNROLL = 8;

// Trigram query every match of re must satisfy. Never rejects a file that
// contains a match; "+" when nothing useful can be derived.
Query regexpQuery(const Regexp& re);
Query regexpQuery(std::string_view pattern);

}
