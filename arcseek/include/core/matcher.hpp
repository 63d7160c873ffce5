#pragma once
#include "core/types.hpp"
#include <optional>
#include <string>

namespace arsk {

struct PredicateHit {
  size_t  index = 0;    // position in SearchQuery::predicates
  Verdict verdict;
};

// Suffix test, not path equality: "a/b/file.txt" matches "file.txt".
bool matchByName(const std::string& memberName, const std::string& targetSuffix, bool caseSensitive);

// First predicate (in order) whose verdict is a hit. Later predicates are not
// evaluated. 'skip' marks predicates to pass over (already satisfied under
// first-only); it may be empty.
std::optional<PredicateHit> matchByPredicates(const Bytes& bytes,
                                              const std::vector<Predicate>& predicates,
                                              const std::vector<bool>& skip = {});

} // namespace arsk
