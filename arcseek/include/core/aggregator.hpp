#pragma once
#include "core/types.hpp"
#include <set>
#include <string>
#include <vector>

namespace arsk {

// Owns the result set and the found set for one top-level search. Recursive
// calls into nested containers receive the same instance by reference, so it
// is non-copyable and has exactly one writer: the traversal holding it.
class ResultAggregator {
public:
  explicit ResultAggregator(const SearchQuery& q);
  ResultAggregator(const ResultAggregator&) = delete;
  ResultAggregator& operator=(const ResultAggregator&) = delete;

  // Requested suffixes, duplicates removed, in request order.
  const std::vector<std::string>& names() const { return names_; }

  // Only first-only queries mark a suffix found.
  bool isFound(const std::string& suffix) const { return found_.count(suffix) != 0; }
  // false when first-only suppresses further matches for this suffix
  bool wantsName(const std::string& suffix) const;

  void recordNameMatch(const std::string& suffix, MatchRecord rec);
  void recordPredicateMatch(size_t predIndex, MatchRecord rec, const std::string& value);

  // Predicates already hit; only populated under first-only.
  const std::vector<bool>& satisfiedPredicates() const { return predSatisfied_; }

  // First-only queries: every requested name found (or, with no names, every
  // predicate hit). Traversal stops at every level once this is true.
  bool complete() const;

  size_t foundCount() const { return found_.size(); }
  const ResultSet& results() const { return rs_; }

  // Drops empty name keys unless include-empty is set, and hands the result over.
  ResultSet finalize();

private:
  const SearchQuery&       q_;
  std::vector<std::string> names_;
  std::set<std::string>    found_;
  std::vector<bool>        predSatisfied_;
  ResultSet                rs_;
};

} // namespace arsk
