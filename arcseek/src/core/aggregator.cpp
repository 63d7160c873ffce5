// src/core/aggregator.cpp
#include "core/aggregator.hpp"
#include <algorithm>

namespace arsk {

ResultAggregator::ResultAggregator(const SearchQuery& q)
  : q_(q), predSatisfied_(q.predicates.size(), false)
{
  for (auto& n : q.names) {
    if (std::find(names_.begin(), names_.end(), n) == names_.end()) names_.push_back(n);
  }
  for (auto& n : names_) rs_.byName[n];
}

bool ResultAggregator::wantsName(const std::string& suffix) const {
  return !(q_.firstOnly && isFound(suffix));
}

void ResultAggregator::recordNameMatch(const std::string& suffix, MatchRecord rec) {
  rs_.byName[suffix].push_back(std::move(rec));
  if (q_.firstOnly) found_.insert(suffix);
}

void ResultAggregator::recordPredicateMatch(size_t predIndex, MatchRecord rec, const std::string& value) {
  const std::string& key = q_.predicates.at(predIndex).key;
  PredicateHits& hits = rs_.byPredicate[key];
  hits.files.push_back(std::move(rec));
  hits.lastValue = value;
  if (q_.firstOnly) predSatisfied_[predIndex] = true;
}

bool ResultAggregator::complete() const {
  if (!names_.empty()) return found_.size() == names_.size();
  if (q_.firstOnly && !predSatisfied_.empty()) {
    return std::all_of(predSatisfied_.begin(), predSatisfied_.end(), [](bool b){ return b; });
  }
  return false;
}

ResultSet ResultAggregator::finalize() {
  if (!q_.includeEmpty) {
    for (auto it = rs_.byName.begin(); it != rs_.byName.end(); ) {
      if (it->second.empty()) it = rs_.byName.erase(it);
      else ++it;
    }
  }
  return std::move(rs_);
}

} // namespace arsk
