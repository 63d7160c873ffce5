// src/core/matcher.cpp
#include "core/matcher.hpp"
#include <algorithm>
#include <cctype>

namespace arsk {

static bool ieq(char a, char b) {
  return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

bool matchByName(const std::string& memberName, const std::string& targetSuffix, bool caseSensitive) {
  if (targetSuffix.size() > memberName.size()) return false;
  auto tail = memberName.end() - static_cast<std::ptrdiff_t>(targetSuffix.size());
  if (caseSensitive) return std::equal(tail, memberName.end(), targetSuffix.begin());
  return std::equal(tail, memberName.end(), targetSuffix.begin(), ieq);
}

std::optional<PredicateHit> matchByPredicates(const Bytes& bytes,
                                              const std::vector<Predicate>& predicates,
                                              const std::vector<bool>& skip) {
  for (size_t i = 0; i < predicates.size(); ++i) {
    if (i < skip.size() && skip[i]) continue;
    if (!predicates[i].fn) continue;
    Verdict v = predicates[i].fn(bytes);
    if (v) return PredicateHit{i, std::move(v)};
  }
  return std::nullopt;
}

} // namespace arsk
