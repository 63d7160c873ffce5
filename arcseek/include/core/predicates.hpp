#pragma once
#include "core/types.hpp"
#include <string>

namespace arsk {

// Built-in content predicates, keyed by their spec string:
//   contains:<text>    icontains:<text>   magic:<hex>
//   entropy>=<bits>    sha256:<hex>       minsize:<bytes>
bool parsePredicateSpec(const std::string& spec, Predicate& out, std::string& err);

Predicate containsPredicate(const std::string& key, const std::string& needle, bool caseSensitive);
Predicate magicPredicate(const std::string& key, const Bytes& prefix);
Predicate entropyPredicate(const std::string& key, double minBits);
Predicate sha256Predicate(const std::string& key, const std::string& hexDigest);
Predicate minSizePredicate(const std::string& key, uint64_t minBytes);

bool parseHex(const std::string& hex, Bytes& out);

} // namespace arsk
