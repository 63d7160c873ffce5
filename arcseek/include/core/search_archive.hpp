#pragma once
#include "core/types.hpp"
#include "readers/IArchiveReader.hpp"

namespace arsk {

// Rejects queries with no criteria and predicates with empty, duplicate or
// unbound keys. Runs before any I/O.
bool validateQuery(const SearchQuery& q, SearchError& err);

// Searches src (and, when q.recursive, containers nested in it) for members
// matching q. On success 'out' receives the finalized result set. On failure
// 'err' is filled and 'out' is left untouched.
bool search(const ByteSource& src, const SearchQuery& q, ResultSet& out, SearchError& err);

// Same, with a caller-supplied reader factory.
bool search(const ByteSource& src, const SearchQuery& q, ResultSet& out, SearchError& err,
            const ReaderFactory& factory);

} // namespace arsk
