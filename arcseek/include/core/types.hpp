#pragma once
#include <string>
#include <vector>
#include <map>
#include <functional>
#include <filesystem>
#include <cstdint>

namespace arsk {

using Bytes = std::vector<uint8_t>;

enum class ArchiveFormat { Zip, SevenZip, Unknown };
enum class ErrorKind     { None, Configuration, UnsupportedFormat, Io };

struct Limits {
  uint32_t maxDepth = 16;          // 0 = unbounded
  bool     detectCycles = true;
  uint64_t maxEntryBytes = 0;      // 0 = unbounded
};

// Result of one predicate evaluation. 'hit' is the verdict, 'value' is kept
// as the predicate's last return value in the result set.
struct Verdict {
  bool        hit = false;
  std::string value;

  explicit operator bool() const { return hit; }
};

using PredicateFn = std::function<Verdict(const Bytes&)>;

struct Predicate {
  std::string key;   // caller supplied, unique per query
  PredicateFn fn;
};

// Either a filesystem path or an in-memory buffer.
struct ByteSource {
  std::filesystem::path path;
  Bytes                 data;
  bool                  inMemory = false;

  static ByteSource fromPath(const std::filesystem::path& p) {
    ByteSource s; s.path = p; return s;
  }
  static ByteSource fromBytes(Bytes b) {
    ByteSource s; s.data = std::move(b); s.inMemory = true; return s;
  }
  std::string label() const { return inMemory ? std::string("<memory>") : path.string(); }
};

struct SearchQuery {
  std::vector<std::string> names;       // member name suffixes
  std::vector<Predicate>   predicates;  // evaluated in order, first hit wins
  bool caseSensitive = true;
  bool firstOnly = false;
  bool includeEmpty = false;
  bool recursive = false;
  std::filesystem::path extractTo;      // empty = no extraction
  std::string mediaTypeHint;            // advisory only
  Limits limits;
};

struct MatchRecord {
  Bytes       bytes;
  std::string name;
  uint64_t    size = 0;
  int64_t     mtime = 0;      // unix seconds, 0 if the container has none
  std::string container;      // "outer.zip>inner.zip"
};

struct PredicateHits {
  std::vector<MatchRecord> files;
  std::string              lastValue;
};

struct ResultSet {
  std::map<std::string, std::vector<MatchRecord>> byName;
  std::map<std::string, PredicateHits>            byPredicate;

  bool empty() const { return byName.empty() && byPredicate.empty(); }
  size_t matchCount() const {
    size_t n = 0;
    for (auto& kv : byName) n += kv.second.size();
    for (auto& kv : byPredicate) n += kv.second.files.size();
    return n;
  }
};

struct SearchError {
  ErrorKind   kind = ErrorKind::None;
  std::string message;
  std::string path;      // offending source / member
};

inline const char* toString(ArchiveFormat f) {
  switch (f) { case ArchiveFormat::Zip: return "zip";
               case ArchiveFormat::SevenZip: return "7z";
               default: return "unknown"; }
}
inline const char* toString(ErrorKind k) {
  switch (k) { case ErrorKind::None: return "none";
               case ErrorKind::Configuration: return "configuration";
               case ErrorKind::UnsupportedFormat: return "unsupported_format";
               case ErrorKind::Io: return "io"; }
  return "io";
}

} // namespace arsk
