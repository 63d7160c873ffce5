// src/core/search_archive.cpp
#include "core/search_archive.hpp"
#include "core/aggregator.hpp"
#include "core/matcher.hpp"
#include "core/extract_sink.hpp"
#include "readers/IArchiveReader.hpp"
#include "routing/router.hpp"
#include "hash_sha256.h"
#include "log.h"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace arsk {

// Traversal state for one top-level search. The aggregator is shared by
// every nesting level; depth and ancestry are pushed/popped around recursion.
struct SearchContext {
  const SearchQuery&       query;
  ResultAggregator&        agg;
  const ReaderFactory&     makeReader;
  std::string              scanId;
  uint32_t                 depth = 0;
  std::vector<std::string> ancestry;   // sha256 of containers on the current path
  std::string              chain;      // "outer.zip>inner.zip"
};

static std::string nextScanId() {
  static std::atomic<uint64_t> counter{0};
  return "scan-" + std::to_string(++counter);
}

static void setError(SearchError& err, ErrorKind kind, const std::string& msg, const std::string& path) {
  err.kind = kind;
  err.message = msg;
  err.path = path;
}

static MatchRecord makeRecord(const EntryInfo& e, const Bytes& data, const SearchContext& ctx) {
  MatchRecord rec;
  rec.bytes = data;
  rec.name = e.name;
  rec.size = e.size;
  rec.mtime = e.mtime;
  rec.container = ctx.chain;
  return rec;
}

static bool searchContainer(IArchiveReader& reader, SearchContext& ctx, SearchError& err);

// Re-runs the search on a member's bytes when they hold a supported container.
// Problems confined to the nested container are logged and skip that branch.
static bool searchNested(const EntryInfo& e, const Bytes& data, SearchContext& ctx, SearchError& err) {
  DetectResult dr = detectFormat(data);
  if (dr.format == ArchiveFormat::Unknown) return true;

  const Limits& lim = ctx.query.limits;
  if (lim.maxDepth != 0 && ctx.depth + 1 > lim.maxDepth) {
    logEvent(ctx.scanId, "violation", {{"type","depth_exceeded"},{"entry",e.name},{"depth",std::to_string(ctx.depth + 1)}});
    return true;
  }

  std::string digest;
  if (lim.detectCycles) {
    digest = sha256_bytes(data);
    if (std::find(ctx.ancestry.begin(), ctx.ancestry.end(), digest) != ctx.ancestry.end()) {
      logEvent(ctx.scanId, "violation", {{"type","cycle"},{"entry",e.name},{"sha256",digest}});
      return true;
    }
  }

  auto reader = ctx.makeReader(dr.format);
  if (!reader) {
    logEvent(ctx.scanId, "error", {{"where","nested"},{"msg","unsupported_format"},{"entry",e.name},{"format",toString(dr.format)}});
    return true;
  }

  std::string rerr;
  if (!reader->openMemory(data.data(), data.size(), rerr)) {
    logEvent(ctx.scanId, "error", {{"where","nested_open"},{"entry",e.name},{"msg",rerr}});
    return true;
  }
  ReaderCloser closer(reader.get());

  logEvent(ctx.scanId, "nested", {{"entry",e.name},{"format",toString(dr.format)},{"depth",std::to_string(ctx.depth + 1)}});

  const std::string savedChain = ctx.chain;
  ctx.chain = ctx.chain.empty() ? e.name : (ctx.chain + ">" + e.name);
  ctx.depth++;
  if (!digest.empty()) ctx.ancestry.push_back(digest);

  bool ok = searchContainer(*reader, ctx, err);

  if (!digest.empty()) ctx.ancestry.pop_back();
  ctx.depth--;
  ctx.chain = savedChain;
  return ok;
}

static bool searchContainer(IArchiveReader& reader, SearchContext& ctx, SearchError& err) {
  const SearchQuery& q = ctx.query;
  ResultAggregator& agg = ctx.agg;

  std::vector<EntryInfo> entries;
  std::string rerr;
  if (!reader.listEntries(entries, rerr)) {
    setError(err, ErrorKind::Io, rerr, ctx.chain);
    return false;
  }

  for (const EntryInfo& e : entries) {
    if (agg.complete()) {
      LOGD("all targets found, stop at depth " + std::to_string(ctx.depth));
      break;
    }
    if (e.isDir) continue;

    if (q.limits.maxEntryBytes != 0 && e.size > q.limits.maxEntryBytes) {
      logEvent(ctx.scanId, "violation", {{"type","entry_too_large"},{"entry",e.name},{"size",std::to_string(e.size)}});
      continue;
    }

    Bytes data;
    if (!reader.readEntry(e, data, rerr)) {
      logEvent(ctx.scanId, "error", {{"where","read"},{"entry",e.name},{"msg",rerr}});
      setError(err, ErrorKind::Io, rerr, ctx.chain.empty() ? e.name : ctx.chain + ">" + e.name);
      return false;
    }

    // predicates take precedence; a predicate hit is never name-matched or descended into
    if (!q.predicates.empty()) {
      auto hit = matchByPredicates(data, q.predicates, agg.satisfiedPredicates());
      if (hit) {
        const std::string& key = q.predicates[hit->index].key;
        logEvent(ctx.scanId, "match_predicate", {{"key",key},{"entry",e.name},{"container",ctx.chain}});
        if (!q.extractTo.empty()) {
          fs::path written;
          std::string werr;
          if (extractMatch(q.extractTo, e.name, data, written, werr)) {
            logEvent(ctx.scanId, "extract", {{"entry",e.name},{"to",written.string()}});
          } else {
            logEvent(ctx.scanId, "error", {{"where","extract"},{"entry",e.name},{"msg",werr}});
          }
        }
        agg.recordPredicateMatch(hit->index, makeRecord(e, data, ctx), hit->verdict.value);
        continue;
      }
    }

    // nested members are recorded before the container itself
    if (q.recursive) {
      if (!searchNested(e, data, ctx, err)) return false;
    }

    for (const std::string& suffix : agg.names()) {
      if (!agg.wantsName(suffix)) continue;
      if (!matchByName(e.name, suffix, q.caseSensitive)) continue;
      logEvent(ctx.scanId, "match_name", {{"target",suffix},{"entry",e.name},{"container",ctx.chain}});
      agg.recordNameMatch(suffix, makeRecord(e, data, ctx));
    }
  }
  return true;
}

bool validateQuery(const SearchQuery& q, SearchError& err) {
  if (q.names.empty() && q.predicates.empty()) {
    setError(err, ErrorKind::Configuration, "either names or predicates must be provided", "");
    return false;
  }
  std::set<std::string> keys;
  for (const Predicate& p : q.predicates) {
    if (p.key.empty()) {
      setError(err, ErrorKind::Configuration, "predicate with empty key", "");
      return false;
    }
    if (!p.fn) {
      setError(err, ErrorKind::Configuration, "predicate '" + p.key + "' has no function", "");
      return false;
    }
    if (!keys.insert(p.key).second) {
      setError(err, ErrorKind::Configuration, "duplicate predicate key '" + p.key + "'", "");
      return false;
    }
  }
  return true;
}

bool search(const ByteSource& src, const SearchQuery& q, ResultSet& out, SearchError& err) {
  static const ReaderFactory defaultFactory = [](ArchiveFormat f) { return makeReader(f); };
  return search(src, q, out, err, defaultFactory);
}

bool search(const ByteSource& src, const SearchQuery& q, ResultSet& out, SearchError& err,
            const ReaderFactory& factory)
{
  err = SearchError{};
  if (!validateQuery(q, err)) return false;

  const std::string scanId = nextScanId();
  const std::string label = src.label();

  if (!src.inMemory) {
    std::error_code ec;
    if (!fs::is_regular_file(src.path, ec)) {
      logEvent(scanId, "error", {{"where","search"},{"msg","file_not_found"},{"path",label}});
      setError(err, ErrorKind::Io, "cannot open source", label);
      return false;
    }
  }

  DetectResult dr = src.inMemory ? detectFormat(src.data, q.mediaTypeHint)
                                 : detectFormat(src.path, q.mediaTypeHint);
  if (dr.format == ArchiveFormat::Unknown) {
    logEvent(scanId, "error", {{"where","detect"},{"msg","unsupported_format"},{"path",label}});
    setError(err, ErrorKind::UnsupportedFormat, "no known container signature", label);
    return false;
  }

  std::unique_ptr<IArchiveReader> reader;
  if (factory) reader = factory(dr.format);
  if (!reader) {
    setError(err, ErrorKind::UnsupportedFormat,
             std::string("no reader for format ") + toString(dr.format), label);
    return false;
  }

  std::string rerr;
  bool opened = src.inMemory ? reader->openMemory(src.data.data(), src.data.size(), rerr)
                             : reader->open(src.path, rerr);
  if (!opened) {
    logEvent(scanId, "error", {{"where","open"},{"msg",rerr},{"path",label}});
    setError(err, ErrorKind::Io, rerr, label);
    return false;
  }
  ReaderCloser closer(reader.get());

  logEvent(scanId, "open", {{"path",label},{"format",toString(dr.format)},{"reason",dr.reason}});

  ResultAggregator agg(q);
  SearchContext ctx{q, agg, factory, scanId, 0, {}, ""};
  if (q.recursive && q.limits.detectCycles) {
    std::string digest = src.inMemory ? sha256_bytes(src.data) : sha256_file(src.path);
    if (!digest.empty()) ctx.ancestry.push_back(digest);
  }

  if (!searchContainer(*reader, ctx, err)) {
    if (err.path.empty()) err.path = label;
    return false;
  }

  if (agg.complete()) logEvent(scanId, "complete", {{"found",std::to_string(agg.foundCount())}});
  out = agg.finalize();
  logEvent(scanId, "done", {{"path",label},{"matches",std::to_string(out.matchCount())}});
  return true;
}

} // namespace arsk
