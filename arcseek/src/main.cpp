#include "core/config.hpp"
#include "core/predicates.hpp"
#include "core/search_archive.hpp"
#include "env_config.h"
#include "hash_sha256.h"
#include "json_min.h"
#include "log.h"

#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace arsk;

enum ExitCode { kMatched = 0, kNoMatch = 1, kUsage = 2, kUnsupported = 3, kIoError = 4 };

static void usage() {
  std::fprintf(stderr,
    "usage: arcseek [--config FILE] [--name SUFFIX]... [--predicate SPEC]...\n"
    "               [-i|--ignore-case] [--first] [--include-empty] [-r|--recursive]\n"
    "               [--max-depth N] [--extract DIR] [--media-type MIME] ARCHIVE\n"
    "predicates: contains:TEXT icontains:TEXT magic:HEX entropy>=BITS sha256:HEX minsize:BYTES\n"
    "--first keeps one match per name and per predicate, and stops once all are found\n");
}

static std::string recordJson(const MatchRecord& r) {
  std::ostringstream os;
  os << "{\"name\":" << jsonQuote(r.name)
     << ",\"size\":" << r.size
     << ",\"mtime\":" << r.mtime
     << ",\"container\":" << jsonQuote(r.container)
     << ",\"sha256\":" << jsonQuote(sha256_bytes(r.bytes)) << "}";
  return os.str();
}

static std::string resultJson(const std::string& source, const ResultSet& rs) {
  std::ostringstream os;
  os << "{\"source\":" << jsonQuote(source) << ",\"names\":{";
  bool first = true;
  for (auto& [key, recs] : rs.byName) {
    if (!first) os << ",";
    first = false;
    os << jsonQuote(key) << ":[";
    for (size_t i = 0; i < recs.size(); ++i) os << (i ? "," : "") << recordJson(recs[i]);
    os << "]";
  }
  os << "},\"predicates\":{";
  first = true;
  for (auto& [key, hits] : rs.byPredicate) {
    if (!first) os << ",";
    first = false;
    os << jsonQuote(key) << ":{\"value\":" << jsonQuote(hits.lastValue) << ",\"files\":[";
    for (size_t i = 0; i < hits.files.size(); ++i) os << (i ? "," : "") << recordJson(hits.files[i]);
    os << "]}";
  }
  os << "}}";
  return os.str();
}

int main(int argc, char** argv) {
  AppConfig cfg;
  std::string err;

  // config file first so that flags can override it
  std::string cfgPath = configPathFromEnv();
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string(argv[i]) == "--config") cfgPath = argv[i + 1];
  }
  if (!cfgPath.empty() && !loadConfigYaml(cfgPath, cfg, err)) {
    LOGE("config " + cfgPath + ": " + err);
    return kUsage;
  }
  if (!applyEnvOverrides(cfg, err)) {
    LOGE(err);
    return kUsage;
  }
  setLogLevel(cfg.log.level);

  SearchQuery q;
  applyDefaults(cfg, q);
  std::string archivePath;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* flag) -> std::string {
      if (i + 1 >= argc) { LOGE(std::string(flag) + " needs a value"); return std::string(); }
      return argv[++i];
    };

    if (a == "--config") { ++i; }
    else if (a == "--name") {
      std::string v = need("--name");
      if (v.empty()) { usage(); return kUsage; }
      q.names.push_back(v);
    }
    else if (a == "--predicate") {
      std::string v = need("--predicate");
      Predicate p;
      if (v.empty() || !parsePredicateSpec(v, p, err)) { LOGE(err); usage(); return kUsage; }
      q.predicates.push_back(std::move(p));
    }
    else if (a == "-i" || a == "--ignore-case") q.caseSensitive = false;
    else if (a == "--first") q.firstOnly = true;
    else if (a == "--include-empty") q.includeEmpty = true;
    else if (a == "-r" || a == "--recursive") q.recursive = true;
    else if (a == "--max-depth") {
      std::string v = need("--max-depth");
      if (!parseDepth(v, q.limits.maxDepth, err)) { LOGE("--max-depth: " + err); usage(); return kUsage; }
    }
    else if (a == "--extract") {
      std::string v = need("--extract");
      if (v.empty()) { usage(); return kUsage; }
      q.extractTo = v;
    }
    else if (a == "--media-type") q.mediaTypeHint = need("--media-type");
    else if (a == "-h" || a == "--help") { usage(); return kUsage; }
    else if (a.rfind("-", 0) == 0) { LOGE("unknown flag " + a); usage(); return kUsage; }
    else archivePath = a;
  }

  if (archivePath.empty()) { usage(); return kUsage; }

  ResultSet rs;
  SearchError serr;
  if (!search(ByteSource::fromPath(archivePath), q, rs, serr)) {
    LOGE(std::string(toString(serr.kind)) + ": " + serr.message + " (" + serr.path + ")");
    switch (serr.kind) {
      case ErrorKind::Configuration:     usage(); return kUsage;
      case ErrorKind::UnsupportedFormat: return kUnsupported;
      default:                           return kIoError;
    }
  }

  std::cout << resultJson(archivePath, rs) << "\n";
  return rs.matchCount() > 0 ? kMatched : kNoMatch;
}
