// src/core/predicates.cpp
#include "core/predicates.hpp"
#include "entropy.h"
#include "hash_sha256.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace arsk {

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

static int hexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHex(const std::string& hex, Bytes& out) {
  if (hex.empty() || hex.size() % 2 != 0) return false;
  out.clear();
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hexNibble(hex[i]), lo = hexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return false;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

Predicate containsPredicate(const std::string& key, const std::string& needle, bool caseSensitive) {
  return Predicate{key, [needle, caseSensitive](const Bytes& b) {
    auto eq = [caseSensitive](uint8_t x, char y) {
      if (caseSensitive) return x == static_cast<uint8_t>(y);
      return std::tolower(x) == std::tolower(static_cast<unsigned char>(y));
    };
    auto it = std::search(b.begin(), b.end(), needle.begin(), needle.end(), eq);
    if (it == b.end() && !needle.empty()) return Verdict{};
    return Verdict{true, "offset=" + std::to_string(it - b.begin())};
  }};
}

Predicate magicPredicate(const std::string& key, const Bytes& prefix) {
  return Predicate{key, [prefix](const Bytes& b) {
    if (b.size() < prefix.size() || !std::equal(prefix.begin(), prefix.end(), b.begin())) return Verdict{};
    return Verdict{true, "magic"};
  }};
}

Predicate entropyPredicate(const std::string& key, double minBits) {
  return Predicate{key, [minBits](const Bytes& b) {
    double H = entropy_8bit(b);
    if (H < minBits) return Verdict{};
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", H);
    return Verdict{true, buf};
  }};
}

Predicate sha256Predicate(const std::string& key, const std::string& hexDigest) {
  const std::string want = lower(hexDigest);
  return Predicate{key, [want](const Bytes& b) {
    std::string got = sha256_bytes(b);
    if (got != want) return Verdict{};
    return Verdict{true, got};
  }};
}

Predicate minSizePredicate(const std::string& key, uint64_t minBytes) {
  return Predicate{key, [minBytes](const Bytes& b) {
    if (b.size() < minBytes) return Verdict{};
    return Verdict{true, std::to_string(b.size())};
  }};
}

bool parsePredicateSpec(const std::string& spec, Predicate& out, std::string& err) {
  auto arg = [&spec](size_t prefixLen) { return spec.substr(prefixLen); };

  if (spec.rfind("contains:", 0) == 0) {
    if (spec.size() == 9) { err = "contains: needs text"; return false; }
    out = containsPredicate(spec, arg(9), true);
    return true;
  }
  if (spec.rfind("icontains:", 0) == 0) {
    if (spec.size() == 10) { err = "icontains: needs text"; return false; }
    out = containsPredicate(spec, arg(10), false);
    return true;
  }
  if (spec.rfind("magic:", 0) == 0) {
    Bytes prefix;
    if (!parseHex(arg(6), prefix)) { err = "magic: expects an even-length hex string"; return false; }
    out = magicPredicate(spec, prefix);
    return true;
  }
  if (spec.rfind("sha256:", 0) == 0) {
    Bytes digest;
    if (!parseHex(arg(7), digest) || digest.size() != 32) { err = "sha256: expects 64 hex characters"; return false; }
    out = sha256Predicate(spec, arg(7));
    return true;
  }
  try {
    if (spec.rfind("entropy>=", 0) == 0) {
      size_t used = 0;
      double bits = std::stod(arg(9), &used);
      if (used != spec.size() - 9 || bits < 0.0 || bits > 8.0) { err = "entropy>= expects 0..8"; return false; }
      out = entropyPredicate(spec, bits);
      return true;
    }
    if (spec.rfind("minsize:", 0) == 0) {
      size_t used = 0;
      unsigned long long n = std::stoull(arg(8), &used);
      if (used != spec.size() - 8) { err = "minsize: expects a byte count"; return false; }
      out = minSizePredicate(spec, n);
      return true;
    }
  } catch (const std::exception& ex) {
    err = "bad predicate '" + spec + "': " + ex.what();
    return false;
  }
  err = "unknown predicate '" + spec + "'";
  return false;
}

} // namespace arsk
