// src/entropy.cpp
#include "entropy.h"
#include <array>
#include <cmath>

double entropy_8bit(const uint8_t* data, size_t len) {
  if (!data || len == 0) return 0.0;
  std::array<uint64_t, 256> cnt{};
  for (size_t i = 0; i < len; ++i) ++cnt[data[i]];
  const double sum = static_cast<double>(len);
  double H = 0.0;
  for (uint64_t c : cnt) if (c > 0) {
    double p = static_cast<double>(c) / sum; H -= p * std::log2(p);
  }
  return H;
}

double entropy_8bit(const std::vector<uint8_t>& buf) { return entropy_8bit(buf.data(), buf.size()); }
