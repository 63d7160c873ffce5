// include/entropy.h
#pragma once
#include <vector>
#include <cstddef>
#include <cstdint>

// Shannon entropy in bits per byte, 0..8
double entropy_8bit(const uint8_t* data, size_t len);
double entropy_8bit(const std::vector<uint8_t>& buf);
