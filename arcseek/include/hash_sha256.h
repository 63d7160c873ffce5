// include/hash_sha256.h
#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const std::filesystem::path& path, size_t chunk = 1<<20); // 1MB chunk
std::string sha256_string(const std::string& str);
