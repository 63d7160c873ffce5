// src/hash_sha256.cpp
#include "hash_sha256.h"
#include <fstream>
#include <memory>
#include <openssl/evp.h>
#include <openssl/sha.h>

static std::string hex(const unsigned char* d, size_t n) {
  static const char* he = "0123456789abcdef";
  std::string s; s.resize(n*2);
  for (size_t i=0;i<n;++i){ s[2*i]=he[d[i]>>4]; s[2*i+1]=he[d[i]&0xF]; }
  return s;
}

std::string sha256_bytes(const std::vector<uint8_t>& data) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(data.data(), data.size(), md);
  return hex(md, sizeof(md));
}

std::string sha256_string(const std::string& str) {
  unsigned char md[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(str.data()), str.size(), md);
  return hex(md, sizeof(md));
}

// empty string when the file cannot be read
std::string sha256_file(const std::filesystem::path& path, size_t chunk) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return "";

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) return "";

  std::vector<unsigned char> buf; buf.resize(chunk);
  while (f) {
    f.read((char*)buf.data(), buf.size());
    std::streamsize got = f.gcount();
    if (got>0 && EVP_DigestUpdate(ctx.get(), buf.data(), (size_t)got) != 1) return "";
  }
  unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdLen = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md, &mdLen) != 1) return "";
  return hex(md, mdLen);
}
