#include "readers/ZipReader.hpp"
#include <zip.h>
#include <vector>
#include <filesystem>

namespace arsk {

static std::string zipErrorString(int code) {
  zip_error_t ze;
  zip_error_init_with_code(&ze, code);
  std::string s = zip_error_strerror(&ze);
  zip_error_fini(&ze);
  return s;
}

bool ZipReader::open(const std::filesystem::path& path, std::string& err) {
  close();
  int ze = 0;
  z_ = zip_open(path.string().c_str(), ZIP_RDONLY, &ze);
  if (!z_) { err = "zip_open failed: " + zipErrorString(ze) + " (" + path.string() + ")"; return false; }
  total_ = zip_get_num_entries(z_, 0);
  return true;
}

bool ZipReader::openMemory(const uint8_t* data, size_t len, std::string& err) {
  close();
  zip_error_t ze;
  zip_error_init(&ze);
  zip_source_t* src = zip_source_buffer_create(data, len, 0, &ze);
  if (!src) {
    err = std::string("zip_source_buffer_create failed: ") + zip_error_strerror(&ze);
    zip_error_fini(&ze);
    return false;
  }
  z_ = zip_open_from_source(src, ZIP_RDONLY, &ze);
  if (!z_) {
    err = std::string("zip_open_from_source failed: ") + zip_error_strerror(&ze);
    zip_source_free(src);   // still owned by us when open fails
    zip_error_fini(&ze);
    return false;
  }
  zip_error_fini(&ze);
  total_ = zip_get_num_entries(z_, 0);
  return true;
}

bool ZipReader::listEntries(std::vector<EntryInfo>& out, std::string& err) {
  if (!z_) { err = "zip not open"; return false; }
  out.clear();
  out.reserve(static_cast<size_t>(total_));

  for (zip_int64_t i = 0; i < total_; ++i) {
    zip_stat_t st; zip_stat_init(&st);
    if (zip_stat_index(z_, static_cast<zip_uint64_t>(i), 0, &st) != 0) {
      err = "zip_stat_index failed at " + std::to_string(i) + ": " + zip_strerror(z_);
      return false;
    }
    EntryInfo ei{};
    ei.name  = st.name ? st.name : "";
    ei.size  = (st.valid & ZIP_STAT_SIZE) ? static_cast<uint64_t>(st.size) : 0;
    ei.mtime = (st.valid & ZIP_STAT_MTIME) ? static_cast<int64_t>(st.mtime) : 0;
    ei.isDir = (!ei.name.empty() && ei.name.back() == '/');
    ei.isEncrypted = (st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE;
    ei.index = static_cast<uint64_t>(i);
    out.push_back(std::move(ei));
  }
  return true;
}

bool ZipReader::readEntry(const EntryInfo& e, Bytes& out, std::string& err) {
  if (!z_) { err = "zip not open"; return false; }
  if (e.isDir) { err = "entry is a directory: " + e.name; return false; }

  zip_file_t* zf = zip_fopen_index(z_, e.index, 0);
  if (!zf) { err = "zip_fopen_index failed for " + e.name + ": " + zip_strerror(z_); return false; }

  out.clear();
  out.reserve(static_cast<size_t>(e.size));
  std::vector<uint8_t> buf(1 << 16);
  zip_int64_t n;
  while ((n = zip_fread(zf, buf.data(), buf.size())) > 0) {
    out.insert(out.end(), buf.begin(), buf.begin() + n);
  }
  if (n < 0) {
    err = "zip_fread failed for " + e.name + ": " + zip_file_strerror(zf);
    zip_fclose(zf);
    return false;
  }
  zip_fclose(zf);
  return true;
}

void ZipReader::close() {
  if (z_) { zip_discard(z_); z_ = nullptr; }   // read-only, nothing to write back
  total_ = 0;
}

std::unique_ptr<IArchiveReader> makeZipReader() {
  return std::make_unique<ZipReader>();
}

} // namespace arsk
