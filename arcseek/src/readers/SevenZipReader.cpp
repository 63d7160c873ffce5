// src/readers/SevenZipReader.cpp
#include "readers/SevenZipReader.hpp"
#include <archive.h>
#include <archive_entry.h>

namespace arsk {

static std::string archiveError(struct archive* a, const char* what) {
  const char* s = a ? archive_error_string(a) : nullptr;
  return std::string(what) + ": " + (s ? s : "unknown libarchive error");
}

void SevenZipReader::freeArchive() {
  if (a_) { archive_read_free(a_); a_ = nullptr; }
  cursor_ = -1;
}

bool SevenZipReader::reopen(std::string& err) {
  freeArchive();
  a_ = archive_read_new();
  if (!a_) { err = "archive_read_new failed"; return false; }
  archive_read_support_format_7zip(a_);

  int r = fromMemory_
        ? archive_read_open_memory(a_, mem_, memLen_)
        : archive_read_open_filename(a_, path_.string().c_str(), 1 << 16);
  if (r != ARCHIVE_OK) {
    err = archiveError(a_, "7z open failed") + " (" + (fromMemory_ ? std::string("<memory>") : path_.string()) + ")";
    freeArchive();
    return false;
  }
  return true;
}

// Walks every header once; also validates that the source parses as 7z.
bool SevenZipReader::scanHeaders(std::string& err) {
  entries_.clear();
  struct archive_entry* ae = nullptr;
  int r;
  while ((r = archive_read_next_header(a_, &ae)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
    EntryInfo ei{};
    const char* p = archive_entry_pathname(ae);
    ei.name  = p ? p : "";
    ei.size  = archive_entry_size_is_set(ae) ? static_cast<uint64_t>(archive_entry_size(ae)) : 0;
    ei.mtime = archive_entry_mtime_is_set(ae) ? static_cast<int64_t>(archive_entry_mtime(ae)) : 0;
    ei.isDir = archive_entry_filetype(ae) == AE_IFDIR;
    ei.isEncrypted = archive_entry_is_encrypted(ae) != 0;
    ei.index = entries_.size();
    entries_.push_back(std::move(ei));
    ++cursor_;
    if (archive_read_data_skip(a_) == ARCHIVE_FATAL) {
      err = archiveError(a_, "7z skip failed") + " (" + entries_.back().name + ")";
      return false;
    }
  }
  if (r != ARCHIVE_EOF) {
    err = archiveError(a_, "7z header scan failed");
    return false;
  }
  return true;
}

bool SevenZipReader::open(const std::filesystem::path& path, std::string& err) {
  close();
  path_ = path;
  fromMemory_ = false;
  if (!reopen(err)) return false;
  if (!scanHeaders(err)) { close(); return false; }
  // the listing pass leaves the stream at EOF; the first read opens it afresh
  freeArchive();
  rewinds_ = 0;
  opened_ = true;
  return true;
}

bool SevenZipReader::openMemory(const uint8_t* data, size_t len, std::string& err) {
  close();
  mem_ = data;
  memLen_ = len;
  fromMemory_ = true;
  if (!reopen(err)) return false;
  if (!scanHeaders(err)) { close(); return false; }
  // the listing pass leaves the stream at EOF; the first read opens it afresh
  freeArchive();
  rewinds_ = 0;
  opened_ = true;
  return true;
}

bool SevenZipReader::listEntries(std::vector<EntryInfo>& out, std::string& err) {
  if (!opened_) { err = "7z not open"; return false; }
  out = entries_;
  return true;
}

bool SevenZipReader::readEntry(const EntryInfo& e, Bytes& out, std::string& err) {
  if (!opened_) { err = "7z not open"; return false; }
  if (e.isDir) { err = "entry is a directory: " + e.name; return false; }
  if (e.index >= entries_.size()) { err = "entry index out of range: " + e.name; return false; }

  const int64_t want = static_cast<int64_t>(e.index);
  if (!a_ || want <= cursor_) {
    // not yet streamed, already streamed past it, or a previous read failed
    if (a_) ++rewinds_;
    if (!reopen(err)) return false;
  }

  struct archive_entry* ae = nullptr;
  while (cursor_ < want) {
    int r = archive_read_next_header(a_, &ae);
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
      err = archiveError(a_, "7z seek failed") + " (" + e.name + ")";
      freeArchive();
      return false;
    }
    ++cursor_;
    if (cursor_ < want && archive_read_data_skip(a_) == ARCHIVE_FATAL) {
      err = archiveError(a_, "7z skip failed") + " (" + e.name + ")";
      freeArchive();
      return false;
    }
  }

  const char* p = archive_entry_pathname(ae);
  if (!p || e.name != p) {
    err = "7z entry mismatch at index " + std::to_string(e.index) + ": expected " + e.name;
    freeArchive();
    return false;
  }

  out.clear();
  out.reserve(static_cast<size_t>(e.size));
  const void* buff = nullptr;
  size_t size = 0;
  la_int64_t offset = 0;
  int r;
  while ((r = archive_read_data_block(a_, &buff, &size, &offset)) == ARCHIVE_OK) {
    const uint8_t* b = static_cast<const uint8_t*>(buff);
    // sparse gaps are zero filled
    if (static_cast<uint64_t>(offset) > out.size()) out.resize(static_cast<size_t>(offset), 0);
    out.insert(out.end(), b, b + size);
  }
  if (r != ARCHIVE_EOF) {
    err = archiveError(a_, "7z read failed") + " (" + e.name + ")";
    freeArchive();
    return false;
  }
  return true;
}

void SevenZipReader::close() {
  freeArchive();
  opened_ = false;
  entries_.clear();
  mem_ = nullptr;
  memLen_ = 0;
}

std::unique_ptr<IArchiveReader> makeSevenZipReader() {
  return std::make_unique<SevenZipReader>();
}

} // namespace arsk
