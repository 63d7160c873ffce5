#pragma once
// Test-time archive authoring: zip through libzip, 7z through libarchive.
#include "core/types.hpp"
#include "readers/IArchiveReader.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <zip.h>
#include <gtest/gtest.h>

#include <atomic>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

namespace arsk::test {

namespace fs = std::filesystem;

struct Member {
  std::string name;
  std::string data;
  bool        dir = false;
  int64_t     mtime = 1600000000;
};

inline Member file(const std::string& name, const std::string& data) { return Member{name, data, false}; }
inline Member file(const std::string& name, const Bytes& data) {
  return Member{name, std::string(data.begin(), data.end()), false};
}
inline Member dir(const std::string& name) { return Member{name, "", true}; }

class TempDir {
public:
  TempDir() {
    static std::atomic<int> seq{0};
    path_ = fs::temp_directory_path() /
            ("arcseek_test_" + std::to_string(::getpid()) + "_" + std::to_string(++seq));
    fs::remove_all(path_);
    fs::create_directories(path_);
  }
  ~TempDir() { std::error_code ec; fs::remove_all(path_, ec); }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const fs::path& path() const { return path_; }
  fs::path operator/(const std::string& name) const { return path_ / name; }

private:
  fs::path path_;
};

inline Bytes readFile(const fs::path& p) {
  std::ifstream f(p, std::ios::binary);
  return Bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

inline void writeFile(const fs::path& p, const Bytes& data) {
  std::ofstream f(p, std::ios::binary | std::ios::trunc);
  f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline Bytes toBytes(const std::string& s) { return Bytes(s.begin(), s.end()); }

// Members must be non-empty: libzip writes nothing for an empty archive.
inline fs::path writeZip(const fs::path& out, const std::vector<Member>& members) {
  int ze = 0;
  zip_t* z = zip_open(out.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &ze);
  if (!z) { ADD_FAILURE() << "zip_open for write failed: " << ze; return out; }
  for (const Member& m : members) {
    zip_int64_t idx;
    if (m.dir) {
      idx = zip_dir_add(z, m.name.c_str(), ZIP_FL_ENC_UTF_8);
    } else {
      zip_source_t* src = zip_source_buffer(z, m.data.data(), m.data.size(), 0);
      if (!src) { ADD_FAILURE() << "zip_source_buffer failed"; break; }
      idx = zip_file_add(z, m.name.c_str(), src, ZIP_FL_ENC_UTF_8);
      if (idx < 0) zip_source_free(src);
    }
    if (idx < 0) { ADD_FAILURE() << "zip add failed for " << m.name << ": " << zip_strerror(z); continue; }
    zip_file_set_mtime(z, static_cast<zip_uint64_t>(idx), static_cast<time_t>(m.mtime), 0);
  }
  if (zip_close(z) != 0) {
    ADD_FAILURE() << "zip_close failed: " << zip_strerror(z);
    zip_discard(z);
  }
  return out;
}

// Member files must be non-empty.
inline fs::path write7z(const fs::path& out, const std::vector<Member>& members) {
  struct archive* a = archive_write_new();
  archive_write_set_format_7zip(a);
  if (archive_write_open_filename(a, out.string().c_str()) != ARCHIVE_OK) {
    ADD_FAILURE() << "7z open for write failed: " << archive_error_string(a);
    archive_write_free(a);
    return out;
  }
  for (const Member& m : members) {
    struct archive_entry* e = archive_entry_new();
    archive_entry_set_pathname(e, m.name.c_str());
    archive_entry_set_mtime(e, static_cast<time_t>(m.mtime), 0);
    if (m.dir) {
      archive_entry_set_filetype(e, AE_IFDIR);
      archive_entry_set_perm(e, 0755);
      archive_entry_set_size(e, 0);
    } else {
      archive_entry_set_filetype(e, AE_IFREG);
      archive_entry_set_perm(e, 0644);
      archive_entry_set_size(e, static_cast<la_int64_t>(m.data.size()));
    }
    if (archive_write_header(a, e) != ARCHIVE_OK) {
      ADD_FAILURE() << "7z header failed for " << m.name << ": " << archive_error_string(a);
    } else if (!m.dir && archive_write_data(a, m.data.data(), m.data.size()) < 0) {
      ADD_FAILURE() << "7z data failed for " << m.name << ": " << archive_error_string(a);
    }
    archive_entry_free(e);
  }
  if (archive_write_close(a) != ARCHIVE_OK) ADD_FAILURE() << "7z close failed: " << archive_error_string(a);
  archive_write_free(a);
  return out;
}

inline Bytes zipBytes(const TempDir& td, const std::string& name, const std::vector<Member>& members) {
  return readFile(writeZip(td / name, members));
}

inline Bytes sevenZipBytes(const TempDir& td, const std::string& name, const std::vector<Member>& members) {
  return readFile(write7z(td / name, members));
}

// Delegating reader that records every entry read through it.
class RecordingReader : public IArchiveReader {
public:
  RecordingReader(std::unique_ptr<IArchiveReader> inner, std::vector<std::string>& reads, int& closes)
    : inner_(std::move(inner)), reads_(reads), closes_(closes) {}

  ArchiveFormat format() const override { return inner_->format(); }
  bool open(const fs::path& p, std::string& err) override { return inner_->open(p, err); }
  bool openMemory(const uint8_t* d, size_t n, std::string& err) override { return inner_->openMemory(d, n, err); }
  bool listEntries(std::vector<EntryInfo>& out, std::string& err) override { return inner_->listEntries(out, err); }
  bool readEntry(const EntryInfo& e, Bytes& out, std::string& err) override {
    reads_.push_back(e.name);
    return inner_->readEntry(e, out, err);
  }
  void close() override { ++closes_; inner_->close(); }

private:
  std::unique_ptr<IArchiveReader> inner_;
  std::vector<std::string>&       reads_;
  int&                            closes_;
};

struct ReadLog {
  std::vector<std::string> reads;
  int closes = 0;

  ReaderFactory factory() {
    return [this](ArchiveFormat f) -> std::unique_ptr<IArchiveReader> {
      auto inner = makeReader(f);
      if (!inner) return nullptr;
      return std::make_unique<RecordingReader>(std::move(inner), reads, closes);
    };
  }
};

} // namespace arsk::test
