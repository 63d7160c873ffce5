#pragma once
#include "readers/IArchiveReader.hpp"

struct archive;
struct archive_entry;

namespace arsk {

// 7z reader on libarchive. libarchive only streams forward, so the reader
// keeps a cursor and re-opens the source when an entry behind it is wanted.
class SevenZipReader : public IArchiveReader {
  struct archive*        a_ = nullptr;
  std::filesystem::path  path_;
  const uint8_t*         mem_ = nullptr;
  size_t                 memLen_ = 0;
  bool                   fromMemory_ = false;
  bool                   opened_ = false;
  int64_t                cursor_ = -1;      // ordinal of the last header consumed
  std::vector<EntryInfo> entries_;

  bool reopen(std::string& err);
  bool scanHeaders(std::string& err);
  void freeArchive();

public:
  SevenZipReader() = default;
  ~SevenZipReader() override { close(); }
  SevenZipReader(const SevenZipReader&) = delete;
  SevenZipReader& operator=(const SevenZipReader&) = delete;

  ArchiveFormat format() const override { return ArchiveFormat::SevenZip; }

  bool open(const std::filesystem::path& path, std::string& err) override;
  bool openMemory(const uint8_t* data, size_t len, std::string& err) override;
  bool listEntries(std::vector<EntryInfo>& out, std::string& err) override;
  bool readEntry(const EntryInfo& e, Bytes& out, std::string& err) override;
  void close() override;

  // number of times the stream was re-opened after the first listing
  uint32_t rewinds() const { return rewinds_; }

private:
  uint32_t rewinds_ = 0;
};

} // namespace arsk
