#pragma once
#include "readers/IArchiveReader.hpp"
#include <zip.h>

namespace arsk {

// Zip-family reader on libzip. Random access by index, no read state to restore.
class ZipReader : public IArchiveReader {
  zip_t*       z_ = nullptr;
  zip_int64_t  total_ = 0;

public:
  ZipReader() = default;
  ~ZipReader() override { close(); }
  ZipReader(const ZipReader&) = delete;
  ZipReader& operator=(const ZipReader&) = delete;

  ArchiveFormat format() const override { return ArchiveFormat::Zip; }

  bool open(const std::filesystem::path& path, std::string& err) override;
  bool openMemory(const uint8_t* data, size_t len, std::string& err) override;
  bool listEntries(std::vector<EntryInfo>& out, std::string& err) override;
  bool readEntry(const EntryInfo& e, Bytes& out, std::string& err) override;
  void close() override;
};

} // namespace arsk
