#pragma once
#include "core/types.hpp"
#include <string>
#include <vector>
#include <filesystem>
#include <memory>
#include <functional>

namespace arsk {

// One entry of a container, as listed by the reader.
struct EntryInfo {
  std::string name;          // forward-slash separated
  uint64_t    size = 0;      // uncompressed
  int64_t     mtime = 0;     // unix seconds
  bool        isDir = false;
  bool        isEncrypted = false;
  uint64_t    index = 0;     // ordinal in the container's native order
};

class IArchiveReader {
public:
  virtual ~IArchiveReader() = default;

  virtual ArchiveFormat format() const = 0;

  // Open from a file. Fails if the file cannot be parsed as this format.
  virtual bool open(const std::filesystem::path& path, std::string& err) = 0;

  // Open from a buffer. The buffer must stay alive until close().
  virtual bool openMemory(const uint8_t* data, size_t len, std::string& err) = 0;

  // All entries in native order, directories included.
  virtual bool listEntries(std::vector<EntryInfo>& out, std::string& err) = 0;

  // Raw bytes of a non-directory entry. Entries may be requested in any order.
  virtual bool readEntry(const EntryInfo& e, Bytes& out, std::string& err) = 0;

  virtual void close() = 0;
};

std::unique_ptr<IArchiveReader> makeZipReader();
std::unique_ptr<IArchiveReader> makeSevenZipReader();

// nullptr when no reader is implemented for the format
std::unique_ptr<IArchiveReader> makeReader(ArchiveFormat fmt);

using ReaderFactory = std::function<std::unique_ptr<IArchiveReader>(ArchiveFormat)>;

// Closes the reader on every exit path.
class ReaderCloser {
public:
  explicit ReaderCloser(IArchiveReader* r) : r_(r) {}
  ~ReaderCloser() { if (r_) r_->close(); }
  ReaderCloser(const ReaderCloser&) = delete;
  ReaderCloser& operator=(const ReaderCloser&) = delete;
private:
  IArchiveReader* r_;
};

} // namespace arsk
