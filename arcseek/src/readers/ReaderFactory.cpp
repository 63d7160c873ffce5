// src/readers/ReaderFactory.cpp
#include "readers/IArchiveReader.hpp"

namespace arsk {

std::unique_ptr<IArchiveReader> makeReader(ArchiveFormat fmt) {
  switch (fmt) {
    case ArchiveFormat::Zip:      return makeZipReader();
    case ArchiveFormat::SevenZip: return makeSevenZipReader();
    default:                      return nullptr;
  }
}

} // namespace arsk
