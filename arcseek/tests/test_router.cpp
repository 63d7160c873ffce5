#include "routing/router.hpp"
#include "fixtures.hpp"

#include <gtest/gtest.h>

using namespace arsk;
using namespace arsk::test;

TEST(Router, ZipSignatures) {
  EXPECT_EQ(detectFormat(Bytes{0x50, 0x4B, 0x03, 0x04, 0x14, 0x00}).format, ArchiveFormat::Zip);
  EXPECT_EQ(detectFormat(Bytes{0x50, 0x4B, 0x05, 0x06}).format, ArchiveFormat::Zip);
  EXPECT_EQ(detectFormat(Bytes{0x50, 0x4B, 0x07, 0x08, 0x00}).format, ArchiveFormat::Zip);
  EXPECT_EQ(detectFormat(Bytes{0x50, 0x4B, 0x03, 0x04}).reason, "magic");
}

TEST(Router, SevenZipSignature) {
  DetectResult dr = detectFormat(Bytes{0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C, 0x00, 0x04});
  EXPECT_EQ(dr.format, ArchiveFormat::SevenZip);
  EXPECT_EQ(dr.reason, "magic");
}

TEST(Router, ShortAndForeignBuffersAreUnknown) {
  EXPECT_EQ(detectFormat(Bytes{}).format, ArchiveFormat::Unknown);
  EXPECT_EQ(detectFormat(Bytes{0x50, 0x4B}).format, ArchiveFormat::Unknown);
  EXPECT_EQ(detectFormat(Bytes{0x37, 0x7A, 0xBC}).format, ArchiveFormat::Unknown);
  EXPECT_EQ(detectFormat(toBytes("plain text, not an archive")).format, ArchiveFormat::Unknown);
  EXPECT_EQ(detectFormat(Bytes{0x1F, 0x8B, 0x08, 0x00}).format, ArchiveFormat::Unknown);  // gzip
}

TEST(Router, MediaTypeHintNeverOverridesBytes) {
  EXPECT_EQ(detectFormat(toBytes("hello"), "application/zip").format, ArchiveFormat::Unknown);
  EXPECT_EQ(detectFormat(Bytes{0x50, 0x4B, 0x03, 0x04}, "application/x-7z-compressed").format, ArchiveFormat::Zip);
  EXPECT_EQ(detectFormat(Bytes{0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C}, "text/plain").format, ArchiveFormat::SevenZip);
}

TEST(Router, SelfExtractingZipNeedsEndOfCentralDirectory) {
  Bytes sfx = {'M', 'Z'};
  sfx.resize(4096, 0x90);
  Bytes eocd = {0x50, 0x4B, 0x05, 0x06};
  eocd.resize(22, 0x00);
  sfx.insert(sfx.end(), eocd.begin(), eocd.end());
  DetectResult dr = detectFormat(sfx);
  EXPECT_EQ(dr.format, ArchiveFormat::Zip);
  EXPECT_EQ(dr.reason, "sfx");

  Bytes pe = {'M', 'Z'};
  pe.resize(4096, 0x90);
  EXPECT_EQ(detectFormat(pe).format, ArchiveFormat::Unknown);
}

TEST(Router, DetectsFromPath) {
  TempDir td;
  auto zipPath = writeZip(td / "a.zip", {file("x.txt", "x")});
  auto szPath  = write7z(td / "a.7z", {file("x.txt", "x")});
  auto txtPath = td / "a.txt";
  writeFile(txtPath, toBytes("not an archive"));

  EXPECT_EQ(detectFormat(zipPath).format, ArchiveFormat::Zip);
  EXPECT_EQ(detectFormat(szPath).format, ArchiveFormat::SevenZip);
  EXPECT_EQ(detectFormat(txtPath).format, ArchiveFormat::Unknown);
  EXPECT_EQ(detectFormat(td / "missing.zip").format, ArchiveFormat::Unknown);
}

TEST(Router, ExtensionIsIgnored) {
  TempDir td;
  auto fake = td / "fake.zip";
  writeFile(fake, toBytes("definitely not a zip"));
  EXPECT_EQ(detectFormat(fake).format, ArchiveFormat::Unknown);

  auto real = writeZip(td / "real.bin", {file("x.txt", "x")});
  EXPECT_EQ(detectFormat(real).format, ArchiveFormat::Zip);
}
