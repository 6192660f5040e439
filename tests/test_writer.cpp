#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <span>
#include <string>
#include <vector>

#include <mpqx/archive.hpp>
#include <mpqx/compression.hpp>
#include <mpqx/crypto.hpp>
#include <mpqx/reader.hpp>
#include <mpqx/writer.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;
namespace Compression = mpqx::Compression;
namespace FileFlags = mpqx::FileFlags;

namespace {

std::vector<uint8_t> toBytes(const std::string &text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

// Several sectors of text with zero padding between paragraphs
std::vector<uint8_t> samplePayload(size_t size) {
  std::vector<uint8_t> data(size);
  const std::string text = "Ready for action. Job's done! ";
  for (size_t i = 0; i < size; ++i) {
    data[i] = (i % 700) < 80 ? 0 : static_cast<uint8_t>(text[i % text.size()]);
  }
  return data;
}

} // namespace

class WriterTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "mpqx_test_writer";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createTestFile(const std::string &name, const std::string &content) {
    fs::path path = tempDir_ / name;
    std::ofstream file(path, std::ios::binary);
    file << content;
    return path;
  }

  fs::path tempDir_;
};

TEST_F(WriterTest, WriteAndReadSingleFile) {
  mpqx::Writer writer;
  mpqx::Error error;
  auto content = toBytes("Hello, MPQ");
  ASSERT_TRUE(writer.addFile(content, "test.txt", &error)) << error.message;
  EXPECT_EQ(writer.fileCount(), 1u);

  fs::path archivePath = tempDir_ / "single.mpq";
  ASSERT_TRUE(writer.write(archivePath, &error)) << error.message;

  auto reader = mpqx::Reader::open(archivePath, &error);
  ASSERT_TRUE(reader.has_value()) << error.message;
  EXPECT_EQ(reader->header().format(), mpqx::Format::Basic);
  EXPECT_EQ(reader->header().archiveSize(), fs::file_size(archivePath));

  auto data = reader->readFile("test.txt", 0, 0, &error);
  ASSERT_TRUE(data.has_value()) << error.message;
  EXPECT_EQ(*data, content);
}

// The generated (listfile) names every entry
TEST_F(WriterTest, ListFileNamesEntries) {
  mpqx::Writer writer;
  ASSERT_TRUE(writer.addFile(toBytes("a"), "scripts\\war3map.j"));
  ASSERT_TRUE(writer.addFile(toBytes("b"), "war3map.w3e"));

  auto bytes = writer.writeToMemory();
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(writer.files().size(), 3u);

  auto reader = mpqx::Reader::openMemory(std::move(*bytes));
  ASSERT_TRUE(reader.has_value());

  std::vector<std::string> names;
  for (const auto &entry : reader->files()) {
    names.push_back(entry.name);
  }
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"(listfile)", "scripts\\war3map.j", "war3map.w3e"}));

  auto listFile = reader->readFile("(listfile)");
  ASSERT_TRUE(listFile.has_value());
  EXPECT_EQ(std::string(listFile->begin(), listFile->end()),
            "scripts\\war3map.j\r\nwar3map.w3e\r\n");
}

TEST_F(WriterTest, WithoutListFile) {
  mpqx::WriteOptions options;
  options.addListFile = false;
  mpqx::Writer writer(options);
  ASSERT_TRUE(writer.addFile(toBytes("content"), "file.bin"));

  auto bytes = writer.writeToMemory();
  ASSERT_TRUE(bytes.has_value());
  auto reader = mpqx::Reader::openMemory(std::move(*bytes));
  ASSERT_TRUE(reader.has_value());

  ASSERT_EQ(reader->fileCount(), 1u);
  EXPECT_FALSE(reader->files()[0].hasName());
  EXPECT_FALSE(reader->fileExists("(listfile)"));
  EXPECT_TRUE(reader->fileExists("file.bin"));
}

TEST_F(WriterTest, EmptyArchive) {
  mpqx::WriteOptions options;
  options.addListFile = false;
  mpqx::Writer writer(options);

  mpqx::Error error;
  auto bytes = writer.writeToMemory(&error);
  ASSERT_TRUE(bytes.has_value()) << error.message;

  auto reader = mpqx::Reader::openMemory(std::move(*bytes), &error);
  ASSERT_TRUE(reader.has_value()) << error.message;
  EXPECT_EQ(reader->fileCount(), 0u);
  EXPECT_EQ(reader->hashTable().size(), 4u);
}

TEST_F(WriterTest, EmptyFile) {
  mpqx::Writer writer;
  mpqx::AddFileOptions options;
  options.compression = Compression::Zlib;
  ASSERT_TRUE(writer.addFile(std::span<const uint8_t>(), "empty.txt", options));

  auto bytes = writer.writeToMemory();
  ASSERT_TRUE(bytes.has_value());
  auto reader = mpqx::Reader::openMemory(std::move(*bytes));
  ASSERT_TRUE(reader.has_value());

  auto data = reader->readFile("empty.txt");
  ASSERT_TRUE(data.has_value());
  EXPECT_TRUE(data->empty());
}

TEST_F(WriterTest, AddFileFromDisk) {
  fs::path source = createTestFile("source.txt", "from disk");

  mpqx::Writer writer;
  mpqx::Error error;
  ASSERT_TRUE(writer.addFile(source, "docs\\source.txt", &error)) << error.message;

  auto bytes = writer.writeToMemory(&error);
  ASSERT_TRUE(bytes.has_value()) << error.message;
  auto reader = mpqx::Reader::openMemory(std::move(*bytes));
  ASSERT_TRUE(reader.has_value());
  auto data = reader->readFile("docs\\source.txt");
  ASSERT_TRUE(data.has_value());
  EXPECT_EQ(std::string(data->begin(), data->end()), "from disk");
}

TEST_F(WriterTest, AddMissingSourceFile) {
  mpqx::Writer writer;
  mpqx::Error error;
  EXPECT_FALSE(writer.addFile(tempDir_ / "missing.txt", "missing.txt", &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::IoError);
  EXPECT_EQ(writer.fileCount(), 0u);
}

TEST_F(WriterTest, DuplicateNameAndLocaleRejected) {
  mpqx::Writer writer;
  mpqx::Error error;
  ASSERT_TRUE(writer.addFile(toBytes("1"), "units\\footman.txt"));
  EXPECT_FALSE(writer.addFile(toBytes("2"), "UNITS/FOOTMAN.TXT", &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::DuplicateEntry);

  mpqx::AddFileOptions german;
  german.locale = 0x407;
  EXPECT_TRUE(writer.addFile(toBytes("3"), "units\\footman.txt", german, &error))
      << error.message;
  EXPECT_EQ(writer.fileCount(), 2u);

  auto bytes = writer.writeToMemory();
  ASSERT_TRUE(bytes.has_value());
  auto reader = mpqx::Reader::openMemory(std::move(*bytes));
  ASSERT_TRUE(reader.has_value());
  auto germanData = reader->readFile("units\\footman.txt", 0x407);
  ASSERT_TRUE(germanData.has_value());
  EXPECT_EQ(*germanData, toBytes("3"));
  auto neutral = reader->readFile("units\\footman.txt");
  ASSERT_TRUE(neutral.has_value());
  EXPECT_EQ(*neutral, toBytes("1"));
}

TEST_F(WriterTest, RemoveFile) {
  mpqx::Writer writer;
  ASSERT_TRUE(writer.addFile(toBytes("keep"), "keep.txt"));
  ASSERT_TRUE(writer.addFile(toBytes("drop"), "drop.txt"));

  mpqx::Error error;
  ASSERT_TRUE(writer.removeFile("DROP.TXT", 0, &error)) << error.message;
  EXPECT_EQ(writer.fileCount(), 1u);
  EXPECT_FALSE(writer.removeFile("drop.txt", 0, &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::NotFound);

  auto bytes = writer.writeToMemory();
  ASSERT_TRUE(bytes.has_value());
  auto reader = mpqx::Reader::openMemory(std::move(*bytes));
  ASSERT_TRUE(reader.has_value());
  EXPECT_TRUE(reader->fileExists("keep.txt"));
  EXPECT_FALSE(reader->fileExists("drop.txt"));
}

TEST_F(WriterTest, InvalidFileOptions) {
  mpqx::Writer writer;
  mpqx::Error error;

  mpqx::AddFileOptions fixKeyOnly;
  fixKeyOnly.fixKey = true;
  EXPECT_FALSE(writer.addFile(toBytes("x"), "a.txt", fixKeyOnly, &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::InvalidArgument);

  mpqx::AddFileOptions lzma;
  lzma.compression = Compression::Lzma;
  EXPECT_FALSE(writer.addFile(toBytes("x"), "b.txt", lzma, &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::UnsupportedCompression);

  EXPECT_FALSE(writer.addFile(toBytes("x"), "", &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::InvalidArgument);
}

TEST_F(WriterTest, HashTableSizeOptions) {
  mpqx::WriteOptions notPowerOfTwo;
  notPowerOfTwo.hashTableSize = 12;
  mpqx::Writer first(notPowerOfTwo);
  ASSERT_TRUE(first.addFile(toBytes("x"), "x.txt"));

  mpqx::Error error;
  EXPECT_FALSE(first.writeToMemory(&error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::InvalidArgument);

  mpqx::WriteOptions tooSmall;
  tooSmall.hashTableSize = 4;
  mpqx::Writer second(tooSmall);
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(second.addFile(toBytes("x"), std::format("file{}.txt", i)));
  }
  EXPECT_FALSE(second.writeToMemory(&error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::TableFull);

  mpqx::WriteOptions large;
  large.hashTableSize = 256;
  mpqx::Writer third(large);
  ASSERT_TRUE(third.addFile(toBytes("x"), "x.txt"));
  auto bytes = third.writeToMemory(&error);
  ASSERT_TRUE(bytes.has_value()) << error.message;
  auto reader = mpqx::Reader::openMemory(std::move(*bytes));
  ASSERT_TRUE(reader.has_value());
  EXPECT_EQ(reader->hashTable().size(), 256u);
}

TEST_F(WriterTest, SmallestSectorSize) {
  mpqx::WriteOptions options;
  options.sectorSizeExponent = 0;
  mpqx::Writer writer(options);

  mpqx::AddFileOptions fileOptions;
  fileOptions.compression = Compression::Zlib;
  fileOptions.sectorCrc = true;
  const auto payload = samplePayload(2000);
  mpqx::Error error;
  ASSERT_TRUE(writer.addFile(payload, "units\\peasant.txt", fileOptions, &error)) << error.message;

  auto bytes = writer.writeToMemory(&error);
  ASSERT_TRUE(bytes.has_value()) << error.message;
  auto reader = mpqx::Reader::openMemory(std::move(*bytes), &error);
  ASSERT_TRUE(reader.has_value()) << error.message;
  EXPECT_EQ(reader->header().sectorSize(), 512u);

  auto data = reader->readFile("units\\peasant.txt", 0, 0, &error);
  ASSERT_TRUE(data.has_value()) << error.message;
  EXPECT_EQ(*data, payload);
}

TEST_F(WriterTest, OversizedSectorSizeExponent) {
  mpqx::WriteOptions options;
  options.sectorSizeExponent = static_cast<uint16_t>(mpqx::Header::maxSectorSizeExponent + 1);
  mpqx::Writer writer(options);

  mpqx::Error error;
  EXPECT_FALSE(writer.writeToMemory(&error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::InvalidArgument);
}

TEST_F(WriterTest, CompressedTables) {
  mpqx::WriteOptions options;
  options.format = mpqx::Format::ExtendedV3;
  options.compressTables = true;
  mpqx::Writer writer(options);
  for (int i = 0; i < 16; ++i) {
    ASSERT_TRUE(writer.addFile(toBytes(std::format("file {}", i)), std::format("data\\{}.txt", i)));
  }

  mpqx::Error error;
  auto bytes = writer.writeToMemory(&error);
  ASSERT_TRUE(bytes.has_value()) << error.message;
  auto reader = mpqx::Reader::openMemory(std::move(*bytes), &error);
  ASSERT_TRUE(reader.has_value()) << error.message;

  EXPECT_TRUE(reader->header().isHashTableCompressed());
  EXPECT_TRUE(reader->header().verifyHeaderDigest());
  EXPECT_EQ(reader->fileCount(), 17u);
  for (int i = 0; i < 16; ++i) {
    auto data = reader->readFile(std::format("data\\{}.txt", i), 0, 0, &error);
    ASSERT_TRUE(data.has_value()) << error.message;
    EXPECT_EQ(std::string(data->begin(), data->end()), std::format("file {}", i));
  }
}

TEST_F(WriterTest, TableDigestsCoverStoredBytes) {
  mpqx::WriteOptions options;
  options.format = mpqx::Format::ExtendedV3;
  mpqx::Writer writer(options);
  ASSERT_TRUE(writer.addFile(toBytes("digest me"), "digest.txt"));

  mpqx::Error error;
  auto bytes = writer.writeToMemory(&error);
  ASSERT_TRUE(bytes.has_value()) << error.message;
  const std::vector<uint8_t> archive = *bytes;

  auto reader = mpqx::Reader::openMemory(std::move(*bytes), &error);
  ASSERT_TRUE(reader.has_value()) << error.message;
  const auto &header = reader->header();
  ASSERT_TRUE(header.extendedV3().has_value());

  auto stored = std::span<const uint8_t>(archive).subspan(header.hashTableOffset(),
                                                          header.storedHashTableSize());
  auto digest = mpqx::md5(stored, &error);
  ASSERT_TRUE(digest.has_value()) << error.message;
  EXPECT_EQ(*digest, header.extendedV3()->hashTableDigest);
  EXPECT_FALSE(mpqx::isZeroDigest(header.extendedV3()->blockTableDigest));
  EXPECT_TRUE(header.verifyHeaderDigest(&error)) << error.message;
}

TEST_F(WriterTest, ArchiveFacadeRoundTrip) {
  mpqx::WriteOptions options;
  options.format = mpqx::Format::ExtendedV2;
  auto archive = mpqx::Archive::create(options);

  mpqx::AddFileOptions fileOptions;
  fileOptions.compression = Compression::Bzip2;
  fileOptions.encrypt = true;
  mpqx::Error error;
  ASSERT_TRUE(archive.addFile(samplePayload(9000), "sound\\intro.wav", fileOptions, &error))
      << error.message;

  fs::path archivePath = tempDir_ / "facade.mpq";
  ASSERT_TRUE(archive.write(archivePath, &error)) << error.message;

  auto opened = mpqx::Archive::open(archivePath, &error);
  ASSERT_TRUE(opened.has_value()) << error.message;
  ASSERT_NE(opened->header(), nullptr);
  EXPECT_EQ(opened->header()->format(), mpqx::Format::ExtendedV2);
  EXPECT_TRUE(opened->fileExists("sound\\intro.wav"));

  auto data = opened->readFile("sound\\intro.wav", 0, 0, &error);
  ASSERT_TRUE(data.has_value()) << error.message;
  EXPECT_EQ(*data, samplePayload(9000));

  fs::path extracted = tempDir_ / "extracted" / "intro.wav";
  ASSERT_TRUE(opened->extract("sound\\intro.wav", extracted, &error)) << error.message;
  EXPECT_EQ(fs::file_size(extracted), 9000u);
}

struct EndToEndCase {
  const char *name;
  mpqx::Format format;
  uint8_t compression;
  bool encrypt;
  bool fixKey;
  bool singleUnit;
  bool sectorCrc;
};

class WriterEndToEndTest : public ::testing::TestWithParam<EndToEndCase> {};

TEST_P(WriterEndToEndTest, RoundTrip) {
  const auto &param = GetParam();

  mpqx::WriteOptions options;
  options.format = param.format;
  options.sectorSizeExponent = 1; // 1 KiB sectors, several per file
  mpqx::Writer writer(options);

  mpqx::AddFileOptions fileOptions;
  fileOptions.compression = param.compression;
  fileOptions.encrypt = param.encrypt;
  fileOptions.fixKey = param.fixKey;
  fileOptions.singleUnit = param.singleUnit;
  fileOptions.sectorCrc = param.sectorCrc;

  const auto big = samplePayload(5000);
  const auto small = samplePayload(300);
  mpqx::Error error;
  ASSERT_TRUE(writer.addFile(big, "data\\big.bin", fileOptions, &error)) << error.message;
  ASSERT_TRUE(writer.addFile(small, "small.bin", fileOptions, &error)) << error.message;

  auto bytes = writer.writeToMemory(&error);
  ASSERT_TRUE(bytes.has_value()) << error.message;
  const size_t archiveSize = bytes->size();

  auto reader = mpqx::Reader::openMemory(std::move(*bytes), &error);
  ASSERT_TRUE(reader.has_value()) << error.message;
  EXPECT_EQ(reader->header().format(), param.format);
  EXPECT_EQ(reader->header().archiveSize(), archiveSize);
  EXPECT_EQ(reader->fileCount(), 3u);

  auto bigData = reader->readFile("data\\big.bin", 0, 0, &error);
  ASSERT_TRUE(bigData.has_value()) << error.message;
  EXPECT_EQ(*bigData, big);

  auto smallData = reader->readFile("small.bin", 0, 0, &error);
  ASSERT_TRUE(smallData.has_value()) << error.message;
  EXPECT_EQ(*smallData, small);

  auto entry = reader->findFile("data\\big.bin");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ((entry->flags & FileFlags::Encrypted) != 0, param.encrypt);
  EXPECT_EQ((entry->flags & FileFlags::FixKey) != 0, param.fixKey);
  EXPECT_EQ((entry->flags & FileFlags::SingleUnit) != 0, param.singleUnit);
  EXPECT_EQ((entry->flags & FileFlags::Compress) != 0, param.compression != 0);
  if (param.compression != 0) {
    EXPECT_LT(entry->compressedSize, entry->size);
  }
}

INSTANTIATE_TEST_SUITE_P(
    Variants, WriterEndToEndTest,
    ::testing::Values(
        EndToEndCase{"BasicStored", mpqx::Format::Basic, 0, false, false, false, false},
        EndToEndCase{"BasicZlib", mpqx::Format::Basic, Compression::Zlib, false, false, false,
                     false},
        EndToEndCase{"BasicEncrypted", mpqx::Format::Basic, 0, true, false, false, false},
        EndToEndCase{"BasicFixKey", mpqx::Format::Basic, Compression::Zlib, true, true, false,
                     false},
        EndToEndCase{"BasicSingleUnit", mpqx::Format::Basic, Compression::Zlib, false, false,
                     true, false},
        EndToEndCase{"BasicSectorCrc", mpqx::Format::Basic, Compression::Zlib, false, false,
                     false, true},
        EndToEndCase{"V1Bzip2", mpqx::Format::ExtendedV1, Compression::Bzip2, false, false, false,
                     false},
        EndToEndCase{"V1EncryptedCrc", mpqx::Format::ExtendedV1, Compression::Zlib, true, false,
                     false, true},
        EndToEndCase{"V2SparseZlib", mpqx::Format::ExtendedV2,
                     static_cast<uint8_t>(Compression::Sparse | Compression::Zlib), false, false,
                     false, false},
        EndToEndCase{"V2SingleUnitFixKey", mpqx::Format::ExtendedV2, Compression::Bzip2, true,
                     true, true, false},
        EndToEndCase{"V3Stored", mpqx::Format::ExtendedV3, 0, false, false, false, false},
        EndToEndCase{"V3Everything", mpqx::Format::ExtendedV3,
                     static_cast<uint8_t>(Compression::Sparse | Compression::Bzip2), true, true,
                     false, true}),
    [](const ::testing::TestParamInfo<EndToEndCase> &info) {
      return std::string(info.param.name);
    });
