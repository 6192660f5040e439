#include <vector>

#include <mpqx/block_table.hpp>
#include <mpqx/endian.hpp>

#include <gtest/gtest.h>

using mpqx::BlockEntry;
using mpqx::BlockTable;
namespace FileFlags = mpqx::FileFlags;

TEST(BlockTableTest, ResolveOutOfRange) {
  BlockTable table;
  table.append(BlockEntry{0x20, 5, 5, FileFlags::Exists});

  mpqx::Error error;
  EXPECT_FALSE(table.resolve(1, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::OutOfRange);
  EXPECT_TRUE(table.resolve(0).has_value());
}

TEST(BlockTableTest, ResolveMissingOrDeletedBlock) {
  BlockTable table;
  table.append(BlockEntry{0x20, 5, 5, 0});
  table.append(BlockEntry{0x25, 5, 5, FileFlags::Exists | FileFlags::DeleteMarker});

  mpqx::Error error;
  EXPECT_FALSE(table.resolve(0, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::Deleted);
  EXPECT_FALSE(table.resolve(1, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::Deleted);
}

TEST(BlockTableTest, FlagAccessors) {
  BlockEntry entry{0, 0, 0,
                   FileFlags::Exists | FileFlags::Compress | FileFlags::Encrypted |
                       FileFlags::FixKey | FileFlags::SectorCrc};
  EXPECT_TRUE(entry.exists());
  EXPECT_TRUE(entry.isCompressed());
  EXPECT_FALSE(entry.isImploded());
  EXPECT_TRUE(entry.isEncrypted());
  EXPECT_TRUE(entry.hasFixKey());
  EXPECT_FALSE(entry.isSingleUnit());
  EXPECT_TRUE(entry.hasSectorCrc());
}

TEST(BlockTableTest, SerializeRoundTrip) {
  BlockTable table;
  table.append(BlockEntry{0x20, 100, 200, FileFlags::Exists | FileFlags::Compress});
  table.append(BlockEntry{0x84, 7, 7, FileFlags::Exists});

  auto bytes = table.serialize();
  ASSERT_EQ(bytes.size(), 2 * BlockEntry::entrySize);
  EXPECT_EQ(mpqx::load32(bytes.data() + 16), 0x84u);

  auto parsed = BlockTable::fromBytes(bytes, 2);
  ASSERT_TRUE(parsed.has_value());
  ASSERT_EQ(parsed->size(), 2u);
  EXPECT_EQ(parsed->entries()[0].uncompressedSize, 200u);
  EXPECT_EQ(parsed->entries()[1].flags, FileFlags::Exists);
}

TEST(BlockTableTest, TruncatedBytes) {
  std::vector<uint8_t> bytes(BlockEntry::entrySize + 4);
  mpqx::Error error;
  EXPECT_FALSE(BlockTable::fromBytes(bytes, 2, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::TruncatedTable);
}

TEST(BlockTableTest, HiBlockWords) {
  BlockTable table;
  table.append(BlockEntry{0x20, 1, 1, FileFlags::Exists});
  EXPECT_FALSE(table.needsHiBlockTable());
  table.append(BlockEntry{0x10, 1, 1, FileFlags::Exists}, 0x0002);
  EXPECT_TRUE(table.needsHiBlockTable());

  EXPECT_EQ(table.filePosition(0), 0x20u);
  EXPECT_EQ(table.filePosition(1), 0x200000010ull);

  auto words = table.serializeHiBlockWords();
  auto parsed = BlockTable::fromBytes(table.serialize(), 2);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->filePosition(1), 0x10u);
  ASSERT_TRUE(parsed->setHiBlockWords(words));
  EXPECT_EQ(parsed->filePosition(1), 0x200000010ull);

  mpqx::Error error;
  EXPECT_FALSE(parsed->setHiBlockWords(std::span<const uint8_t>(words.data(), 2), &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::TruncatedTable);
}
