#include <format>
#include <string>

#include <mpqx/hash_table.hpp>

#include <gtest/gtest.h>

using mpqx::HashTable;

TEST(HashTableTest, RejectsNonPowerOfTwoSizes) {
  for (uint32_t count : {0u, 3u, 5u, 100u}) {
    mpqx::Error error;
    EXPECT_FALSE(HashTable::create(count, &error).has_value()) << count;
    EXPECT_EQ(error.code, mpqx::ErrorCode::InvalidArgument);
  }
  EXPECT_TRUE(HashTable::create(16).has_value());
}

TEST(HashTableTest, FromBytesValidatesSize) {
  std::vector<uint8_t> bytes(3 * mpqx::HashEntry::entrySize, 0xFF);
  mpqx::Error error;
  EXPECT_FALSE(HashTable::fromBytes(bytes, 3, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::CorruptTable);

  EXPECT_FALSE(HashTable::fromBytes(bytes, 4, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::TruncatedTable);
}

TEST(HashTableTest, SizeForFileCount) {
  EXPECT_EQ(HashTable::sizeForFileCount(0), 4u);
  EXPECT_EQ(HashTable::sizeForFileCount(4), 4u);
  EXPECT_EQ(HashTable::sizeForFileCount(5), 8u);
  EXPECT_EQ(HashTable::sizeForFileCount(1000), 1024u);
}

TEST(HashTableTest, InsertThenLookup) {
  auto table = HashTable::create(64);
  ASSERT_TRUE(table.has_value());

  for (uint32_t i = 0; i < 40; ++i) {
    mpqx::Error error;
    ASSERT_TRUE(table->insert(std::format("data\\file{}.dat", i), 0, 0, i, &error))
        << error.message;
  }

  for (uint32_t i = 0; i < 40; ++i) {
    auto index = table->lookup(std::format("DATA/FILE{}.DAT", i));
    ASSERT_TRUE(index.has_value()) << i;
    EXPECT_EQ(*index, i);
  }

  mpqx::Error error;
  EXPECT_FALSE(table->lookup("data\\missing.dat", 0, 0, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::NotFound);
}

TEST(HashTableTest, LocalesAreDistinctTuples) {
  auto table = HashTable::create(8);
  ASSERT_TRUE(table.has_value());
  ASSERT_TRUE(table->insert("readme.txt", 0, 0, 0));
  ASSERT_TRUE(table->insert("readme.txt", 0x407, 0, 1));

  EXPECT_EQ(table->lookup("readme.txt", 0).value(), 0u);
  EXPECT_EQ(table->lookup("readme.txt", 0x407).value(), 1u);
  EXPECT_FALSE(table->lookup("readme.txt", 0x409).has_value());
}

TEST(HashTableTest, DuplicateTupleRejected) {
  auto table = HashTable::create(8);
  ASSERT_TRUE(table.has_value());
  ASSERT_TRUE(table->insert("a.txt", 0, 0, 0));

  mpqx::Error error;
  EXPECT_FALSE(table->insert("A.TXT", 0, 0, 1, &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::DuplicateEntry);
}

TEST(HashTableTest, FullTable) {
  auto table = HashTable::create(4);
  ASSERT_TRUE(table.has_value());
  for (uint32_t i = 0; i < 4; ++i) {
    ASSERT_TRUE(table->insert(std::format("f{}", i), 0, 0, i));
  }

  mpqx::Error error;
  EXPECT_FALSE(table->insert("f4", 0, 0, 4, &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::TableFull);
}

// A deleted slot does not end the probe, so entries inserted after it stay
// reachable
TEST(HashTableTest, DeletedSlotsKeepChainsReachable) {
  auto table = HashTable::create(4);
  ASSERT_TRUE(table.has_value());
  for (uint32_t i = 0; i < 4; ++i) {
    ASSERT_TRUE(table->insert(std::format("f{}", i), 0, 0, i));
  }

  ASSERT_TRUE(table->remove("f0"));
  EXPECT_FALSE(table->lookup("f0").has_value());
  for (uint32_t i = 1; i < 4; ++i) {
    EXPECT_EQ(table->lookup(std::format("f{}", i)).value(), i);
  }

  // The freed slot is reused
  EXPECT_TRUE(table->insert("f4", 0, 0, 4));
  EXPECT_EQ(table->lookup("f4").value(), 4u);
}

TEST(HashTableTest, RemoveMissing) {
  auto table = HashTable::create(4);
  ASSERT_TRUE(table.has_value());
  mpqx::Error error;
  EXPECT_FALSE(table->remove("nothing", 0, 0, &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::NotFound);
}

TEST(HashTableTest, SentinelBlockIndexRejected) {
  auto table = HashTable::create(4);
  ASSERT_TRUE(table.has_value());
  mpqx::Error error;
  EXPECT_FALSE(table->insert("x", 0, 0, mpqx::HashEntry::deleted, &error));
  EXPECT_EQ(error.code, mpqx::ErrorCode::InvalidArgument);
}

TEST(HashTableTest, SerializeRoundTrip) {
  auto table = HashTable::create(8);
  ASSERT_TRUE(table.has_value());
  ASSERT_TRUE(table->insert("war3map.j", 0x409, 0, 3));
  ASSERT_TRUE(table->insert("war3map.w3e", 0, 0, 7));
  ASSERT_TRUE(table->remove("war3map.w3e"));

  auto bytes = table->serialize();
  ASSERT_EQ(bytes.size(), 8 * mpqx::HashEntry::entrySize);

  auto parsed = HashTable::fromBytes(bytes, 8);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->lookup("war3map.j", 0x409).value(), 3u);
  EXPECT_FALSE(parsed->lookup("war3map.w3e").has_value());

  size_t deleted = 0;
  size_t neverUsed = 0;
  for (const auto &entry : parsed->entries()) {
    deleted += entry.state() == mpqx::SlotState::Deleted;
    neverUsed += entry.state() == mpqx::SlotState::NeverUsed;
  }
  EXPECT_EQ(deleted, 1u);
  EXPECT_EQ(neverUsed, 6u);
}
