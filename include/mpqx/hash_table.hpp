#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace mpqx {

// How a probe treats a slot
enum class SlotState {
  NeverUsed, // Ends the probe
  Deleted,   // Skipped by lookups, reusable by inserts
  Live,
};

struct HashEntry {
  static constexpr uint32_t neverUsed = 0xFFFFFFFF;
  static constexpr uint32_t deleted = 0xFFFFFFFE;
  static constexpr size_t entrySize = 16;

  uint32_t nameHashA = 0xFFFFFFFF;
  uint32_t nameHashB = 0xFFFFFFFF;
  uint16_t locale = 0xFFFF;
  uint16_t platform = 0xFFFF;
  uint32_t blockIndex = neverUsed;

  SlotState state() const {
    switch (blockIndex) {
    case neverUsed:
      return SlotState::NeverUsed;
    case deleted:
      return SlotState::Deleted;
    default:
      return SlotState::Live;
    }
  }
};

// The three hashes identifying a name in the hash table
struct NameHashes {
  uint32_t tableOffset = 0;
  uint32_t nameA = 0;
  uint32_t nameB = 0;

  static NameHashes of(std::string_view name) noexcept;
};

// Open-addressed table mapping names to block indices
class HashTable {
public:
  HashTable() = default;

  // Empty table; the entry count must be a power of two
  static std::optional<HashTable> create(uint32_t entryCount, Error *outError = nullptr);

  // Table from decrypted on-disk bytes
  static std::optional<HashTable> fromBytes(std::span<const uint8_t> data, uint32_t entryCount,
                                            Error *outError = nullptr);

  static bool isPowerOfTwo(uint32_t value) noexcept { return value != 0 && (value & (value - 1)) == 0; }

  // Smallest power of two able to hold the given number of files (at least 4)
  static uint32_t sizeForFileCount(uint32_t fileCount) noexcept;

  // Block index of the exact (name, locale, platform) tuple
  std::optional<uint32_t> lookup(std::string_view name, uint16_t locale = neutralLocale,
                                 uint16_t platform = defaultPlatform,
                                 Error *outError = nullptr) const;

  // Slot index of the exact tuple
  std::optional<uint32_t> findSlot(const NameHashes &hashes, uint16_t locale,
                                   uint16_t platform) const;

  bool insert(std::string_view name, uint16_t locale, uint16_t platform, uint32_t blockIndex,
              Error *outError = nullptr);

  // Marks the tuple's slot deleted
  bool remove(std::string_view name, uint16_t locale = neutralLocale,
              uint16_t platform = defaultPlatform, Error *outError = nullptr);

  // Unencrypted on-disk representation
  std::vector<uint8_t> serialize() const;

  const std::vector<HashEntry> &entries() const { return entries_; }
  uint32_t size() const { return static_cast<uint32_t>(entries_.size()); }
  bool empty() const { return entries_.empty(); }

private:
  explicit HashTable(std::vector<HashEntry> entries) : entries_(std::move(entries)) {}

  uint32_t mask() const { return size() - 1; }

  std::vector<HashEntry> entries_;
};

} // namespace mpqx
