#include <format>

#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/hash_table.hpp>

namespace mpqx {

NameHashes NameHashes::of(std::string_view name) noexcept {
  NameHashes hashes;
  hashes.tableOffset = hashString(name, HashType::TableOffset);
  hashes.nameA = hashString(name, HashType::NameA);
  hashes.nameB = hashString(name, HashType::NameB);
  return hashes;
}

std::optional<HashTable> HashTable::create(uint32_t entryCount, Error *outError) {
  if (!isPowerOfTwo(entryCount)) {
    detail::setError(outError, ErrorCode::InvalidArgument,
                     std::format("Hash table size must be a power of two (got {})", entryCount));
    return std::nullopt;
  }
  return HashTable(std::vector<HashEntry>(entryCount));
}

std::optional<HashTable> HashTable::fromBytes(std::span<const uint8_t> data, uint32_t entryCount,
                                              Error *outError) {
  if (!isPowerOfTwo(entryCount)) {
    detail::setError(outError, ErrorCode::CorruptTable,
                     std::format("Hash table size must be a power of two (got {})", entryCount));
    return std::nullopt;
  }

  if (data.size() < static_cast<uint64_t>(entryCount) * HashEntry::entrySize) {
    detail::setError(outError, ErrorCode::TruncatedTable,
                     std::format("Hash table truncated ({} bytes for {} entries)", data.size(),
                                 entryCount));
    return std::nullopt;
  }

  std::vector<HashEntry> entries(entryCount);
  const uint8_t *p = data.data();
  for (auto &entry : entries) {
    entry.nameHashA = load32(p);
    entry.nameHashB = load32(p + 4);
    entry.locale = load16(p + 8);
    entry.platform = load16(p + 10);
    entry.blockIndex = load32(p + 12);
    p += HashEntry::entrySize;
  }

  return HashTable(std::move(entries));
}

uint32_t HashTable::sizeForFileCount(uint32_t fileCount) noexcept {
  uint32_t size = 4;
  while (size < fileCount && size < 0x80000000u) {
    size <<= 1;
  }
  return size;
}

std::optional<uint32_t> HashTable::findSlot(const NameHashes &hashes, uint16_t locale,
                                            uint16_t platform) const {
  if (entries_.empty()) {
    return std::nullopt;
  }

  const uint32_t start = hashes.tableOffset & mask();
  uint32_t index = start;

  do {
    const auto &entry = entries_[index];
    switch (entry.state()) {
    case SlotState::NeverUsed:
      return std::nullopt;
    case SlotState::Deleted:
      break;
    case SlotState::Live:
      if (entry.nameHashA == hashes.nameA && entry.nameHashB == hashes.nameB &&
          entry.locale == locale && entry.platform == platform) {
        return index;
      }
      break;
    }
    index = (index + 1) & mask();
  } while (index != start);

  return std::nullopt;
}

std::optional<uint32_t> HashTable::lookup(std::string_view name, uint16_t locale,
                                          uint16_t platform, Error *outError) const {
  auto slot = findSlot(NameHashes::of(name), locale, platform);
  if (!slot) {
    detail::setError(outError, ErrorCode::NotFound,
                     std::format("File not found: {} (locale {:#06x})", name, locale));
    return std::nullopt;
  }
  return entries_[*slot].blockIndex;
}

bool HashTable::insert(std::string_view name, uint16_t locale, uint16_t platform,
                       uint32_t blockIndex, Error *outError) {
  if (blockIndex >= HashEntry::deleted) {
    detail::setError(outError, ErrorCode::InvalidArgument,
                     std::format("Block index {:#x} collides with a sentinel", blockIndex));
    return false;
  }

  if (entries_.empty()) {
    detail::setError(outError, ErrorCode::TableFull, "Hash table has no entries");
    return false;
  }

  const NameHashes hashes = NameHashes::of(name);
  const uint32_t start = hashes.tableOffset & mask();
  std::optional<uint32_t> freeSlot;
  uint32_t index = start;

  // Keep probing past the first free slot until the chain ends so that an
  // identical live tuple further on is still detected
  do {
    const auto &entry = entries_[index];
    const SlotState state = entry.state();

    if (state == SlotState::Live) {
      if (entry.nameHashA == hashes.nameA && entry.nameHashB == hashes.nameB &&
          entry.locale == locale && entry.platform == platform) {
        detail::setError(outError, ErrorCode::DuplicateEntry,
                         std::format("Duplicate hash table entry: {} (locale {:#06x})", name,
                                     locale));
        return false;
      }
    } else if (!freeSlot) {
      freeSlot = index;
    }

    if (state == SlotState::NeverUsed) {
      break;
    }
    index = (index + 1) & mask();
  } while (index != start);

  if (!freeSlot) {
    detail::setError(outError, ErrorCode::TableFull,
                     std::format("Hash table is full ({} entries)", entries_.size()));
    return false;
  }

  auto &entry = entries_[*freeSlot];
  entry.nameHashA = hashes.nameA;
  entry.nameHashB = hashes.nameB;
  entry.locale = locale;
  entry.platform = platform;
  entry.blockIndex = blockIndex;
  return true;
}

bool HashTable::remove(std::string_view name, uint16_t locale, uint16_t platform,
                       Error *outError) {
  auto slot = findSlot(NameHashes::of(name), locale, platform);
  if (!slot) {
    detail::setError(outError, ErrorCode::NotFound,
                     std::format("File not found: {} (locale {:#06x})", name, locale));
    return false;
  }

  entries_[*slot].blockIndex = HashEntry::deleted;
  return true;
}

std::vector<uint8_t> HashTable::serialize() const {
  std::vector<uint8_t> out(entries_.size() * HashEntry::entrySize);
  uint8_t *p = out.data();
  for (const auto &entry : entries_) {
    store32(p, entry.nameHashA);
    store32(p + 4, entry.nameHashB);
    store16(p + 8, entry.locale);
    store16(p + 10, entry.platform);
    store32(p + 12, entry.blockIndex);
    p += HashEntry::entrySize;
  }
  return out;
}

} // namespace mpqx
