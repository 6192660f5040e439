#include <algorithm>
#include <format>

#include <mpqx/block_table.hpp>
#include <mpqx/endian.hpp>

namespace mpqx {

std::optional<BlockTable> BlockTable::fromBytes(std::span<const uint8_t> data, uint32_t entryCount,
                                                Error *outError) {
  if (data.size() < static_cast<uint64_t>(entryCount) * BlockEntry::entrySize) {
    detail::setError(outError, ErrorCode::TruncatedTable,
                     std::format("Block table truncated ({} bytes for {} entries)", data.size(),
                                 entryCount));
    return std::nullopt;
  }

  BlockTable table;
  table.entries_.resize(entryCount);
  table.hiWords_.assign(entryCount, 0);

  const uint8_t *p = data.data();
  for (auto &entry : table.entries_) {
    entry.filePosition = load32(p);
    entry.compressedSize = load32(p + 4);
    entry.uncompressedSize = load32(p + 8);
    entry.flags = load32(p + 12);
    p += BlockEntry::entrySize;
  }

  return table;
}

bool BlockTable::setHiBlockWords(std::span<const uint8_t> data, Error *outError) {
  if (data.size() < entries_.size() * sizeof(uint16_t)) {
    detail::setError(outError, ErrorCode::TruncatedTable,
                     std::format("Hi-block table truncated ({} bytes for {} entries)", data.size(),
                                 entries_.size()));
    return false;
  }

  for (size_t i = 0; i < hiWords_.size(); ++i) {
    hiWords_[i] = load16(data.data() + i * sizeof(uint16_t));
  }
  return true;
}

uint32_t BlockTable::append(const BlockEntry &entry, uint16_t hiWord) {
  entries_.push_back(entry);
  hiWords_.push_back(hiWord);
  return static_cast<uint32_t>(entries_.size() - 1);
}

std::optional<BlockEntry> BlockTable::resolve(uint32_t index, Error *outError) const {
  if (index >= entries_.size()) {
    detail::setError(outError, ErrorCode::OutOfRange,
                     std::format("Block index {} out of range (table has {} entries)", index,
                                 entries_.size()));
    return std::nullopt;
  }

  const auto &entry = entries_[index];
  if (!entry.exists()) {
    detail::setError(outError, ErrorCode::Deleted,
                     std::format("Block {} does not hold a file (flags {:#010x})", index,
                                 entry.flags));
    return std::nullopt;
  }

  return entry;
}

uint64_t BlockTable::filePosition(uint32_t index) const {
  if (index >= entries_.size()) {
    return 0;
  }
  return (static_cast<uint64_t>(hiWords_[index]) << 32) | entries_[index].filePosition;
}

bool BlockTable::needsHiBlockTable() const {
  return std::any_of(hiWords_.begin(), hiWords_.end(), [](uint16_t word) { return word != 0; });
}

std::vector<uint8_t> BlockTable::serialize() const {
  std::vector<uint8_t> out(entries_.size() * BlockEntry::entrySize);
  uint8_t *p = out.data();
  for (const auto &entry : entries_) {
    store32(p, entry.filePosition);
    store32(p + 4, entry.compressedSize);
    store32(p + 8, entry.uncompressedSize);
    store32(p + 12, entry.flags);
    p += BlockEntry::entrySize;
  }
  return out;
}

std::vector<uint8_t> BlockTable::serializeHiBlockWords() const {
  std::vector<uint8_t> out(hiWords_.size() * sizeof(uint16_t));
  for (size_t i = 0; i < hiWords_.size(); ++i) {
    store16(out.data() + i * sizeof(uint16_t), hiWords_[i]);
  }
  return out;
}

} // namespace mpqx
