#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "types.hpp"

namespace mpqx {

struct BlockEntry {
  static constexpr size_t entrySize = 16;

  uint32_t filePosition = 0; // Low 32 bits; the hi-block table holds the rest
  uint32_t compressedSize = 0;
  uint32_t uncompressedSize = 0;
  uint32_t flags = 0;

  bool exists() const {
    return (flags & FileFlags::Exists) != 0 && (flags & FileFlags::DeleteMarker) == 0;
  }
  bool isCompressed() const { return (flags & FileFlags::CompressMask) != 0; }
  bool isImploded() const { return (flags & FileFlags::Implode) != 0; }
  bool isEncrypted() const { return (flags & FileFlags::Encrypted) != 0; }
  bool hasFixKey() const { return (flags & FileFlags::FixKey) != 0; }
  bool isSingleUnit() const { return (flags & FileFlags::SingleUnit) != 0; }
  bool hasSectorCrc() const { return (flags & FileFlags::SectorCrc) != 0; }
};

// Block descriptors indexed directly by block index
class BlockTable {
public:
  BlockTable() = default;

  // Table from decrypted on-disk bytes
  static std::optional<BlockTable> fromBytes(std::span<const uint8_t> data, uint32_t entryCount,
                                             Error *outError = nullptr);

  // Load the 16-bit high words of the file positions
  bool setHiBlockWords(std::span<const uint8_t> data, Error *outError = nullptr);

  // Returns the index of the new entry
  uint32_t append(const BlockEntry &entry, uint16_t hiWord = 0);

  // Descriptor of an existing block
  std::optional<BlockEntry> resolve(uint32_t index, Error *outError = nullptr) const;

  // Full 48-bit file position of a block
  uint64_t filePosition(uint32_t index) const;

  // True when any block lies beyond the first 4 GiB
  bool needsHiBlockTable() const;

  std::vector<uint8_t> serialize() const;
  std::vector<uint8_t> serializeHiBlockWords() const;

  const std::vector<BlockEntry> &entries() const { return entries_; }
  uint32_t size() const { return static_cast<uint32_t>(entries_.size()); }
  bool empty() const { return entries_.empty(); }

private:
  std::vector<BlockEntry> entries_;
  std::vector<uint16_t> hiWords_; // Same length as entries_
};

} // namespace mpqx
