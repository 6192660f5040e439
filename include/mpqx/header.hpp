#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "crypto.hpp"
#include "types.hpp"

namespace mpqx {

enum class Format : uint16_t {
  Basic = 0,
  ExtendedV1 = 1,
  ExtendedV2 = 2,
  ExtendedV3 = 3,
};

// Archive header. The fields of each format revision are kept in their own
// payload, present only when the format carries them.
class Header {
public:
  static constexpr uint32_t basicSize = 0x20;
  static constexpr uint32_t extendedV1Size = 0x2C;
  static constexpr uint32_t extendedV2Size = 0x44;
  static constexpr uint32_t extendedV3Size = 0xD0;

  // The header digest covers everything before it
  static constexpr uint32_t digestedSize = extendedV3Size - sizeof(Md5Digest);

  static constexpr uint16_t defaultSectorSizeExponent = 3;
  // Largest exponent whose sector size fits in 32 bits
  static constexpr uint16_t maxSectorSizeExponent = 22;

  struct ExtendedV1Fields {
    uint64_t hiBlockTableOffset = 0;
    uint16_t hashTableOffsetHigh = 0;
    uint16_t blockTableOffsetHigh = 0;
  };

  struct ExtendedV2Fields {
    uint64_t archiveSize = 0;
    uint64_t betTableOffset = 0;
    uint64_t hetTableOffset = 0;
  };

  struct ExtendedV3Fields {
    uint64_t compressedHashTableSize = 0;
    uint64_t compressedBlockTableSize = 0;
    uint64_t compressedHiBlockTableSize = 0;
    uint64_t compressedHetTableSize = 0;
    uint64_t compressedBetTableSize = 0;
    uint32_t rawChunkSize = 0;
    Md5Digest blockTableDigest{};
    Md5Digest hashTableDigest{};
    Md5Digest hiBlockTableDigest{};
    Md5Digest betTableDigest{};
    Md5Digest hetTableDigest{};
    Md5Digest headerDigest{};
  };

  // Minimal valid Basic header
  Header();

  // Minimal valid header of an empty archive in the given format
  static Header create(Format format);

  // Parse a header from the bytes starting at its signature
  static std::optional<Header> parse(std::span<const uint8_t> data, Error *outError = nullptr);

  // Serialize exactly sizeForFormat(format()) bytes
  std::vector<uint8_t> serialize() const;

  static uint32_t sizeForFormat(Format format) noexcept;

  // 48-bit offset from a 32-bit base and 16 high bits
  static uint64_t mergeHighBits(uint32_t baseBits, uint16_t highBits) noexcept;
  static std::pair<uint32_t, uint16_t> splitHighBits(uint64_t offset) noexcept;

  Format format() const { return format_; }
  uint32_t headerSize() const { return headerSize_; }
  uint16_t sectorSizeExponent() const { return sectorSizeExponent_; }
  uint32_t sectorSize() const { return 0x200u << sectorSizeExponent_; }

  uint32_t hashTableEntryCount() const { return hashTableEntryCount_; }
  uint32_t blockTableEntryCount() const { return blockTableEntryCount_; }

  uint64_t hashTableOffset() const;
  uint64_t blockTableOffset() const;
  uint64_t hiBlockTableOffset() const;
  uint64_t hetTableOffset() const;
  uint64_t betTableOffset() const;

  uint64_t hashTableSize() const;
  uint64_t blockTableSize() const;
  uint64_t hiBlockTableSize() const;

  // Sizes of the tables as stored; equal to the raw sizes unless compressed
  uint64_t storedHashTableSize() const;
  uint64_t storedBlockTableSize() const;
  uint64_t storedHiBlockTableSize() const;

  // A table is compressed when its recorded compressed size is non-zero and
  // smaller than its raw size. Only ExtendedV3 records these sizes.
  bool isHashTableCompressed() const;
  bool isBlockTableCompressed() const;
  bool isHiBlockTableCompressed() const;

  uint64_t archiveSize() const;

  const std::optional<ExtendedV1Fields> &extendedV1() const { return v1_; }
  const std::optional<ExtendedV2Fields> &extendedV2() const { return v2_; }
  const std::optional<ExtendedV3Fields> &extendedV3() const { return v3_; }

  void setSectorSizeExponent(uint16_t exponent) { sectorSizeExponent_ = exponent; }
  void setHashTable(uint64_t offset, uint32_t entryCount);
  void setBlockTable(uint64_t offset, uint32_t entryCount);
  void setHiBlockTableOffset(uint64_t offset);
  void setArchiveSize(uint64_t size);

  // ExtendedV3 only; ignored for older formats
  void setStoredTableSizes(uint64_t hashTable, uint64_t blockTable, uint64_t hiBlockTable);
  void setTableDigests(const Md5Digest &hashTable, const Md5Digest &blockTable,
                       const Md5Digest &hiBlockTable);
  bool updateHeaderDigest(Error *outError = nullptr);
  // BadHeader on a mismatch
  bool verifyHeaderDigest(Error *outError = nullptr) const;

private:
  uint32_t headerSize_ = basicSize;
  uint32_t archiveSize32_ = basicSize;
  Format format_ = Format::Basic;
  uint16_t sectorSizeExponent_ = defaultSectorSizeExponent;
  uint32_t hashTableOffset_ = 0;
  uint32_t blockTableOffset_ = 0;
  uint32_t hashTableEntryCount_ = 0;
  uint32_t blockTableEntryCount_ = 0;

  std::optional<ExtendedV1Fields> v1_;
  std::optional<ExtendedV2Fields> v2_;
  std::optional<ExtendedV3Fields> v3_;
};

} // namespace mpqx
