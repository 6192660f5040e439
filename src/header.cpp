#include <algorithm>
#include <cstring>
#include <format>

#include <mpqx/block_table.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/hash_table.hpp>
#include <mpqx/header.hpp>

namespace mpqx {

namespace {

bool isCompressedTable(uint64_t storedSize, uint64_t rawSize) {
  return storedSize != 0 && storedSize < rawSize;
}

void readDigest(const uint8_t *p, Md5Digest &digest) {
  std::memcpy(digest.data(), p, digest.size());
}

void writeDigest(uint8_t *p, const Md5Digest &digest) {
  std::memcpy(p, digest.data(), digest.size());
}

} // namespace

Header::Header() = default;

Header Header::create(Format format) {
  Header header;
  header.format_ = format;
  header.headerSize_ = sizeForFormat(format);
  header.archiveSize32_ = header.headerSize_;
  header.sectorSizeExponent_ = defaultSectorSizeExponent;

  if (format >= Format::ExtendedV1) {
    header.v1_.emplace();
  }
  if (format >= Format::ExtendedV2) {
    header.v2_.emplace();
    header.v2_->archiveSize = header.headerSize_;
  }
  if (format >= Format::ExtendedV3) {
    header.v3_.emplace();
  }

  return header;
}

uint32_t Header::sizeForFormat(Format format) noexcept {
  switch (format) {
  case Format::Basic:
    return basicSize;
  case Format::ExtendedV1:
    return extendedV1Size;
  case Format::ExtendedV2:
    return extendedV2Size;
  case Format::ExtendedV3:
    return extendedV3Size;
  }
  return basicSize;
}

std::optional<Header> Header::parse(std::span<const uint8_t> data, Error *outError) {
  if (data.size() < 4) {
    detail::setError(outError, ErrorCode::TruncatedHeader,
                     std::format("Data too small to hold an MPQ signature (size: {})", data.size()));
    return std::nullopt;
  }

  if (load32(data.data()) != headerSignature) {
    detail::setError(outError, ErrorCode::BadSignature,
                     std::format("Invalid MPQ signature (got {:02X} {:02X} {:02X} {:02X})",
                                 data[0], data[1], data[2], data[3]));
    return std::nullopt;
  }

  if (data.size() < basicSize) {
    detail::setError(outError, ErrorCode::TruncatedHeader,
                     std::format("MPQ header truncated ({} of {} bytes)", data.size(), basicSize));
    return std::nullopt;
  }

  const uint8_t *p = data.data();
  Header header;
  header.headerSize_ = load32(p + 4);
  header.archiveSize32_ = load32(p + 8);

  uint16_t version = load16(p + 12);
  if (version > static_cast<uint16_t>(Format::ExtendedV3)) {
    detail::setError(outError, ErrorCode::UnsupportedFormat,
                     std::format("Unsupported MPQ format version {}", version));
    return std::nullopt;
  }
  header.format_ = static_cast<Format>(version);

  const uint32_t required = sizeForFormat(header.format_);
  if (header.headerSize_ < required) {
    detail::setError(outError, ErrorCode::BadHeader,
                     std::format("Header of format {} declares {} bytes, expected at least {}",
                                 version, header.headerSize_, required));
    return std::nullopt;
  }
  if (data.size() < required) {
    detail::setError(outError, ErrorCode::TruncatedHeader,
                     std::format("MPQ header truncated ({} of {} bytes)", data.size(), required));
    return std::nullopt;
  }

  header.sectorSizeExponent_ = load16(p + 14);
  if (header.sectorSizeExponent_ > maxSectorSizeExponent) {
    detail::setError(outError, ErrorCode::BadHeader,
                     std::format("Invalid sector size exponent {}", header.sectorSizeExponent_));
    return std::nullopt;
  }

  header.hashTableOffset_ = load32(p + 16);
  header.blockTableOffset_ = load32(p + 20);
  header.hashTableEntryCount_ = load32(p + 24);
  header.blockTableEntryCount_ = load32(p + 28);

  if (header.format_ >= Format::ExtendedV1) {
    auto &v1 = header.v1_.emplace();
    v1.hiBlockTableOffset = load64(p + 32);
    v1.hashTableOffsetHigh = load16(p + 40);
    v1.blockTableOffsetHigh = load16(p + 42);
  }

  if (header.format_ >= Format::ExtendedV2) {
    auto &v2 = header.v2_.emplace();
    v2.archiveSize = load64(p + 44);
    v2.betTableOffset = load64(p + 52);
    v2.hetTableOffset = load64(p + 60);
  }

  if (header.format_ >= Format::ExtendedV3) {
    auto &v3 = header.v3_.emplace();
    v3.compressedHashTableSize = load64(p + 68);
    v3.compressedBlockTableSize = load64(p + 76);
    v3.compressedHiBlockTableSize = load64(p + 84);
    v3.compressedHetTableSize = load64(p + 92);
    v3.compressedBetTableSize = load64(p + 100);
    v3.rawChunkSize = load32(p + 108);
    readDigest(p + 112, v3.blockTableDigest);
    readDigest(p + 128, v3.hashTableDigest);
    readDigest(p + 144, v3.hiBlockTableDigest);
    readDigest(p + 160, v3.betTableDigest);
    readDigest(p + 176, v3.hetTableDigest);
    readDigest(p + 192, v3.headerDigest);
  }

  return header;
}

std::vector<uint8_t> Header::serialize() const {
  std::vector<uint8_t> out(sizeForFormat(format_), 0);
  uint8_t *p = out.data();

  store32(p, headerSignature);
  store32(p + 4, headerSize_);
  store32(p + 8, archiveSize32_);
  store16(p + 12, static_cast<uint16_t>(format_));
  store16(p + 14, sectorSizeExponent_);
  store32(p + 16, hashTableOffset_);
  store32(p + 20, blockTableOffset_);
  store32(p + 24, hashTableEntryCount_);
  store32(p + 28, blockTableEntryCount_);

  if (v1_) {
    store64(p + 32, v1_->hiBlockTableOffset);
    store16(p + 40, v1_->hashTableOffsetHigh);
    store16(p + 42, v1_->blockTableOffsetHigh);
  }

  if (v2_) {
    store64(p + 44, v2_->archiveSize);
    store64(p + 52, v2_->betTableOffset);
    store64(p + 60, v2_->hetTableOffset);
  }

  if (v3_) {
    store64(p + 68, v3_->compressedHashTableSize);
    store64(p + 76, v3_->compressedBlockTableSize);
    store64(p + 84, v3_->compressedHiBlockTableSize);
    store64(p + 92, v3_->compressedHetTableSize);
    store64(p + 100, v3_->compressedBetTableSize);
    store32(p + 108, v3_->rawChunkSize);
    writeDigest(p + 112, v3_->blockTableDigest);
    writeDigest(p + 128, v3_->hashTableDigest);
    writeDigest(p + 144, v3_->hiBlockTableDigest);
    writeDigest(p + 160, v3_->betTableDigest);
    writeDigest(p + 176, v3_->hetTableDigest);
    writeDigest(p + 192, v3_->headerDigest);
  }

  return out;
}

uint64_t Header::mergeHighBits(uint32_t baseBits, uint16_t highBits) noexcept {
  uint64_t high = (static_cast<uint64_t>(highBits) << 32) & 0x0000FFFF00000000ull;
  return (high + baseBits) & 0x0000FFFFFFFFFFFFull;
}

std::pair<uint32_t, uint16_t> Header::splitHighBits(uint64_t offset) noexcept {
  return {static_cast<uint32_t>(offset), static_cast<uint16_t>(offset >> 32)};
}

uint64_t Header::hashTableOffset() const {
  if (!v1_) {
    return hashTableOffset_;
  }
  return mergeHighBits(hashTableOffset_, v1_->hashTableOffsetHigh);
}

uint64_t Header::blockTableOffset() const {
  if (!v1_) {
    return blockTableOffset_;
  }
  return mergeHighBits(blockTableOffset_, v1_->blockTableOffsetHigh);
}

uint64_t Header::hiBlockTableOffset() const {
  return v1_ ? v1_->hiBlockTableOffset : 0;
}

uint64_t Header::hetTableOffset() const {
  return v2_ ? v2_->hetTableOffset : 0;
}

uint64_t Header::betTableOffset() const {
  return v2_ ? v2_->betTableOffset : 0;
}

uint64_t Header::hashTableSize() const {
  return static_cast<uint64_t>(hashTableEntryCount_) * HashEntry::entrySize;
}

uint64_t Header::blockTableSize() const {
  return static_cast<uint64_t>(blockTableEntryCount_) * BlockEntry::entrySize;
}

uint64_t Header::hiBlockTableSize() const {
  return static_cast<uint64_t>(blockTableEntryCount_) * sizeof(uint16_t);
}

uint64_t Header::storedHashTableSize() const {
  return isHashTableCompressed() ? v3_->compressedHashTableSize : hashTableSize();
}

uint64_t Header::storedBlockTableSize() const {
  return isBlockTableCompressed() ? v3_->compressedBlockTableSize : blockTableSize();
}

uint64_t Header::storedHiBlockTableSize() const {
  return isHiBlockTableCompressed() ? v3_->compressedHiBlockTableSize : hiBlockTableSize();
}

bool Header::isHashTableCompressed() const {
  return v3_ && isCompressedTable(v3_->compressedHashTableSize, hashTableSize());
}

bool Header::isBlockTableCompressed() const {
  return v3_ && isCompressedTable(v3_->compressedBlockTableSize, blockTableSize());
}

bool Header::isHiBlockTableCompressed() const {
  return v3_ && isCompressedTable(v3_->compressedHiBlockTableSize, hiBlockTableSize());
}

uint64_t Header::archiveSize() const {
  switch (format_) {
  case Format::Basic:
    return archiveSize32_;
  case Format::ExtendedV1: {
    // No reliable total is stored, so the archive ends where the furthest
    // table ends
    uint64_t end = headerSize_;
    if (hashTableOffset() != 0) {
      end = std::max(end, hashTableOffset() + storedHashTableSize());
    }
    if (blockTableOffset() != 0) {
      end = std::max(end, blockTableOffset() + storedBlockTableSize());
    }
    if (hiBlockTableOffset() != 0) {
      end = std::max(end, hiBlockTableOffset() + storedHiBlockTableSize());
    }
    return end;
  }
  case Format::ExtendedV2:
  case Format::ExtendedV3:
    return v2_->archiveSize;
  }
  return archiveSize32_;
}

void Header::setHashTable(uint64_t offset, uint32_t entryCount) {
  auto [base, high] = splitHighBits(offset);
  hashTableOffset_ = base;
  hashTableEntryCount_ = entryCount;
  if (v1_) {
    v1_->hashTableOffsetHigh = high;
  }
}

void Header::setBlockTable(uint64_t offset, uint32_t entryCount) {
  auto [base, high] = splitHighBits(offset);
  blockTableOffset_ = base;
  blockTableEntryCount_ = entryCount;
  if (v1_) {
    v1_->blockTableOffsetHigh = high;
  }
}

void Header::setHiBlockTableOffset(uint64_t offset) {
  if (v1_) {
    v1_->hiBlockTableOffset = offset;
  }
}

void Header::setArchiveSize(uint64_t size) {
  archiveSize32_ = static_cast<uint32_t>(size);
  if (v2_) {
    v2_->archiveSize = size;
  }
}

void Header::setStoredTableSizes(uint64_t hashTable, uint64_t blockTable, uint64_t hiBlockTable) {
  if (v3_) {
    v3_->compressedHashTableSize = hashTable;
    v3_->compressedBlockTableSize = blockTable;
    v3_->compressedHiBlockTableSize = hiBlockTable;
  }
}

void Header::setTableDigests(const Md5Digest &hashTable, const Md5Digest &blockTable,
                             const Md5Digest &hiBlockTable) {
  if (v3_) {
    v3_->hashTableDigest = hashTable;
    v3_->blockTableDigest = blockTable;
    v3_->hiBlockTableDigest = hiBlockTable;
  }
}

bool Header::updateHeaderDigest(Error *outError) {
  if (!v3_) {
    return true;
  }
  auto bytes = serialize();
  auto digest = md5(std::span<const uint8_t>(bytes.data(), digestedSize), outError);
  if (!digest) {
    return false;
  }
  v3_->headerDigest = *digest;
  return true;
}

bool Header::verifyHeaderDigest(Error *outError) const {
  if (!v3_) {
    return true;
  }
  auto bytes = serialize();
  auto digest = md5(std::span<const uint8_t>(bytes.data(), digestedSize), outError);
  if (!digest) {
    return false;
  }
  if (*digest != v3_->headerDigest) {
    detail::setError(outError, ErrorCode::BadHeader, "Header digest mismatch");
    return false;
  }
  return true;
}

} // namespace mpqx
