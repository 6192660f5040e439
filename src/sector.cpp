#include <algorithm>
#include <format>
#include <limits>

#include <zlib.h>

#include <mpqx/compression.hpp>
#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/sector.hpp>

namespace mpqx {

namespace {

uint32_t sectorCount(uint32_t fileSize, uint32_t sectorSize) {
  return static_cast<uint32_t>((static_cast<uint64_t>(fileSize) + sectorSize - 1) / sectorSize);
}

// Decode one unit that is either raw or compressed by mask
std::optional<std::vector<uint8_t>> decodeUnit(std::vector<uint8_t> unit, size_t expectedSize,
                                               const BlockEntry &block, Error *outError) {
  if (unit.size() == expectedSize) {
    return unit;
  }

  if (unit.size() > expectedSize || !block.isCompressed()) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("Stored unit of {} bytes does not match expected {} bytes",
                                 unit.size(), expectedSize));
    return std::nullopt;
  }

  if (block.isImploded()) {
    detail::setError(outError, ErrorCode::UnsupportedCompression,
                     "PKWARE implode compression is not supported");
    return std::nullopt;
  }

  return decompress(unit, expectedSize, outError);
}

} // namespace

uint32_t sectorChecksum(std::span<const uint8_t> sector) noexcept {
  return static_cast<uint32_t>(adler32(0, sector.data(), static_cast<uInt>(sector.size())));
}

SectorReader::SectorReader(std::span<const uint8_t> archiveData, uint32_t sectorSize,
                           bool verifyChecksums)
    : data_(archiveData), sectorSize_(sectorSize), verifyChecksums_(verifyChecksums) {}

std::optional<std::vector<uint8_t>> SectorReader::readFile(uint64_t position,
                                                           const BlockEntry &block, uint32_t key,
                                                           Error *outError) const {
  if (block.uncompressedSize == 0) {
    return std::vector<uint8_t>{};
  }

  if (position > data_.size() || block.compressedSize > data_.size() - position) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("File data at {:#x} ({} bytes) extends past the archive end",
                                 position, block.compressedSize));
    return std::nullopt;
  }

  auto stored = data_.subspan(position, block.compressedSize);

  if (block.isSingleUnit()) {
    return readSingleUnit(stored, block, key, outError);
  }
  if (!block.isCompressed()) {
    return readContiguous(stored, block, key, outError);
  }
  return readSectors(stored, block, key, outError);
}

std::optional<std::vector<uint8_t>> SectorReader::readSingleUnit(std::span<const uint8_t> stored,
                                                                 const BlockEntry &block,
                                                                 uint32_t key,
                                                                 Error *outError) const {
  std::vector<uint8_t> unit(stored.begin(), stored.end());
  if (block.isEncrypted()) {
    decryptBlock(unit, key);
  }

  // Some writers pad raw single units; only the declared size is file content
  if (unit.size() > block.uncompressedSize && !block.isCompressed()) {
    unit.resize(block.uncompressedSize);
  }

  return decodeUnit(std::move(unit), block.uncompressedSize, block, outError);
}

std::optional<std::vector<uint8_t>> SectorReader::readContiguous(std::span<const uint8_t> stored,
                                                                 const BlockEntry &block,
                                                                 uint32_t key,
                                                                 Error *outError) const {
  if (stored.size() < block.uncompressedSize) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("Uncompressed file stores {} of {} bytes", stored.size(),
                                 block.uncompressedSize));
    return std::nullopt;
  }

  std::vector<uint8_t> out(stored.begin(), stored.begin() + block.uncompressedSize);
  if (block.isEncrypted()) {
    const uint32_t count = sectorCount(block.uncompressedSize, sectorSize_);
    for (uint32_t i = 0; i < count; ++i) {
      const size_t offset = static_cast<size_t>(i) * sectorSize_;
      const size_t length = std::min<size_t>(sectorSize_, out.size() - offset);
      decryptBlock(std::span<uint8_t>(out.data() + offset, length), key + i);
    }
  }
  return out;
}

std::optional<std::vector<uint8_t>> SectorReader::readSectors(std::span<const uint8_t> stored,
                                                              const BlockEntry &block,
                                                              uint32_t key,
                                                              Error *outError) const {
  const uint32_t count = sectorCount(block.uncompressedSize, sectorSize_);
  const uint64_t baseTableSize = (static_cast<uint64_t>(count) + 1) * 4;
  const uint64_t crcTableSize = baseTableSize + 4;

  if (baseTableSize > stored.size()) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("Sector offset table ({} bytes) exceeds stored size {}",
                                 baseTableSize, stored.size()));
    return std::nullopt;
  }

  const bool readCrcWord = block.hasSectorCrc() && crcTableSize <= stored.size();
  std::vector<uint8_t> table(stored.begin(),
                             stored.begin() + (readCrcWord ? crcTableSize : baseTableSize));
  if (block.isEncrypted()) {
    decryptBlock(table, key - 1);
  }

  std::vector<uint32_t> offsets(table.size() / 4);
  for (size_t i = 0; i < offsets.size(); ++i) {
    offsets[i] = load32(table.data() + i * 4);
  }

  for (uint32_t i = 0; i <= count; ++i) {
    const bool ordered = i == 0 ? offsets[0] >= baseTableSize : offsets[i] > offsets[i - 1];
    if (!ordered || offsets[i] > stored.size()) {
      detail::setError(outError, ErrorCode::CorruptSector,
                       std::format("Sector offset table is corrupt at entry {} (offset {:#x})", i,
                                   offsets[i]));
      return std::nullopt;
    }
  }

  // The checksum table is only present when the first sector starts after it
  const bool hasCrcTable = readCrcWord && offsets[0] == crcTableSize &&
                           offsets[count + 1] >= offsets[count] &&
                           offsets[count + 1] <= stored.size();

  std::vector<uint8_t> out;
  std::vector<uint32_t> checksums;

  for (uint32_t i = 0; i < count; ++i) {
    const size_t expected =
        std::min<size_t>(sectorSize_, block.uncompressedSize - static_cast<size_t>(i) * sectorSize_);
    std::vector<uint8_t> sector(stored.begin() + offsets[i], stored.begin() + offsets[i + 1]);
    if (block.isEncrypted()) {
      decryptBlock(sector, key + i);
    }

    Error sectorError;
    auto decoded = decodeUnit(std::move(sector), expected, block, &sectorError);
    if (!decoded) {
      detail::setError(outError, sectorError.code,
                       std::format("Sector {}: {}", i, sectorError.message));
      return std::nullopt;
    }
    if (hasCrcTable && verifyChecksums_) {
      checksums.push_back(sectorChecksum(*decoded));
    }
    out.insert(out.end(), decoded->begin(), decoded->end());
  }

  if (hasCrcTable && verifyChecksums_) {
    const size_t rawSize = static_cast<size_t>(count) * 4;
    std::vector<uint8_t> crcData(stored.begin() + offsets[count],
                                 stored.begin() + offsets[count + 1]);
    std::optional<std::vector<uint8_t>> crcTable;
    if (crcData.size() < rawSize) {
      crcTable = decompress(crcData, rawSize, outError);
      if (!crcTable) {
        return std::nullopt;
      }
    } else {
      crcData.resize(rawSize);
      crcTable = std::move(crcData);
    }

    for (uint32_t i = 0; i < count; ++i) {
      const uint32_t expected = load32(crcTable->data() + static_cast<size_t>(i) * 4);
      if (expected != 0 && expected != checksums[i]) {
        detail::setError(outError, ErrorCode::CorruptSector,
                         std::format("Sector {} checksum mismatch (stored {:#010x}, computed "
                                     "{:#010x})",
                                     i, expected, checksums[i]));
        return std::nullopt;
      }
    }
  }

  return out;
}

std::optional<EncodedFile> SectorWriter::encode(std::span<const uint8_t> data, uint32_t flags,
                                                uint8_t compression, uint32_t sectorSize,
                                                uint32_t key, Error *outError) {
  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    detail::setError(outError, ErrorCode::InvalidArgument,
                     std::format("File of {} bytes exceeds the 4 GiB limit", data.size()));
    return std::nullopt;
  }
  if (sectorSize == 0) {
    detail::setError(outError, ErrorCode::InvalidArgument, "Sector size must not be zero");
    return std::nullopt;
  }

  if (compression == 0) {
    flags &= ~(FileFlags::CompressMask | FileFlags::SectorCrc);
  } else {
    if (!isSupportedCompression(compression)) {
      detail::setError(outError, ErrorCode::UnsupportedCompression,
                       std::format("Unsupported compression {:#04x}", compression));
      return std::nullopt;
    }
    flags = (flags & ~FileFlags::Implode) | FileFlags::Compress;
  }
  if (flags & FileFlags::SingleUnit) {
    flags &= ~FileFlags::SectorCrc;
  }

  EncodedFile result;
  result.flags = flags;
  const bool encrypted = (flags & FileFlags::Encrypted) != 0;

  if (data.empty()) {
    return result;
  }

  // Keeps the compressed form only when it saves space
  auto packUnit = [&](std::span<const uint8_t> unit) -> std::optional<std::vector<uint8_t>> {
    if (compression == 0) {
      return std::vector<uint8_t>(unit.begin(), unit.end());
    }
    auto packed = compress(unit, compression, outError);
    if (!packed) {
      return std::nullopt;
    }
    if (packed->size() >= unit.size()) {
      return std::vector<uint8_t>(unit.begin(), unit.end());
    }
    return packed;
  };

  if (flags & FileFlags::SingleUnit) {
    auto unit = packUnit(data);
    if (!unit) {
      return std::nullopt;
    }
    if (encrypted) {
      encryptBlock(*unit, key);
    }
    result.data = std::move(*unit);
    return result;
  }

  const uint32_t count = sectorCount(static_cast<uint32_t>(data.size()), sectorSize);

  if (compression == 0) {
    result.data.assign(data.begin(), data.end());
    if (encrypted) {
      for (uint32_t i = 0; i < count; ++i) {
        const size_t offset = static_cast<size_t>(i) * sectorSize;
        const size_t length = std::min<size_t>(sectorSize, data.size() - offset);
        encryptBlock(std::span<uint8_t>(result.data.data() + offset, length), key + i);
      }
    }
    return result;
  }

  const bool withCrc = (flags & FileFlags::SectorCrc) != 0;
  const size_t tableWords = static_cast<size_t>(count) + (withCrc ? 2 : 1);
  std::vector<uint32_t> offsets(tableWords);
  std::vector<uint8_t> crcTable(withCrc ? static_cast<size_t>(count) * 4 : 0);

  result.data.resize(tableWords * 4);
  for (uint32_t i = 0; i < count; ++i) {
    const size_t offset = static_cast<size_t>(i) * sectorSize;
    auto sector = data.subspan(offset, std::min<size_t>(sectorSize, data.size() - offset));

    auto stored = packUnit(sector);
    if (!stored) {
      return std::nullopt;
    }
    if (encrypted) {
      encryptBlock(*stored, key + i);
    }
    if (withCrc) {
      store32(crcTable.data() + static_cast<size_t>(i) * 4, sectorChecksum(sector));
    }

    offsets[i] = static_cast<uint32_t>(result.data.size());
    result.data.insert(result.data.end(), stored->begin(), stored->end());
  }
  offsets[count] = static_cast<uint32_t>(result.data.size());

  if (withCrc) {
    auto packed = compress(crcTable, Compression::Zlib, outError);
    if (!packed) {
      return std::nullopt;
    }
    const auto &crcStored = packed->size() < crcTable.size() ? *packed : crcTable;
    result.data.insert(result.data.end(), crcStored.begin(), crcStored.end());
    offsets[count + 1] = static_cast<uint32_t>(result.data.size());
  }

  if (result.data.size() > std::numeric_limits<uint32_t>::max()) {
    detail::setError(outError, ErrorCode::InvalidArgument,
                     std::format("Stored file of {} bytes exceeds the 4 GiB limit",
                                 result.data.size()));
    return std::nullopt;
  }

  std::vector<uint8_t> table(tableWords * 4);
  for (size_t i = 0; i < tableWords; ++i) {
    store32(table.data() + i * 4, offsets[i]);
  }
  if (encrypted) {
    encryptBlock(table, key - 1);
  }
  std::copy(table.begin(), table.end(), result.data.begin());

  return result;
}

} // namespace mpqx
