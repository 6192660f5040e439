#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "block_table.hpp"
#include "types.hpp"

namespace mpqx {

// Decodes file data stored in an archive. Holds a view of the archive bytes,
// so the underlying buffer must outlive the reader.
class SectorReader {
public:
  SectorReader(std::span<const uint8_t> archiveData, uint32_t sectorSize,
               bool verifyChecksums = true);

  // Decode the file described by block. position is relative to the archive
  // start and key is ignored unless the block is encrypted.
  std::optional<std::vector<uint8_t>> readFile(uint64_t position, const BlockEntry &block,
                                               uint32_t key, Error *outError = nullptr) const;

  uint32_t sectorSize() const { return sectorSize_; }

private:
  std::optional<std::vector<uint8_t>> readSingleUnit(std::span<const uint8_t> stored,
                                                     const BlockEntry &block, uint32_t key,
                                                     Error *outError) const;
  std::optional<std::vector<uint8_t>> readContiguous(std::span<const uint8_t> stored,
                                                     const BlockEntry &block, uint32_t key,
                                                     Error *outError) const;
  std::optional<std::vector<uint8_t>> readSectors(std::span<const uint8_t> stored,
                                                  const BlockEntry &block, uint32_t key,
                                                  Error *outError) const;

  std::span<const uint8_t> data_;
  uint32_t sectorSize_;
  bool verifyChecksums_;
};

struct EncodedFile {
  std::vector<uint8_t> data; // Bytes as stored in the archive
  uint32_t flags = 0;        // Block flags matching the stored layout
};

// Produces the stored form of a file, the inverse of SectorReader
class SectorWriter {
public:
  // flags selects the layout (Compress, Encrypted, SingleUnit, SectorCrc).
  // compression is the mask applied to each unit; key is used when Encrypted
  // is set.
  static std::optional<EncodedFile> encode(std::span<const uint8_t> data, uint32_t flags,
                                           uint8_t compression, uint32_t sectorSize,
                                           uint32_t key, Error *outError = nullptr);
};

// Checksum stored in the sector CRC table
uint32_t sectorChecksum(std::span<const uint8_t> sector) noexcept;

} // namespace mpqx
