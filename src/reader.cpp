#include <algorithm>
#include <format>
#include <fstream>
#include <unordered_map>

#include <mpqx/compression.hpp>
#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/reader.hpp>
#include <mpqx/sector.hpp>

namespace mpqx {

namespace {

constexpr size_t userDataHeaderSize = 16;

// Names probed even when the (listfile) does not mention them
constexpr std::string_view internalFileNames[] = {listFileName, attributesFileName,
                                                  signatureFileName};

uint64_t nameKey(uint32_t nameA, uint32_t nameB) {
  return (static_cast<uint64_t>(nameA) << 32) | nameB;
}

std::vector<std::string> splitListFile(std::span<const uint8_t> data) {
  std::vector<std::string> names;
  std::string current;
  for (uint8_t byte : data) {
    if (byte == ';' || byte == '\r' || byte == '\n' || byte == 0) {
      if (!current.empty()) {
        names.push_back(std::move(current));
        current.clear();
      }
    } else {
      current += static_cast<char>(byte);
    }
  }
  if (!current.empty()) {
    names.push_back(std::move(current));
  }
  return names;
}

} // namespace

std::optional<Reader> Reader::open(const std::filesystem::path &path, Error *outError) {
  return open(path, OpenOptions{}, outError);
}

std::optional<Reader> Reader::open(const std::filesystem::path &path, const OpenOptions &options,
                                   Error *outError) {
  Reader reader;
  reader.options_ = options;
  if (!reader.mappedFile_.openRead(path, outError)) {
    return std::nullopt;
  }

  if (!reader.parse(outError)) {
    reader.close();
    return std::nullopt;
  }

  return reader;
}

std::optional<Reader> Reader::openMemory(std::vector<uint8_t> data, Error *outError) {
  return openMemory(std::move(data), OpenOptions{}, outError);
}

std::optional<Reader> Reader::openMemory(std::vector<uint8_t> data, const OpenOptions &options,
                                         Error *outError) {
  Reader reader;
  reader.options_ = options;
  reader.memory_ = std::move(data);
  reader.inMemory_ = true;

  if (!reader.parse(outError)) {
    reader.close();
    return std::nullopt;
  }

  return reader;
}

std::span<const uint8_t> Reader::bytes() const {
  if (inMemory_) {
    return memory_;
  }
  return mappedFile_.data();
}

bool Reader::parse(Error *outError) {
  if (!locateHeader(outError)) {
    return false;
  }
  if (!loadTables(outError)) {
    return false;
  }
  resolveNames();
  return true;
}

bool Reader::locateHeader(Error *outError) {
  auto data = bytes();

  if (data.size() < 4) {
    detail::setError(outError, ErrorCode::TruncatedHeader,
                     std::format("File too small to be an MPQ archive (size: {})", data.size()));
    return false;
  }

  for (uint64_t offset = 0; offset + 4 <= data.size(); offset += headerAlignment) {
    uint64_t candidate = offset;
    const uint32_t signature = load32(data.data() + offset);

    if (signature == userDataSignature && offset + userDataHeaderSize <= data.size()) {
      // The user data block names the header position relative to itself
      candidate = offset + load32(data.data() + offset + 8);
      if (candidate + 4 > data.size() || load32(data.data() + candidate) != headerSignature) {
        continue;
      }
    } else if (signature != headerSignature) {
      continue;
    }

    auto header = Header::parse(data.subspan(candidate), outError);
    if (!header) {
      return false;
    }

    if (options_.verifyTableDigests && header->extendedV3() &&
        !isZeroDigest(header->extendedV3()->headerDigest) &&
        !header->verifyHeaderDigest(outError)) {
      return false;
    }

    header_ = std::move(*header);
    archiveOffset_ = candidate;
    return true;
  }

  detail::setError(outError, ErrorCode::BadSignature,
                   std::format("No MPQ header found in {} bytes", data.size()));
  return false;
}

std::optional<std::vector<uint8_t>> Reader::loadTable(std::string_view what, uint64_t offset,
                                                      uint64_t storedSize, uint64_t rawSize,
                                                      std::optional<uint32_t> key,
                                                      const Md5Digest *digest,
                                                      Error *outError) const {
  auto data = archiveBytes();
  if (offset > data.size() || storedSize > data.size() - offset) {
    detail::setError(outError, ErrorCode::TruncatedTable,
                     std::format("{} at {:#x} ({} bytes) extends past the archive end ({} bytes)",
                                 what, offset, storedSize, data.size()));
    return std::nullopt;
  }

  auto stored = data.subspan(offset, storedSize);
  if (digest && options_.verifyTableDigests && !isZeroDigest(*digest)) {
    auto actual = md5(stored, outError);
    if (!actual) {
      return std::nullopt;
    }
    if (*actual != *digest) {
      detail::setError(outError, ErrorCode::CorruptTable, std::format("{} digest mismatch", what));
      return std::nullopt;
    }
  }

  std::vector<uint8_t> table(stored.begin(), stored.end());
  if (key) {
    decryptBlock(table, *key);
  }

  if (storedSize < rawSize) {
    Error codecError;
    auto raw = decompress(table, rawSize, &codecError);
    if (!raw) {
      detail::setError(outError, ErrorCode::CorruptTable,
                       std::format("{} does not decompress: {}", what, codecError.message));
      return std::nullopt;
    }
    table = std::move(*raw);
  }

  return table;
}

bool Reader::loadTables(Error *outError) {
  const auto &v3 = header_.extendedV3();

  auto hashBytes = loadTable("Hash table", header_.hashTableOffset(),
                             header_.storedHashTableSize(), header_.hashTableSize(), hashTableKey,
                             v3 ? &v3->hashTableDigest : nullptr, outError);
  if (!hashBytes) {
    return false;
  }
  auto hashTable = HashTable::fromBytes(*hashBytes, header_.hashTableEntryCount(), outError);
  if (!hashTable) {
    return false;
  }

  auto blockBytes = loadTable("Block table", header_.blockTableOffset(),
                              header_.storedBlockTableSize(), header_.blockTableSize(),
                              blockTableKey, v3 ? &v3->blockTableDigest : nullptr, outError);
  if (!blockBytes) {
    return false;
  }
  auto blockTable = BlockTable::fromBytes(*blockBytes, header_.blockTableEntryCount(), outError);
  if (!blockTable) {
    return false;
  }

  if (header_.hiBlockTableOffset() != 0 && !blockTable->empty()) {
    auto hiBytes = loadTable("Hi-block table", header_.hiBlockTableOffset(),
                             header_.storedHiBlockTableSize(), header_.hiBlockTableSize(),
                             std::nullopt, v3 ? &v3->hiBlockTableDigest : nullptr, outError);
    if (!hiBytes || !blockTable->setHiBlockWords(*hiBytes, outError)) {
      return false;
    }
  }

  hashTable_ = std::move(*hashTable);
  blockTable_ = std::move(*blockTable);
  return true;
}

void Reader::resolveNames() {
  std::unordered_map<uint64_t, std::string> names;
  auto addName = [&](std::string_view name) {
    const NameHashes hashes = NameHashes::of(name);
    names.try_emplace(nameKey(hashes.nameA, hashes.nameB), name);
  };

  for (auto name : internalFileNames) {
    addName(name);
  }

  // An unreadable list file leaves the names unresolved; the entries stay
  // listed and readable by name
  if (auto listFile = readFile(listFileName)) {
    for (const auto &name : splitListFile(*listFile)) {
      addName(name);
    }
  }

  files_.clear();
  const auto &entries = hashTable_.entries();
  for (uint32_t i = 0; i < entries.size(); ++i) {
    const auto &entry = entries[i];
    if (entry.state() != SlotState::Live || !blockTable_.resolve(entry.blockIndex)) {
      continue;
    }

    std::string name;
    if (auto it = names.find(nameKey(entry.nameHashA, entry.nameHashB)); it != names.end()) {
      name = it->second;
    }
    files_.push_back(makeEntry(i, std::move(name)));
  }
}

FileEntry Reader::makeEntry(uint32_t hashIndex, std::string name) const {
  const auto &hashEntry = hashTable_.entries()[hashIndex];
  const auto &block = blockTable_.entries()[hashEntry.blockIndex];

  FileEntry entry;
  entry.name = std::move(name);
  entry.blockIndex = hashEntry.blockIndex;
  entry.hashIndex = hashIndex;
  entry.locale = hashEntry.locale;
  entry.platform = hashEntry.platform;
  entry.filePosition = blockTable_.filePosition(hashEntry.blockIndex);
  entry.compressedSize = block.compressedSize;
  entry.size = block.uncompressedSize;
  entry.flags = block.flags;
  return entry;
}

std::optional<FileEntry> Reader::findFile(std::string_view name, uint16_t locale,
                                          uint16_t platform, Error *outError) const {
  const NameHashes hashes = NameHashes::of(name);
  auto lookup = [&](uint16_t platformToTry) {
    auto slot = hashTable_.findSlot(hashes, locale, platformToTry);
    if (!slot && locale != neutralLocale) {
      slot = hashTable_.findSlot(hashes, neutralLocale, platformToTry);
    }
    return slot;
  };

  auto slot = lookup(platform);
  if (!slot && platform != defaultPlatform) {
    slot = lookup(defaultPlatform);
  }
  if (!slot) {
    detail::setError(outError, ErrorCode::NotFound,
                     std::format("File not found: {} (locale {:#06x}, platform {})", name,
                                 locale, platform));
    return std::nullopt;
  }

  const uint32_t blockIndex = hashTable_.entries()[*slot].blockIndex;
  if (!blockTable_.resolve(blockIndex, outError)) {
    return std::nullopt;
  }

  return makeEntry(*slot, std::string(name));
}

bool Reader::fileExists(std::string_view name, uint16_t locale, uint16_t platform) const {
  return findFile(name, locale, platform).has_value();
}

std::optional<std::vector<uint8_t>> Reader::readFile(std::string_view name, uint16_t locale,
                                                     uint16_t platform, Error *outError) const {
  auto entry = findFile(name, locale, platform, outError);
  if (!entry) {
    return std::nullopt;
  }
  return extractToMemory(*entry, outError);
}

std::optional<std::vector<uint8_t>> Reader::extractToMemory(const FileEntry &entry,
                                                            Error *outError) const {
  auto block = blockTable_.resolve(entry.blockIndex, outError);
  if (!block) {
    return std::nullopt;
  }

  const uint64_t position = blockTable_.filePosition(entry.blockIndex);
  uint32_t key = 0;
  if (block->isEncrypted()) {
    if (!entry.hasName()) {
      detail::setError(outError, ErrorCode::DecryptionError,
                       std::format("Block {} is encrypted and its file name is unknown",
                                   entry.blockIndex));
      return std::nullopt;
    }
    key = fileKey(entry.name, position, block->uncompressedSize, block->flags);
  }

  SectorReader sectors(archiveBytes(), header_.sectorSize(), options_.verifySectorChecksums);
  Error sectorError;
  auto data = sectors.readFile(position, *block, key, &sectorError);
  if (!data) {
    const std::string_view label = entry.hasName() ? std::string_view(entry.name) : "<unnamed>";
    detail::setError(outError, sectorError.code,
                     std::format("{} (block {}): {}", label, entry.blockIndex,
                                 sectorError.message));
    return std::nullopt;
  }
  return data;
}

bool Reader::extract(const FileEntry &entry, const std::filesystem::path &destPath,
                     Error *outError) const {
  auto data = extractToMemory(entry, outError);
  if (!data) {
    return false;
  }

  if (destPath.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      detail::setError(outError, ErrorCode::IoError,
                       std::format("Failed to create directory {}: {}",
                                   destPath.parent_path().string(), ec.message()));
      return false;
    }
  }

  std::ofstream out(destPath, std::ios::binary);
  if (!out) {
    detail::setError(outError, ErrorCode::IoError,
                     std::format("Failed to create output file: {}", destPath.string()));
    return false;
  }

  out.write(reinterpret_cast<const char *>(data->data()),
            static_cast<std::streamsize>(data->size()));
  if (!out) {
    detail::setError(outError, ErrorCode::IoError,
                     std::format("Failed to write to output file: {}", destPath.string()));
    return false;
  }

  return true;
}

bool Reader::extract(std::string_view name, const std::filesystem::path &destPath,
                     Error *outError) const {
  auto entry = findFile(name, neutralLocale, defaultPlatform, outError);
  if (!entry) {
    return false;
  }
  return extract(*entry, destPath, outError);
}

bool Reader::isOpen() const {
  return inMemory_ || mappedFile_.isOpen();
}

void Reader::close() {
  mappedFile_.close();
  memory_.clear();
  inMemory_ = false;
  archiveOffset_ = 0;
  header_ = Header();
  hashTable_ = HashTable();
  blockTable_ = BlockTable();
  files_.clear();
}

} // namespace mpqx
