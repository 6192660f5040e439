#include <algorithm>
#include <cstring>
#include <format>
#include <fstream>
#include <limits>
#include <unordered_set>

#include <mpqx/block_table.hpp>
#include <mpqx/compression.hpp>
#include <mpqx/crypto.hpp>
#include <mpqx/hash_table.hpp>
#include <mpqx/mmap.hpp>
#include <mpqx/sector.hpp>
#include <mpqx/writer.hpp>

namespace mpqx {

namespace {

std::optional<std::vector<uint8_t>> readSource(const std::filesystem::path &path,
                                               Error *outError) {
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    detail::setError(outError, ErrorCode::IoError,
                     std::format("Failed to open source file: {}", path.string()));
    return std::nullopt;
  }

  const std::streamsize size = in.tellg();
  in.seekg(0, std::ios::beg);

  std::vector<uint8_t> data(static_cast<size_t>(size));
  if (!in.read(reinterpret_cast<char *>(data.data()), size)) {
    detail::setError(outError, ErrorCode::IoError,
                     std::format("Failed to read source file: {}", path.string()));
    return std::nullopt;
  }
  return data;
}

bool sameName(std::string_view a, std::string_view b) {
  return hashString(a, HashType::NameA) == hashString(b, HashType::NameA) &&
         hashString(a, HashType::NameB) == hashString(b, HashType::NameB);
}

} // namespace

bool Writer::addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
                     Error *outError) {
  return addFile(sourcePath, archivePath, AddFileOptions{}, outError);
}

bool Writer::addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
                     const AddFileOptions &options, Error *outError) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(sourcePath, ec)) {
    detail::setError(outError, ErrorCode::IoError,
                     std::format("Source file does not exist: {}", sourcePath.string()));
    return false;
  }

  PendingFile pending;
  pending.archivePath = archivePath;
  pending.sourcePath = sourcePath;
  pending.fromDisk = true;
  pending.options = options;
  return addPending(std::move(pending), outError);
}

bool Writer::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                     Error *outError) {
  return addFile(data, archivePath, AddFileOptions{}, outError);
}

bool Writer::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                     const AddFileOptions &options, Error *outError) {
  PendingFile pending;
  pending.archivePath = archivePath;
  pending.data.assign(data.begin(), data.end());
  pending.options = options;
  return addPending(std::move(pending), outError);
}

bool Writer::addPending(PendingFile pending, Error *outError) {
  const auto &options = pending.options;

  if (pending.archivePath.empty()) {
    detail::setError(outError, ErrorCode::InvalidArgument, "Archive path must not be empty");
    return false;
  }
  if (options.compression != 0 && !isSupportedCompression(options.compression)) {
    detail::setError(outError, ErrorCode::UnsupportedCompression,
                     std::format("Unsupported compression {:#04x} for {}", options.compression,
                                 pending.archivePath));
    return false;
  }
  if (options.fixKey && !options.encrypt) {
    detail::setError(outError, ErrorCode::InvalidArgument,
                     std::format("Fix-key requires encryption: {}", pending.archivePath));
    return false;
  }
  if (isPending(pending.archivePath, options.locale, options.platform)) {
    detail::setError(outError, ErrorCode::DuplicateEntry,
                     std::format("Duplicate file path in archive: {} (locale {:#06x})",
                                 pending.archivePath, options.locale));
    return false;
  }

  pendingFiles_.push_back(std::move(pending));
  return true;
}

bool Writer::isPending(std::string_view archivePath, uint16_t locale, uint16_t platform) const {
  return std::any_of(pendingFiles_.begin(), pendingFiles_.end(), [&](const PendingFile &file) {
    return file.options.locale == locale && file.options.platform == platform &&
           sameName(file.archivePath, archivePath);
  });
}

bool Writer::removeFile(std::string_view archivePath, uint16_t locale, Error *outError) {
  auto it = std::find_if(pendingFiles_.begin(), pendingFiles_.end(), [&](const PendingFile &file) {
    return file.options.locale == locale && sameName(file.archivePath, archivePath);
  });
  if (it == pendingFiles_.end()) {
    detail::setError(outError, ErrorCode::NotFound,
                     std::format("File not found: {} (locale {:#06x})", archivePath, locale));
    return false;
  }

  pendingFiles_.erase(it);
  return true;
}

std::vector<uint8_t> Writer::listFileContent() const {
  std::vector<uint8_t> content;
  std::unordered_set<std::string> seen;
  for (const auto &pending : pendingFiles_) {
    if (!seen.insert(pending.archivePath).second) {
      continue;
    }
    content.insert(content.end(), pending.archivePath.begin(), pending.archivePath.end());
    content.push_back('\r');
    content.push_back('\n');
  }
  return content;
}

std::optional<std::vector<uint8_t>> Writer::build(Error *outError) {
  if (options_.sectorSizeExponent > Header::maxSectorSizeExponent) {
    detail::setError(outError, ErrorCode::InvalidArgument,
                     std::format("Invalid sector size exponent {}", options_.sectorSizeExponent));
    return std::nullopt;
  }

  const bool addListFile =
      options_.addListFile && !isPending(listFileName, neutralLocale, defaultPlatform);
  const size_t fileCount = pendingFiles_.size() + (addListFile ? 1 : 0);
  if (fileCount >= HashEntry::deleted) {
    detail::setError(outError, ErrorCode::TableFull,
                     std::format("Too many files for one archive ({})", fileCount));
    return std::nullopt;
  }

  const uint32_t hashTableSize = options_.hashTableSize != 0
                                     ? options_.hashTableSize
                                     : HashTable::sizeForFileCount(static_cast<uint32_t>(fileCount));
  auto hashTable = HashTable::create(hashTableSize, outError);
  if (!hashTable) {
    return std::nullopt;
  }
  BlockTable blockTable;

  Header header = Header::create(options_.format);
  header.setSectorSizeExponent(options_.sectorSizeExponent);
  const bool basic = options_.format == Format::Basic;

  std::vector<uint8_t> out(header.headerSize(), 0);
  std::vector<FileEntry> entries;
  entries.reserve(fileCount);

  auto storeFile = [&](const std::string &name, std::span<const uint8_t> data,
                       const AddFileOptions &fileOptions) -> bool {
    const uint64_t position = out.size();
    if (basic && position > std::numeric_limits<uint32_t>::max()) {
      detail::setError(outError, ErrorCode::InvalidArgument,
                       std::format("{} starts beyond 4 GiB, which the Basic format cannot address",
                                   name));
      return false;
    }

    uint32_t flags = FileFlags::Exists;
    if (fileOptions.compression != 0) {
      flags |= FileFlags::Compress;
    }
    if (fileOptions.encrypt) {
      flags |= FileFlags::Encrypted;
    }
    if (fileOptions.fixKey) {
      flags |= FileFlags::FixKey;
    }
    if (fileOptions.singleUnit) {
      flags |= FileFlags::SingleUnit;
    }
    if (fileOptions.sectorCrc) {
      flags |= FileFlags::SectorCrc;
    }

    const uint32_t key =
        fileOptions.encrypt ? fileKey(name, position, static_cast<uint32_t>(data.size()), flags) : 0;

    Error fileError;
    auto encoded = SectorWriter::encode(data, flags, fileOptions.compression, header.sectorSize(),
                                        key, &fileError);
    if (!encoded) {
      detail::setError(outError, fileError.code, std::format("{}: {}", name, fileError.message));
      return false;
    }

    auto [low, high] = Header::splitHighBits(position);
    BlockEntry block;
    block.filePosition = low;
    block.compressedSize = static_cast<uint32_t>(encoded->data.size());
    block.uncompressedSize = static_cast<uint32_t>(data.size());
    block.flags = encoded->flags;
    const uint32_t blockIndex = blockTable.append(block, high);

    if (!hashTable->insert(name, fileOptions.locale, fileOptions.platform, blockIndex, outError)) {
      return false;
    }
    out.insert(out.end(), encoded->data.begin(), encoded->data.end());

    FileEntry entry;
    entry.name = name;
    entry.blockIndex = blockIndex;
    entry.hashIndex = hashTable->findSlot(NameHashes::of(name), fileOptions.locale,
                                          fileOptions.platform)
                          .value_or(0);
    entry.locale = fileOptions.locale;
    entry.platform = fileOptions.platform;
    entry.filePosition = position;
    entry.compressedSize = block.compressedSize;
    entry.size = block.uncompressedSize;
    entry.flags = block.flags;
    entries.push_back(std::move(entry));
    return true;
  };

  for (const auto &pending : pendingFiles_) {
    if (!pending.fromDisk) {
      if (!storeFile(pending.archivePath, pending.data, pending.options)) {
        return std::nullopt;
      }
      continue;
    }

    auto source = readSource(pending.sourcePath, outError);
    if (!source || !storeFile(pending.archivePath, *source, pending.options)) {
      return std::nullopt;
    }
  }

  if (addListFile) {
    AddFileOptions listOptions;
    listOptions.compression = Compression::Zlib;
    if (!storeFile(std::string(listFileName), listFileContent(), listOptions)) {
      return std::nullopt;
    }
  }

  const bool extendedV3 = options_.format == Format::ExtendedV3;
  const bool compressTables = options_.compressTables && extendedV3;
  auto storeTable = [&](std::vector<uint8_t> table, std::optional<uint32_t> key,
                        uint64_t &storedSize, Md5Digest &digest) -> std::optional<uint64_t> {
    if (compressTables && !table.empty()) {
      auto packed = compress(table, Compression::Zlib, outError);
      if (!packed) {
        return std::nullopt;
      }
      if (packed->size() < table.size()) {
        table = std::move(*packed);
      }
    }
    if (key) {
      encryptBlock(table, *key);
    }

    if (extendedV3) {
      auto tableDigest = md5(table, outError);
      if (!tableDigest) {
        return std::nullopt;
      }
      digest = *tableDigest;
    }

    const uint64_t offset = out.size();
    storedSize = table.size();
    out.insert(out.end(), table.begin(), table.end());
    return offset;
  };

  uint64_t hashStored = 0;
  uint64_t blockStored = 0;
  uint64_t hiBlockStored = 0;
  Md5Digest hashDigest{};
  Md5Digest blockDigest{};
  Md5Digest hiBlockDigest{};

  auto hashOffset = storeTable(hashTable->serialize(), hashTableKey, hashStored, hashDigest);
  if (!hashOffset) {
    return std::nullopt;
  }
  auto blockOffset = storeTable(blockTable.serialize(), blockTableKey, blockStored, blockDigest);
  if (!blockOffset) {
    return std::nullopt;
  }

  header.setHashTable(*hashOffset, hashTable->size());
  header.setBlockTable(*blockOffset, blockTable.size());

  if (!basic) {
    auto hiBlockOffset = storeTable(blockTable.serializeHiBlockWords(), std::nullopt,
                                    hiBlockStored, hiBlockDigest);
    if (!hiBlockOffset) {
      return std::nullopt;
    }
    header.setHiBlockTableOffset(*hiBlockOffset);
  }

  if (basic && out.size() > std::numeric_limits<uint32_t>::max()) {
    detail::setError(outError, ErrorCode::InvalidArgument,
                     std::format("Archive of {} bytes exceeds the Basic format limit", out.size()));
    return std::nullopt;
  }

  header.setArchiveSize(out.size());
  header.setStoredTableSizes(hashStored, blockStored, hiBlockStored);
  header.setTableDigests(hashDigest, blockDigest, hiBlockDigest);
  if (!header.updateHeaderDigest(outError)) {
    return std::nullopt;
  }

  auto headerBytes = header.serialize();
  std::copy(headerBytes.begin(), headerBytes.end(), out.begin());

  entries_ = std::move(entries);
  return out;
}

std::optional<std::vector<uint8_t>> Writer::writeToMemory(Error *outError) {
  return build(outError);
}

bool Writer::write(const std::filesystem::path &destPath, Error *outError) {
  auto archive = build(outError);
  if (!archive) {
    return false;
  }

  MappedFile outputFile;
  if (!outputFile.openWrite(destPath, archive->size(), outError)) {
    return false;
  }

  std::memcpy(outputFile.data().data(), archive->data(), archive->size());

  return outputFile.flush(outError);
}

void Writer::clear() {
  pendingFiles_.clear();
  entries_.clear();
}

} // namespace mpqx
