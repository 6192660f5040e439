#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "block_table.hpp"
#include "hash_table.hpp"
#include "header.hpp"
#include "mmap.hpp"
#include "types.hpp"

namespace mpqx {

struct OpenOptions {
  // Check sector checksums of files flagged with SectorCrc
  bool verifySectorChecksums = true;
  // Check the ExtendedV3 header and table digests; zero digests are skipped
  bool verifyTableDigests = true;
};

// Read-only view of an archive. All queries are const and keep no cursor.
class Reader {
public:
  Reader() = default;
  ~Reader() = default;

  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;
  Reader(Reader &&) noexcept = default;
  Reader &operator=(Reader &&) noexcept = default;

  // Open an archive file (memory-mapped)
  static std::optional<Reader> open(const std::filesystem::path &path, Error *outError = nullptr);
  static std::optional<Reader> open(const std::filesystem::path &path, const OpenOptions &options,
                                    Error *outError = nullptr);

  // Open an archive held in memory; the reader takes ownership of the bytes
  static std::optional<Reader> openMemory(std::vector<uint8_t> data, Error *outError = nullptr);
  static std::optional<Reader> openMemory(std::vector<uint8_t> data, const OpenOptions &options,
                                          Error *outError = nullptr);

  const Header &header() const { return header_; }
  const HashTable &hashTable() const { return hashTable_; }
  const BlockTable &blockTable() const { return blockTable_; }

  // Offset of the header within the file; non-zero when user data or other
  // bytes precede the archive
  uint64_t archiveOffset() const { return archiveOffset_; }

  // Every live hash table entry pointing at an existing block. Names come from
  // the (listfile) and the internal file names.
  const std::vector<FileEntry> &files() const { return files_; }
  size_t fileCount() const { return files_.size(); }

  // Exact locale first, then the neutral locale. A platform without a match
  // falls back to the default platform the same way.
  std::optional<FileEntry> findFile(std::string_view name, uint16_t locale = neutralLocale,
                                    uint16_t platform = defaultPlatform,
                                    Error *outError = nullptr) const;

  bool fileExists(std::string_view name, uint16_t locale = neutralLocale,
                  uint16_t platform = defaultPlatform) const;

  std::optional<std::vector<uint8_t>> readFile(std::string_view name,
                                               uint16_t locale = neutralLocale,
                                               uint16_t platform = defaultPlatform,
                                               Error *outError = nullptr) const;

  // Decoded content of a listed entry
  std::optional<std::vector<uint8_t>> extractToMemory(const FileEntry &entry,
                                                      Error *outError = nullptr) const;

  // Write a file's content to destPath, creating parent directories
  bool extract(const FileEntry &entry, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;
  bool extract(std::string_view name, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  bool isOpen() const;

  void close();

private:
  bool parse(Error *outError);
  bool locateHeader(Error *outError);
  bool loadTables(Error *outError);
  void resolveNames();

  std::optional<std::vector<uint8_t>> loadTable(std::string_view what, uint64_t offset,
                                                uint64_t storedSize, uint64_t rawSize,
                                                std::optional<uint32_t> key,
                                                const Md5Digest *digest, Error *outError) const;

  FileEntry makeEntry(uint32_t hashIndex, std::string name) const;

  // Whole input, and the part starting at the header
  std::span<const uint8_t> bytes() const;
  std::span<const uint8_t> archiveBytes() const { return bytes().subspan(archiveOffset_); }

  MappedFile mappedFile_;
  std::vector<uint8_t> memory_;
  bool inMemory_ = false;
  OpenOptions options_;

  uint64_t archiveOffset_ = 0;
  Header header_;
  HashTable hashTable_;
  BlockTable blockTable_;
  std::vector<FileEntry> files_;
};

} // namespace mpqx
