#pragma once

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "header.hpp"
#include "types.hpp"

namespace mpqx {

struct WriteOptions {
  Format format = Format::Basic;
  uint16_t sectorSizeExponent = Header::defaultSectorSizeExponent;
  // 0 picks the smallest power of two holding every file (at least 4)
  uint32_t hashTableSize = 0;
  // Store a (listfile) naming every file
  bool addListFile = true;
  // Compress the hash, block and hi-block tables (ExtendedV3 only)
  bool compressTables = false;
};

struct AddFileOptions {
  uint8_t compression = 0; // Compression mask, 0 stores the data raw
  bool encrypt = false;
  bool fixKey = false;     // Requires encrypt
  bool singleUnit = false;
  bool sectorCrc = false;  // Only meaningful for compressed, multi-sector files
  uint16_t locale = neutralLocale;
  uint16_t platform = defaultPlatform;
};

// Collects files and produces a complete archive in one pass
class Writer {
public:
  Writer() = default;
  explicit Writer(const WriteOptions &options) : options_(options) {}
  ~Writer() = default;

  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;
  Writer(Writer &&) noexcept = default;
  Writer &operator=(Writer &&) noexcept = default;

  // Add a file read from disk when the archive is written
  bool addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
               Error *outError = nullptr);
  bool addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
               const AddFileOptions &options, Error *outError = nullptr);

  bool addFile(std::span<const uint8_t> data, const std::string &archivePath,
               Error *outError = nullptr);
  bool addFile(std::span<const uint8_t> data, const std::string &archivePath,
               const AddFileOptions &options, Error *outError = nullptr);

  // Drop a pending file
  bool removeFile(std::string_view archivePath, uint16_t locale = neutralLocale,
                  Error *outError = nullptr);

  bool write(const std::filesystem::path &destPath, Error *outError = nullptr);

  std::optional<std::vector<uint8_t>> writeToMemory(Error *outError = nullptr);

  void clear();

  // Entries of the last written archive
  const std::vector<FileEntry> &files() const { return entries_; }

  // Number of pending files, not counting the generated (listfile)
  size_t fileCount() const { return pendingFiles_.size(); }

  const WriteOptions &options() const { return options_; }

private:
  struct PendingFile {
    std::string archivePath;
    std::filesystem::path sourcePath; // Empty if from memory
    std::vector<uint8_t> data;
    bool fromDisk = false;
    AddFileOptions options;
  };

  bool addPending(PendingFile pending, Error *outError);
  bool isPending(std::string_view archivePath, uint16_t locale, uint16_t platform) const;

  std::optional<std::vector<uint8_t>> build(Error *outError);
  std::vector<uint8_t> listFileContent() const;

  WriteOptions options_;
  std::vector<PendingFile> pendingFiles_;
  std::vector<FileEntry> entries_;
};

} // namespace mpqx
