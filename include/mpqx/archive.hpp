#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace mpqx {

class Header;
class Reader;
class Writer;
struct AddFileOptions;
struct OpenOptions;
struct WriteOptions;

// Single entry point for reading an existing archive or building a new one
class Archive {
public:
  Archive();
  ~Archive();

  Archive(const Archive &) = delete;
  Archive &operator=(const Archive &) = delete;
  Archive(Archive &&) noexcept;
  Archive &operator=(Archive &&) noexcept;

  static std::optional<Archive> open(const std::filesystem::path &path, Error *outError = nullptr);
  static std::optional<Archive> open(const std::filesystem::path &path, const OpenOptions &options,
                                     Error *outError = nullptr);
  static std::optional<Archive> openMemory(std::vector<uint8_t> data, Error *outError = nullptr);

  static Archive create();
  static Archive create(const WriteOptions &options);

  // Writing

  bool addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
               Error *outError = nullptr);
  bool addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
               const AddFileOptions &options, Error *outError = nullptr);
  bool addFile(std::span<const uint8_t> data, const std::string &archivePath,
               Error *outError = nullptr);
  bool addFile(std::span<const uint8_t> data, const std::string &archivePath,
               const AddFileOptions &options, Error *outError = nullptr);

  bool removeFile(std::string_view archivePath, uint16_t locale = neutralLocale,
                  Error *outError = nullptr);

  bool write(const std::filesystem::path &destPath, Error *outError = nullptr);
  std::optional<std::vector<uint8_t>> writeToMemory(Error *outError = nullptr);

  // Clear pending files
  void clear();

  // Reading

  // nullptr unless reading
  const Header *header() const;

  // Listed entries when reading; entries of the last write when writing
  const std::vector<FileEntry> &files() const;

  size_t fileCount() const;

  std::optional<FileEntry> findFile(std::string_view name, uint16_t locale = neutralLocale,
                                    uint16_t platform = defaultPlatform,
                                    Error *outError = nullptr) const;
  bool fileExists(std::string_view name, uint16_t locale = neutralLocale,
                  uint16_t platform = defaultPlatform) const;
  std::optional<std::vector<uint8_t>> readFile(std::string_view name,
                                               uint16_t locale = neutralLocale,
                                               uint16_t platform = defaultPlatform,
                                               Error *outError = nullptr) const;

  bool extract(const FileEntry &entry, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;
  bool extract(std::string_view name, const std::filesystem::path &destPath,
               Error *outError = nullptr) const;

  std::optional<std::vector<uint8_t>> extractToMemory(const FileEntry &entry,
                                                      Error *outError = nullptr) const;

  bool isReading() const { return reader_ != nullptr; }
  bool isWriting() const { return writer_ != nullptr; }
  bool isOpen() const { return isReading() || isWriting(); }

  void close();

private:
  bool requireReader(Error *outError) const;
  bool requireWriter(Error *outError) const;

  std::unique_ptr<Reader> reader_;
  std::unique_ptr<Writer> writer_;
};

} // namespace mpqx
