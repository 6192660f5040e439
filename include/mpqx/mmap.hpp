#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

#include "types.hpp"

namespace mpqx {

// Memory mapping of a whole file, read-only or read-write. An empty file opens
// as an empty view without a mapping.
class MappedFile {
public:
  MappedFile();
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;
  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  bool openRead(const std::filesystem::path &path, Error *outError = nullptr);

  // Create or truncate path to exactly size bytes and map it writable
  bool openWrite(const std::filesystem::path &path, size_t size, Error *outError = nullptr);

  std::span<const uint8_t> data() const {
    return std::span<const uint8_t>(static_cast<const uint8_t *>(data_), size_);
  }
  std::span<uint8_t> data() { return std::span<uint8_t>(static_cast<uint8_t *>(data_), size_); }

  bool flush(Error *outError = nullptr);

  void close() noexcept;

  bool isOpen() const { return fd_ >= 0; }
  bool isWritable() const { return writable_; }
  size_t size() const { return size_; }

private:
  bool map(const std::filesystem::path &path, int protection, int sharing, Error *outError);
  void release() noexcept;

  int fd_ = -1;
  void *data_ = nullptr;
  size_t size_ = 0;
  bool writable_ = false;
};

} // namespace mpqx
