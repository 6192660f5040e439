#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace mpqx {

// 'MPQ\x1A' and 'MPQ\x1B' read as little-endian words
inline constexpr uint32_t headerSignature = 0x1A51504D;
inline constexpr uint32_t userDataSignature = 0x1B51504D;

// Headers are searched for on every multiple of this offset
inline constexpr uint64_t headerAlignment = 0x200;

// Locale used by files that are not localized
inline constexpr uint16_t neutralLocale = 0;
inline constexpr uint16_t defaultPlatform = 0;

// Block table flags
namespace FileFlags {
inline constexpr uint32_t Implode = 0x00000100;
inline constexpr uint32_t Compress = 0x00000200;
inline constexpr uint32_t Encrypted = 0x00010000;
inline constexpr uint32_t FixKey = 0x00020000;
inline constexpr uint32_t PatchFile = 0x00100000;
inline constexpr uint32_t SingleUnit = 0x01000000;
inline constexpr uint32_t DeleteMarker = 0x02000000;
inline constexpr uint32_t SectorCrc = 0x04000000;
inline constexpr uint32_t Exists = 0x80000000;

inline constexpr uint32_t CompressMask = Implode | Compress;
} // namespace FileFlags

// Names of the internal files an archive may carry
inline constexpr std::string_view listFileName = "(listfile)";
inline constexpr std::string_view attributesFileName = "(attributes)";
inline constexpr std::string_view signatureFileName = "(signature)";

enum class ErrorCode {
  None,
  BadSignature,
  UnsupportedFormat,
  BadHeader,
  TruncatedHeader,
  TruncatedTable,
  CorruptTable,
  NotFound,
  OutOfRange,
  Deleted,
  CorruptSector,
  DecryptionError,
  UnsupportedCompression,
  InvalidArgument,
  DuplicateEntry,
  TableFull,
  IoError,
};

const char *errorCodeName(ErrorCode code) noexcept;

// Error reported through the optional out-parameter of fallible calls
struct Error {
  ErrorCode code = ErrorCode::None;
  std::string message;

  explicit operator bool() const { return code != ErrorCode::None; }
};

namespace detail {

inline void setError(Error *outError, ErrorCode code, std::string message) {
  if (outError) {
    outError->code = code;
    outError->message = std::move(message);
  }
}

} // namespace detail

// File entry as listed from the hash table
struct FileEntry {
  std::string name;            // Empty if the name could not be resolved
  uint32_t blockIndex = 0;     // Index into the block table
  uint32_t hashIndex = 0;      // Slot of the hash table entry
  uint16_t locale = neutralLocale;
  uint16_t platform = defaultPlatform;
  uint64_t filePosition = 0;   // Offset from the archive start
  uint32_t compressedSize = 0;
  uint32_t size = 0;           // Uncompressed size
  uint32_t flags = 0;

  bool hasName() const { return !name.empty(); }
};

} // namespace mpqx
