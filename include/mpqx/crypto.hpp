#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

#include "types.hpp"

namespace mpqx {

// Offsets into the crypt table selecting the hash variant
enum class HashType : uint32_t {
  TableOffset = 0x000,
  NameA = 0x100,
  NameB = 0x200,
  FileKey = 0x300,
};

inline constexpr size_t cryptTableSize = 0x500;

// Keys of the hash and block tables: hashString("(hash table)", FileKey) and
// hashString("(block table)", FileKey)
inline constexpr uint32_t hashTableKey = 0xC3AF3770;
inline constexpr uint32_t blockTableKey = 0xEC83B3A3;

using Md5Digest = std::array<uint8_t, 16>;

// Process-wide table built on first use
const std::array<uint32_t, cryptTableSize> &cryptTable();

// Case-insensitive name hash; '/' and '\' hash the same
uint32_t hashString(std::string_view name, HashType type) noexcept;

// File name without its directory part
std::string_view plainName(std::string_view path) noexcept;

// Key of an encrypted file's data; FixKey mixes in the file position and size
uint32_t fileKey(std::string_view path, uint64_t filePosition, uint32_t fileSize,
                 uint32_t flags) noexcept;

// Both routines work on whole little-endian words. Trailing bytes that do not
// fill a word are left untouched.
void encryptBlock(std::span<uint8_t> data, uint32_t key) noexcept;
void decryptBlock(std::span<uint8_t> data, uint32_t key) noexcept;

// IoError when the digest is unavailable, e.g. MD5 disabled by a FIPS provider
std::optional<Md5Digest> md5(std::span<const uint8_t> data, Error *outError = nullptr);

bool isZeroDigest(const Md5Digest &digest) noexcept;

} // namespace mpqx
