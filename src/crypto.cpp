#include <algorithm>
#include <format>

#include <openssl/evp.h>

#include <mpqx/crypto.hpp>
#include <mpqx/endian.hpp>
#include <mpqx/types.hpp>

namespace mpqx {

namespace {

std::array<uint32_t, cryptTableSize> buildCryptTable() {
  std::array<uint32_t, cryptTableSize> table{};
  uint32_t seed = 0x00100001;

  for (uint32_t index1 = 0; index1 < 0x100; ++index1) {
    for (uint32_t index2 = index1, i = 0; i < 5; ++i, index2 += 0x100) {
      seed = (seed * 125 + 3) % 0x2AAAAB;
      uint32_t high = (seed & 0xFFFF) << 0x10;

      seed = (seed * 125 + 3) % 0x2AAAAB;
      uint32_t low = seed & 0xFFFF;

      table[index2] = high | low;
    }
  }

  return table;
}

uint8_t normalizeChar(uint8_t c) noexcept {
  if (c == '/') {
    return '\\';
  }
  if (c >= 'a' && c <= 'z') {
    return static_cast<uint8_t>(c - 'a' + 'A');
  }
  return c;
}

} // namespace

const std::array<uint32_t, cryptTableSize> &cryptTable() {
  static const std::array<uint32_t, cryptTableSize> table = buildCryptTable();
  return table;
}

uint32_t hashString(std::string_view name, HashType type) noexcept {
  const auto &table = cryptTable();
  const uint32_t offset = static_cast<uint32_t>(type);
  uint32_t seed1 = 0x7FED7FED;
  uint32_t seed2 = 0xEEEEEEEE;

  for (char c : name) {
    uint32_t ch = normalizeChar(static_cast<uint8_t>(c));
    seed1 = table[offset + ch] ^ (seed1 + seed2);
    seed2 = ch + seed1 + seed2 + (seed2 << 5) + 3;
  }

  return seed1;
}

std::string_view plainName(std::string_view path) noexcept {
  auto pos = path.find_last_of("\\/");
  if (pos == std::string_view::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

uint32_t fileKey(std::string_view path, uint64_t filePosition, uint32_t fileSize,
                 uint32_t flags) noexcept {
  uint32_t key = hashString(plainName(path), HashType::FileKey);

  if (flags & FileFlags::FixKey) {
    key = (key + static_cast<uint32_t>(filePosition)) ^ fileSize;
  }

  return key;
}

void encryptBlock(std::span<uint8_t> data, uint32_t key) noexcept {
  const auto &table = cryptTable();
  uint32_t seed = 0xEEEEEEEE;
  const size_t words = data.size() / 4;

  for (size_t i = 0; i < words; ++i) {
    uint8_t *p = data.data() + i * 4;
    seed += table[0x400 + (key & 0xFF)];

    uint32_t plain = load32(p);
    store32(p, plain ^ (key + seed));

    key = ((~key << 0x15) + 0x11111111) | (key >> 0x0B);
    seed = plain + seed + (seed << 5) + 3;
  }
}

void decryptBlock(std::span<uint8_t> data, uint32_t key) noexcept {
  const auto &table = cryptTable();
  uint32_t seed = 0xEEEEEEEE;
  const size_t words = data.size() / 4;

  for (size_t i = 0; i < words; ++i) {
    uint8_t *p = data.data() + i * 4;
    seed += table[0x400 + (key & 0xFF)];

    uint32_t plain = load32(p) ^ (key + seed);
    store32(p, plain);

    key = ((~key << 0x15) + 0x11111111) | (key >> 0x0B);
    seed = plain + seed + (seed << 5) + 3;
  }
}

std::optional<Md5Digest> md5(std::span<const uint8_t> data, Error *outError) {
  Md5Digest digest{};
  unsigned int length = 0;

  if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_md5(), nullptr) != 1 ||
      length != digest.size()) {
    detail::setError(outError, ErrorCode::IoError,
                     std::format("MD5 digest of {} bytes failed", data.size()));
    return std::nullopt;
  }

  return digest;
}

bool isZeroDigest(const Md5Digest &digest) noexcept {
  return std::all_of(digest.begin(), digest.end(), [](uint8_t b) { return b == 0; });
}

} // namespace mpqx
