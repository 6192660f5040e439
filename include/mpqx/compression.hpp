#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace mpqx {

// Values of the mask byte leading a compressed sector. Several methods may be
// stacked in one sector; LZMA is an exact value, not a bit.
namespace Compression {
inline constexpr uint8_t Huffman = 0x01;
inline constexpr uint8_t Zlib = 0x02;
inline constexpr uint8_t PkWare = 0x08;
inline constexpr uint8_t Bzip2 = 0x10;
inline constexpr uint8_t Sparse = 0x20;
inline constexpr uint8_t AdpcmMono = 0x40;
inline constexpr uint8_t AdpcmStereo = 0x80;
inline constexpr uint8_t Lzma = 0x12;

inline constexpr uint8_t Supported = Zlib | Bzip2 | Sparse;
} // namespace Compression

bool isSupportedCompression(uint8_t mask) noexcept;

// Compress with the methods in mask (sparse, then zlib, then bzip2). The result
// starts with the mask byte. It may be larger than the input; callers store the
// data raw in that case.
std::optional<std::vector<uint8_t>> compress(std::span<const uint8_t> data, uint8_t mask,
                                             Error *outError = nullptr);

// Undo compress(). The output must be exactly expectedSize bytes.
std::optional<std::vector<uint8_t>> decompress(std::span<const uint8_t> data, size_t expectedSize,
                                               Error *outError = nullptr);

namespace codec {

// Decoders fail when the output would exceed outputLimit bytes. Output buffers
// grow with the decoded data, so a large limit costs nothing up front.

// IoError for a codec library that failed to compress
Error compressionFailure(std::string_view codecName, int status);

std::optional<std::vector<uint8_t>> zlibCompress(std::span<const uint8_t> data,
                                                 Error *outError = nullptr);
std::optional<std::vector<uint8_t>> zlibDecompress(std::span<const uint8_t> data,
                                                   size_t outputLimit, Error *outError = nullptr);

std::optional<std::vector<uint8_t>> bzip2Compress(std::span<const uint8_t> data,
                                                  Error *outError = nullptr);
std::optional<std::vector<uint8_t>> bzip2Decompress(std::span<const uint8_t> data,
                                                    size_t outputLimit, Error *outError = nullptr);

// Zero-run coding: a big-endian 32-bit output size, then chunks. A byte with
// bit 7 set copies (n & 0x7F) + 1 literals, otherwise it emits n + 3 zeros.
std::vector<uint8_t> sparseCompress(std::span<const uint8_t> data);
std::optional<std::vector<uint8_t>> sparseDecompress(std::span<const uint8_t> data,
                                                     size_t outputLimit, Error *outError = nullptr);

// Upper bound of sparseCompress() output for size input bytes
size_t sparseBound(size_t size) noexcept;

} // namespace codec

} // namespace mpqx
