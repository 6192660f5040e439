#include <algorithm>
#include <cstring>
#include <format>
#include <limits>
#include <string>
#include <string_view>

#include <bzlib.h>
#include <zlib.h>

#include <mpqx/compression.hpp>
#include <mpqx/endian.hpp>

namespace mpqx {

namespace {

std::string describeMask(uint8_t mask) {
  if (mask == Compression::Lzma) {
    return "lzma";
  }

  std::string names;
  auto add = [&](uint8_t bit, const char *name) {
    if (mask & bit) {
      if (!names.empty()) {
        names += '+';
      }
      names += name;
    }
  };
  add(Compression::Huffman, "huffman");
  add(Compression::Zlib, "zlib");
  add(Compression::PkWare, "pkware");
  add(Compression::Bzip2, "bzip2");
  add(Compression::Sparse, "sparse");
  add(Compression::AdpcmMono, "adpcm-mono");
  add(Compression::AdpcmStereo, "adpcm-stereo");
  if (mask & 0x04) {
    add(0x04, "unknown");
  }
  return names.empty() ? "none" : names;
}

// Next output buffer size while inflating. Starts from a small multiple of the
// input and doubles, never past capacity.
size_t growOutput(size_t current, size_t inputSize, size_t capacity) {
  constexpr size_t minimumStart = 0x1000;
  if (current == 0) {
    return std::min(capacity, std::max(minimumStart, inputSize * 4));
  }
  return current > capacity / 2 ? capacity : current * 2;
}

} // namespace

bool isSupportedCompression(uint8_t mask) noexcept {
  return mask != 0 && mask != Compression::Lzma && (mask & ~Compression::Supported) == 0;
}

std::optional<std::vector<uint8_t>> compress(std::span<const uint8_t> data, uint8_t mask,
                                             Error *outError) {
  if (!isSupportedCompression(mask)) {
    detail::setError(outError, ErrorCode::UnsupportedCompression,
                     std::format("Unsupported compression {:#04x} ({})", mask, describeMask(mask)));
    return std::nullopt;
  }

  std::vector<uint8_t> buffer(data.begin(), data.end());

  if (mask & Compression::Sparse) {
    buffer = codec::sparseCompress(buffer);
  }

  if (mask & Compression::Zlib) {
    auto compressed = codec::zlibCompress(buffer, outError);
    if (!compressed) {
      return std::nullopt;
    }
    buffer = std::move(*compressed);
  }

  if (mask & Compression::Bzip2) {
    auto compressed = codec::bzip2Compress(buffer, outError);
    if (!compressed) {
      return std::nullopt;
    }
    buffer = std::move(*compressed);
  }

  std::vector<uint8_t> result;
  result.reserve(buffer.size() + 1);
  result.push_back(mask);
  result.insert(result.end(), buffer.begin(), buffer.end());
  return result;
}

std::optional<std::vector<uint8_t>> decompress(std::span<const uint8_t> data, size_t expectedSize,
                                               Error *outError) {
  if (data.empty()) {
    detail::setError(outError, ErrorCode::CorruptSector, "Compressed data has no mask byte");
    return std::nullopt;
  }

  const uint8_t mask = data[0];
  if (!isSupportedCompression(mask)) {
    detail::setError(outError, ErrorCode::UnsupportedCompression,
                     std::format("Unsupported compression {:#04x} ({})", mask, describeMask(mask)));
    return std::nullopt;
  }

  // Stages before the sparse decoder produce sparse-coded data
  const size_t stageLimit =
      (mask & Compression::Sparse) ? codec::sparseBound(expectedSize) : expectedSize;

  std::vector<uint8_t> buffer(data.begin() + 1, data.end());

  if (mask & Compression::Bzip2) {
    auto decoded = codec::bzip2Decompress(buffer, stageLimit, outError);
    if (!decoded) {
      return std::nullopt;
    }
    buffer = std::move(*decoded);
  }

  if (mask & Compression::Zlib) {
    auto decoded = codec::zlibDecompress(buffer, stageLimit, outError);
    if (!decoded) {
      return std::nullopt;
    }
    buffer = std::move(*decoded);
  }

  if (mask & Compression::Sparse) {
    auto decoded = codec::sparseDecompress(buffer, expectedSize, outError);
    if (!decoded) {
      return std::nullopt;
    }
    buffer = std::move(*decoded);
  }

  if (buffer.size() != expectedSize) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("Decompressed {} bytes, expected {} ({})", buffer.size(),
                                 expectedSize, describeMask(mask)));
    return std::nullopt;
  }

  return buffer;
}

namespace codec {

Error compressionFailure(std::string_view codecName, int status) {
  return Error{ErrorCode::IoError,
               std::format("{} compression failed (status {})", codecName, status)};
}

std::optional<std::vector<uint8_t>> zlibCompress(std::span<const uint8_t> data, Error *outError) {
  uLongf length = compressBound(static_cast<uLong>(data.size()));
  std::vector<uint8_t> out(length);

  int status = compress2(out.data(), &length, data.data(), static_cast<uLong>(data.size()),
                         Z_DEFAULT_COMPRESSION);
  if (status != Z_OK) {
    if (outError) {
      *outError = compressionFailure("zlib", status);
    }
    return std::nullopt;
  }

  out.resize(length);
  return out;
}

std::optional<std::vector<uint8_t>> zlibDecompress(std::span<const uint8_t> data,
                                                   size_t outputLimit, Error *outError) {
  // One spare byte tells an oversized stream apart from an exact fit
  const size_t capacity = outputLimit + 1;
  std::vector<uint8_t> out;
  size_t produced = 0;

  z_stream stream{};
  stream.next_in = const_cast<Bytef *>(data.data());
  stream.avail_in = static_cast<uInt>(data.size());

  if (inflateInit(&stream) != Z_OK) {
    detail::setError(outError, ErrorCode::CorruptSector, "zlib initialization failed");
    return std::nullopt;
  }

  int status = Z_OK;
  while (status == Z_OK) {
    if (produced == out.size()) {
      if (out.size() == capacity) {
        break;
      }
      out.resize(growOutput(out.size(), data.size(), capacity));
    }

    stream.next_out = out.data() + produced;
    stream.avail_out = static_cast<uInt>(
        std::min<size_t>(out.size() - produced, std::numeric_limits<uInt>::max()));
    status = inflate(&stream, Z_NO_FLUSH);
    produced = static_cast<size_t>(stream.next_out - out.data());
  }
  inflateEnd(&stream);

  if (produced > outputLimit) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("zlib stream exceeds {} bytes", outputLimit));
    return std::nullopt;
  }

  if (status != Z_STREAM_END) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("zlib stream is corrupt or truncated (status {})", status));
    return std::nullopt;
  }

  out.resize(produced);
  return out;
}

std::optional<std::vector<uint8_t>> bzip2Compress(std::span<const uint8_t> data,
                                                  Error *outError) {
  unsigned int length = static_cast<unsigned int>(data.size() + data.size() / 100 + 600);
  std::vector<uint8_t> out(length);

  int status = BZ2_bzBuffToBuffCompress(reinterpret_cast<char *>(out.data()), &length,
                                        const_cast<char *>(reinterpret_cast<const char *>(data.data())),
                                        static_cast<unsigned int>(data.size()), 9, 0, 0);
  if (status != BZ_OK) {
    if (outError) {
      *outError = compressionFailure("bzip2", status);
    }
    return std::nullopt;
  }

  out.resize(length);
  return out;
}

std::optional<std::vector<uint8_t>> bzip2Decompress(std::span<const uint8_t> data,
                                                    size_t outputLimit, Error *outError) {
  const size_t capacity = outputLimit + 1;
  std::vector<uint8_t> out;
  size_t produced = 0;

  bz_stream stream{};
  if (BZ2_bzDecompressInit(&stream, 0, 0) != BZ_OK) {
    detail::setError(outError, ErrorCode::CorruptSector, "bzip2 initialization failed");
    return std::nullopt;
  }

  stream.next_in = const_cast<char *>(reinterpret_cast<const char *>(data.data()));
  stream.avail_in = static_cast<unsigned int>(data.size());

  int status = BZ_OK;
  while (status == BZ_OK) {
    if (produced == out.size()) {
      if (out.size() == capacity) {
        break;
      }
      out.resize(growOutput(out.size(), data.size(), capacity));
    }

    stream.next_out = reinterpret_cast<char *>(out.data() + produced);
    stream.avail_out = static_cast<unsigned int>(
        std::min<size_t>(out.size() - produced, std::numeric_limits<unsigned int>::max()));
    const unsigned int inBefore = stream.avail_in;
    const size_t outBefore = produced;
    status = BZ2_bzDecompress(&stream);
    produced = static_cast<size_t>(reinterpret_cast<uint8_t *>(stream.next_out) - out.data());

    // Input ran out before the end of the stream
    if (status == BZ_OK && stream.avail_in == inBefore && produced == outBefore) {
      break;
    }
  }
  BZ2_bzDecompressEnd(&stream);

  if (produced > outputLimit) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("bzip2 stream exceeds {} bytes", outputLimit));
    return std::nullopt;
  }

  if (status != BZ_STREAM_END) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("bzip2 stream is corrupt or truncated (status {})", status));
    return std::nullopt;
  }

  out.resize(produced);
  return out;
}

size_t sparseBound(size_t size) noexcept {
  return 4 + size + (size + 127) / 128;
}

std::vector<uint8_t> sparseCompress(std::span<const uint8_t> data) {
  constexpr size_t maxLiterals = 0x80;
  constexpr size_t maxZeros = 0x7F + 3;

  std::vector<uint8_t> out(4);
  out.reserve(sparseBound(data.size()));
  const uint32_t size = htobe32(static_cast<uint32_t>(data.size()));
  std::memcpy(out.data(), &size, sizeof(size));

  size_t pos = 0;
  while (pos < data.size()) {
    size_t zeros = 0;
    while (pos + zeros < data.size() && data[pos + zeros] == 0) {
      ++zeros;
    }

    if (zeros >= 3) {
      while (zeros >= 3) {
        size_t chunk = std::min(zeros, maxZeros);
        out.push_back(static_cast<uint8_t>(chunk - 3));
        pos += chunk;
        zeros -= chunk;
      }
      continue;
    }

    // Literal run up to the next run of three zeros
    size_t start = pos;
    while (pos < data.size() && pos - start < maxLiterals) {
      if (data[pos] == 0 && pos + 2 < data.size() && data[pos + 1] == 0 && data[pos + 2] == 0) {
        break;
      }
      ++pos;
    }

    out.push_back(static_cast<uint8_t>(0x80 | (pos - start - 1)));
    out.insert(out.end(), data.begin() + start, data.begin() + pos);
  }

  return out;
}

std::optional<std::vector<uint8_t>> sparseDecompress(std::span<const uint8_t> data,
                                                     size_t outputLimit, Error *outError) {
  if (data.size() < 4) {
    detail::setError(outError, ErrorCode::CorruptSector, "Sparse stream lacks its size prefix");
    return std::nullopt;
  }

  uint32_t declared;
  std::memcpy(&declared, data.data(), sizeof(declared));
  const size_t outputSize = betoh32(declared);
  if (outputSize > outputLimit) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("Sparse stream declares {} bytes, limit is {}", outputSize,
                                 outputLimit));
    return std::nullopt;
  }

  // Each control byte expands to at most 130 bytes
  const size_t maxExpansion = (data.size() - 4) * (0x7F + 3);
  if (outputSize > maxExpansion) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("Sparse stream of {} bytes cannot produce {} bytes", data.size(),
                                 outputSize));
    return std::nullopt;
  }

  std::vector<uint8_t> out;
  out.reserve(outputSize);

  size_t pos = 4;
  while (pos < data.size() && out.size() < outputSize) {
    const uint8_t control = data[pos++];
    const size_t remaining = outputSize - out.size();

    if (control & 0x80) {
      size_t count = std::min<size_t>((control & 0x7F) + 1, remaining);
      if (pos + count > data.size()) {
        detail::setError(outError, ErrorCode::CorruptSector, "Sparse literal run is truncated");
        return std::nullopt;
      }
      out.insert(out.end(), data.begin() + pos, data.begin() + pos + count);
      pos += count;
    } else {
      size_t count = std::min<size_t>((control & 0x7F) + 3, remaining);
      out.insert(out.end(), count, 0);
    }
  }

  if (out.size() != outputSize) {
    detail::setError(outError, ErrorCode::CorruptSector,
                     std::format("Sparse stream produced {} of {} bytes", out.size(), outputSize));
    return std::nullopt;
  }

  return out;
}

} // namespace codec

} // namespace mpqx
