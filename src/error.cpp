#include <mpqx/types.hpp>

namespace mpqx {

const char *errorCodeName(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::None:
    return "None";
  case ErrorCode::BadSignature:
    return "BadSignature";
  case ErrorCode::UnsupportedFormat:
    return "UnsupportedFormat";
  case ErrorCode::BadHeader:
    return "BadHeader";
  case ErrorCode::TruncatedHeader:
    return "TruncatedHeader";
  case ErrorCode::TruncatedTable:
    return "TruncatedTable";
  case ErrorCode::CorruptTable:
    return "CorruptTable";
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::OutOfRange:
    return "OutOfRange";
  case ErrorCode::Deleted:
    return "Deleted";
  case ErrorCode::CorruptSector:
    return "CorruptSector";
  case ErrorCode::DecryptionError:
    return "DecryptionError";
  case ErrorCode::UnsupportedCompression:
    return "UnsupportedCompression";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::DuplicateEntry:
    return "DuplicateEntry";
  case ErrorCode::TableFull:
    return "TableFull";
  case ErrorCode::IoError:
    return "IoError";
  }
  return "Unknown";
}

} // namespace mpqx
