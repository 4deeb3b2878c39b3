#include "sk/core/errors.h"

namespace sk {

const char *ErrorCodeToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::kNone:
    return "ok";
  case ErrorCode::kFormat:
    return "format error";
  case ErrorCode::kUnsupportedFormat:
    return "unsupported format";
  case ErrorCode::kDecompression:
    return "decompression error";
  case ErrorCode::kInvalidArgument:
    return "invalid argument";
  case ErrorCode::kInternal:
    return "internal error";
  }
  return "unknown error";
}

} // namespace sk
