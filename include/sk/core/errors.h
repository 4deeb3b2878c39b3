#pragma once

#include <optional>
#include <string>
#include <utility>

#ifdef _MSC_VER
#ifndef __restrict__
#define __restrict__ __restrict
#endif
#endif

namespace sk {

enum class ErrorCode {
  kNone,
  kFormat,            // structurally invalid input
  kUnsupportedFormat, // valid input in a variant we do not decode
  kDecompression,     // corrupt or truncated compressed payload
  kInvalidArgument,
  kInternal,
};

struct Error {
  ErrorCode code = ErrorCode::kNone;
  std::string message;
};

inline Error MakeError(ErrorCode code, std::string msg) {
  return Error{code, std::move(msg)};
}
inline Error FormatError(std::string msg) {
  return MakeError(ErrorCode::kFormat, std::move(msg));
}
inline Error UnsupportedFormatError(std::string msg) {
  return MakeError(ErrorCode::kUnsupportedFormat, std::move(msg));
}
inline Error DecompressionError(std::string msg) {
  return MakeError(ErrorCode::kDecompression, std::move(msg));
}

const char *ErrorCodeToString(ErrorCode code);

// Tag for a cooperatively cancelled operation. Not an error.
struct Aborted {};

// Holds exactly one of: a value, an error, or the aborted marker.
template <typename T> class Expected {
public:
  Expected(const T &value) : value_(value) {}
  Expected(T &&value) : value_(std::move(value)) {}
  Expected(const Error &error) : error_(error) {}
  Expected(Error &&error) : error_(std::move(error)) {}
  Expected(Aborted) : aborted_(true) {}

  bool ok() const { return value_.has_value(); }
  bool aborted() const { return aborted_; }
  bool failed() const { return error_.has_value(); }
  explicit operator bool() const { return ok(); }

  const T &value() const { return *value_; }
  T &value() { return *value_; }
  const Error &error() const { return *error_; }

private:
  std::optional<T> value_;
  std::optional<Error> error_;
  bool aborted_ = false;
};

} // namespace sk
