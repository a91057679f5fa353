#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace ito::util {

/*
  Portable result codes for the writer port.

  Backends translate their native failures (Arrow status, errno) into these.
  Callers decide whether a failed append is fatal.
*/

enum class ErrorCode {
  OK = 0,

  IOError,
  InvalidEvent,
  SerializationFailure,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::InvalidEvent:
      return "invalid_event";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::Unsupported:
      return "unsupported";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

inline void ThrowIfError(const Result& result, const std::string& prefix) {
  if (result) {
    return;
  }
  if (result.code == ErrorCode::IOError) {
    throw IoError(prefix + ": " + result.message);
  }
  throw std::runtime_error(prefix + ": " + result.message);
}

} // namespace ito::util
