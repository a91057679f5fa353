#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ito::util {

/*
  Central error types.

  The CLI maps these to exit codes and warnings. Line-level parse and
  schema problems are normally counted by the reader instead of thrown;
  the exception forms exist for callers that decode a single record.
*/

class IoError : public std::runtime_error {
 public:
  explicit IoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SchemaVersionError : public ParseError {
 public:
  SchemaVersionError(const std::string& msg, uint32_t version) : ParseError(msg), version_(version) {
  }

  uint32_t version() const {
    return version_;
  }

 private:
  uint32_t version_;
};

class DiscoveryError : public std::runtime_error {
 public:
  explicit DiscoveryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ReconcileInputError : public std::runtime_error {
 public:
  explicit ReconcileInputError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ito::util
