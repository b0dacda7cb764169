#pragma once

#include <stdexcept>
#include <string>

namespace adrgen::util {

/*
  Central error types.

  main() maps these to operator messages and exit codes.
*/

// Record directory cannot be listed, created or written to.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A new record was requested without a title.
class MissingTitle : public std::runtime_error {
 public:
  explicit MissingTitle(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The record exists by filename but its content cannot be read.
class RecordUnreadable : public std::runtime_error {
 public:
  explicit RecordUnreadable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RecordWriteFailed : public std::runtime_error {
 public:
  explicit RecordWriteFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Record persisted, index rebuild failed. Never rolls the record back.
class IndexWriteFailed : public std::runtime_error {
 public:
  explicit IndexWriteFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace adrgen::util
