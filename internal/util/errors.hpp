#pragma once

#include <stdexcept>
#include <string>

namespace fieldgate::util {

/*
  Central error types.

  Data-path errors (ConnectionError .. StoreWriteError) are caught by the
  component that owns the recovery path and never reach main().
  InvalidConfig is the only error that is allowed to stop the process.
  gRPC adapters translate the rest to status codes.
*/

// Field device unreachable or connection dropped.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Device reachable but the read did not complete in time.
class ReadTimeout : public std::runtime_error {
 public:
  explicit ReadTimeout(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raw block does not match its layout.
class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreWriteError : public std::runtime_error {
 public:
  explicit StoreWriteError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fieldgate::util
