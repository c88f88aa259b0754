#pragma once

#include <stdexcept>
#include <string>

namespace epg::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class FailedPrecondition : public std::runtime_error {
 public:
  explicit FailedPrecondition(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport level failure fetching the feed. Callers back off and retry.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageFailure : public std::runtime_error {
 public:
  explicit StorageFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace epg::util
