#pragma once

#include <stdexcept>
#include <string>

namespace healthd::util {

/*
  Central error types.

  Foreground store operations throw these (or db::Error for engine
  failures); background loops catch and log them.
*/

class InvalidArgument : public std::invalid_argument {
 public:
  explicit InvalidArgument(const std::string& msg) : std::invalid_argument(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed or unencodable stored payload.
class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Request context canceled or past its deadline.
class ContextError : public std::runtime_error {
 public:
  enum class Reason { kCanceled, kDeadlineExceeded };

  ContextError(Reason reason, const std::string& msg) : std::runtime_error(msg), reason_(reason) {
  }

  Reason reason() const {
    return reason_;
  }

 private:
  Reason reason_;
};

} // namespace healthd::util
