#pragma once

#include <stdexcept>
#include <string>

namespace ragctx::util {

/*
  Central error types.

  Upstream unavailability and rejected options abort a call.
  Data-integrity problems never surface here; they are logged and degrade results.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Out-of-range option values, rejected before any work starts.
class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Vector store or repository unreachable. Never turned into an empty result.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ragctx::util
