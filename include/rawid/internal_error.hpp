#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace rawid {

// Raised when a caller breaks a documented precondition. These are bugs in
// the calling code, not conditions to recover from.
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format("Internal error in {}: {}", context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace rawid
