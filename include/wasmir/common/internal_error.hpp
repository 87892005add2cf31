#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace wasmir::common {

// Exception type for broken IR invariants (bugs in a builder or rewrite pass,
// never malformed input).
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

}  // namespace wasmir::common
