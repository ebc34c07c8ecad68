#pragma once

#include <format>
#include <stdexcept>
#include <string>

namespace framewalk::common {

// Exception type for internal framewalk errors (broken invariants, not user
// errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            std::format(
                "Internal error in {}: {}\n"
                "This is a bug in framewalk.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace framewalk::common
