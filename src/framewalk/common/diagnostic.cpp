#include "framewalk/common/diagnostic.hpp"

#include <cstddef>
#include <cstdint>
#include <format>

namespace framewalk {

auto Diagnostic::OutOfRange(int64_t index, size_t size) -> Diagnostic {
  return Make(
      DiagKind::kOutOfRange,
      std::format(
          "frame index {} out of range (stack has {} frame{})", index, size,
          size == 1 ? "" : "s"));
}

auto DiagKindName(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kNoContext:
      return "no-context";
    case DiagKind::kBelowBottom:
      return "below-bottom";
    case DiagKind::kOutOfRange:
      return "out-of-range";
    case DiagKind::kUsage:
      return "usage";
    case DiagKind::kHostError:
      return "host-error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "unknown";
}

}  // namespace framewalk
