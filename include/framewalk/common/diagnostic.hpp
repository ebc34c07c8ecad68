#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace framewalk {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kNoContext,    // No active navigation stack for the session
  kBelowBottom,  // Attempted to move below the first frame
  kOutOfRange,   // Explicit frame index outside the stack
  kUsage,        // Malformed command arguments
  kHostError,    // I/O, malformed snapshot or config input
  kWarning,      // Non-fatal
  kNote,         // Auxiliary message
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  [[nodiscard]] auto Kind() const -> DiagKind {
    return primary.kind;
  }

  [[nodiscard]] auto Message() const -> const std::string& {
    return primary.message;
  }

  [[nodiscard]] auto IsError() const -> bool {
    return primary.kind != DiagKind::kWarning &&
           primary.kind != DiagKind::kNote;
  }

  static auto Make(DiagKind kind, std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = kind, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: navigation requested while no stack is registered
  static auto NoContext() -> Diagnostic {
    return Make(DiagKind::kNoContext, "Nowhere to go!");
  }

  // Factory: move below frame 0
  static auto BelowBottom() -> Diagnostic {
    return Make(
        DiagKind::kBelowBottom, "At bottom of stack, cannot go further!");
  }

  static auto OutOfRange(int64_t index, size_t size) -> Diagnostic;

  static auto Usage(std::string msg) -> Diagnostic {
    return Make(DiagKind::kUsage, std::move(msg));
  }

  // Factory: host error (file I/O, malformed external input)
  static auto HostError(std::string msg) -> Diagnostic {
    return Make(DiagKind::kHostError, std::move(msg));
  }

  // Add a note
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

auto DiagKindName(DiagKind kind) -> const char*;

}  // namespace framewalk
