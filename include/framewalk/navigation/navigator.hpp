#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/frame/execution_context.hpp"
#include "framewalk/navigation/stack_registry.hpp"

namespace framewalk::navigation {

/// Host hook that re-anchors the session's evaluation context.
class HostBinding {
 public:
  HostBinding() = default;
  virtual ~HostBinding() = default;

  HostBinding(const HostBinding&) = delete;
  auto operator=(const HostBinding&) -> HostBinding& = delete;
  HostBinding(HostBinding&&) = delete;
  auto operator=(HostBinding&&) -> HostBinding& = delete;

  /// Called after every successful cursor move with the newly selected
  /// context and its index.
  virtual void AnchorAt(
      const frame::ExecutionContext& context, size_t index) = 0;
};

struct NavigationReport {
  // Selected frame index after the command.
  size_t index = 0;
  // "#{index} {verbose rendering}" of the selected frame.
  std::string text;
  // False for read-only queries (frame with no argument).
  bool moved = false;
  // True when up overshot the last frame and was clamped.
  bool clamped = false;
};

struct ShowStackOptions {
  std::optional<size_t> head;
  std::optional<size_t> tail;
  bool verbose = false;
};

struct ShowStackResult {
  std::string text;
  size_t total = 0;
  // False when no stack is registered; text then holds the informational
  // message.
  bool has_stack = false;
};

/// Navigation commands over one session's active stack.
///
/// Boundary policy is asymmetric: moving up past the last frame
/// clamps, moving down past frame 0 fails with kBelowBottom. Every failure
/// leaves the cursor where it was.
class Navigator {
 public:
  Navigator(
      StackRegistry& registry, SessionId session,
      HostBinding* binding = nullptr);

  /// Move toward older frames by n (cursor + n), clamped at the last frame.
  /// A negative n that lands below frame 0 fails with kBelowBottom.
  auto Up(int64_t n = 1) -> Result<NavigationReport>;

  /// Move toward newer frames by n (cursor - n). Fails below frame 0, and
  /// with kOutOfRange when a negative n overshoots the last frame.
  auto Down(int64_t n = 1) -> Result<NavigationReport>;

  /// Jump to index (negative counts from the end), or report the current
  /// frame verbosely when index is nullopt.
  auto Frame(std::optional<int64_t> index) -> Result<NavigationReport>;

  /// Listing of the selected frame range. Never fails: with no stack the
  /// result carries an informational message.
  auto ShowStack(const ShowStackOptions& options) -> ShowStackResult;

  [[nodiscard]] auto Session() const -> const SessionId& {
    return session_;
  }

 private:
  auto Report(FrameStack& stack, bool moved, bool clamped)
      -> NavigationReport;

  StackRegistry& registry_;
  SessionId session_;
  HostBinding* binding_;
};

inline constexpr const char* kNoStackMessage = "No caller stack available!";

}  // namespace framewalk::navigation
