#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/frame/execution_context.hpp"
#include "framewalk/frame/frame.hpp"
#include "framewalk/frame/frame_renderer.hpp"

namespace framewalk::navigation {

/// An ordered, cursor-tracked sequence of frames: one navigable call chain.
///
/// Index 0 is the innermost (most recent) frame. The frame list is fixed at
/// construction and always non-empty; the cursor always points at a valid
/// frame. Cursor moves are strict: any out-of-range target is rejected and
/// leaves the cursor untouched. Clamping policy belongs to the caller.
class FrameStack {
 public:
  /// Build a stack. Fails when frames is empty or initial_cursor is not a
  /// valid index.
  static auto Create(
      std::vector<frame::Frame> frames, size_t initial_cursor = 0,
      const frame::ExecutionContext* prior_binding = nullptr,
      frame::RenderOptions options = {}) -> Result<FrameStack>;

  [[nodiscard]] auto CurrentIndex() const -> size_t {
    return cursor_;
  }

  [[nodiscard]] auto Size() const -> size_t {
    return frames_.size();
  }

  [[nodiscard]] auto CurrentFrame() const -> const frame::Frame& {
    return frames_[cursor_];
  }

  [[nodiscard]] auto FrameAt(int64_t index) const
      -> Result<const frame::Frame*>;

  auto MoveTo(int64_t target) -> Result<void>;

  auto MoveRelative(int64_t delta) -> Result<void>;

  /// Context that was active before this stack was entered, or nullptr.
  [[nodiscard]] auto PriorBinding() const -> const frame::ExecutionContext* {
    return prior_binding_;
  }

  [[nodiscard]] auto HasPriorBinding() const -> bool {
    return prior_binding_ != nullptr;
  }

  /// Whether leaving this stack has somewhere to return to. stack_count is
  /// the number of stacks the enclosing registry holds for the session.
  [[nodiscard]] auto HasPriorContext(size_t stack_count) const -> bool {
    return stack_count > 1 || HasPriorBinding();
  }

  /// Memoized rendering of frame `index`. The underlying context is queried
  /// at most once per (index, verbose) pair for the lifetime of the stack.
  auto RenderFrame(int64_t index, bool verbose) -> Result<std::string>;

  [[nodiscard]] auto RenderCacheSize() const -> size_t {
    return render_cache_.size();
  }

  [[nodiscard]] auto Options() const -> const frame::RenderOptions& {
    return options_;
  }

 private:
  FrameStack(
      std::vector<frame::Frame> frames, size_t cursor,
      const frame::ExecutionContext* prior_binding,
      frame::RenderOptions options)
      : frames_(std::move(frames)),
        cursor_(cursor),
        prior_binding_(prior_binding),
        options_(options) {
  }

  [[nodiscard]] auto InRange(int64_t index) const -> bool {
    return index >= 0 && static_cast<size_t>(index) < frames_.size();
  }

  std::vector<frame::Frame> frames_;
  size_t cursor_;
  const frame::ExecutionContext* prior_binding_;
  frame::RenderOptions options_;

  // Key: (frame index, verbose)
  std::map<std::pair<size_t, bool>, std::string> render_cache_;
};

}  // namespace framewalk::navigation
