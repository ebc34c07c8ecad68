#include "framewalk/navigation/frame_stack.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/frame/frame.hpp"
#include "framewalk/frame/frame_renderer.hpp"

namespace framewalk::navigation {

auto FrameStack::Create(
    std::vector<frame::Frame> frames, size_t initial_cursor,
    const frame::ExecutionContext* prior_binding, frame::RenderOptions options)
    -> Result<FrameStack> {
  if (frames.empty()) {
    return std::unexpected(
        Diagnostic::HostError("cannot create a frame stack with no frames"));
  }
  if (initial_cursor >= frames.size()) {
    return std::unexpected(
        Diagnostic::OutOfRange(
            static_cast<int64_t>(initial_cursor), frames.size())
            .WithNote("initial cursor must select an existing frame"));
  }
  return FrameStack(std::move(frames), initial_cursor, prior_binding, options);
}

auto FrameStack::FrameAt(int64_t index) const -> Result<const frame::Frame*> {
  if (!InRange(index)) {
    return std::unexpected(Diagnostic::OutOfRange(index, frames_.size()));
  }
  return &frames_[static_cast<size_t>(index)];
}

auto FrameStack::MoveTo(int64_t target) -> Result<void> {
  if (!InRange(target)) {
    return std::unexpected(Diagnostic::OutOfRange(target, frames_.size()));
  }
  spdlog::debug("frame stack: cursor {} -> {}", cursor_, target);
  cursor_ = static_cast<size_t>(target);
  return {};
}

auto FrameStack::MoveRelative(int64_t delta) -> Result<void> {
  return MoveTo(static_cast<int64_t>(cursor_) + delta);
}

auto FrameStack::RenderFrame(int64_t index, bool verbose)
    -> Result<std::string> {
  auto frame = FrameAt(index);
  if (!frame) {
    return std::unexpected(std::move(frame).error());
  }

  auto key = std::make_pair(static_cast<size_t>(index), verbose);
  if (auto it = render_cache_.find(key); it != render_cache_.end()) {
    return it->second;
  }

  spdlog::debug(
      "frame stack: rendering frame {} ({})", index,
      verbose ? "verbose" : "short");
  auto rendered = frame::RenderFrame(**frame, verbose, options_);
  return render_cache_.emplace(key, std::move(rendered)).first->second;
}

}  // namespace framewalk::navigation
