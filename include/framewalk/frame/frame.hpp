#pragma once

#include <optional>
#include <string>
#include <utility>

#include "framewalk/frame/execution_context.hpp"

namespace framewalk::frame {

/// One captured execution context plus producer-supplied tags.
///
/// Lifetime contract: the context must outlive every FrameStack holding this
/// frame.
class Frame {
 public:
  explicit Frame(
      const ExecutionContext* context,
      std::optional<std::string> type = std::nullopt,
      std::optional<std::string> label = std::nullopt)
      : context_(context), type_(std::move(type)), label_(std::move(label)) {
  }

  [[nodiscard]] auto Context() const -> const ExecutionContext& {
    return *context_;
  }

  [[nodiscard]] auto Type() const -> const std::optional<std::string>& {
    return type_;
  }

  [[nodiscard]] auto Label() const -> const std::optional<std::string>& {
    return label_;
  }

 private:
  const ExecutionContext* context_;
  std::optional<std::string> type_;
  std::optional<std::string> label_;
};

}  // namespace framewalk::frame
