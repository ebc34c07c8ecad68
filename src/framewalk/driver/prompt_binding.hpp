#pragma once

#include <cstddef>
#include <string>

#include "framewalk/frame/execution_context.hpp"
#include "framewalk/navigation/navigator.hpp"

namespace framewalk::driver {

// Host binding for the interactive loop: the evaluation context is the
// prompt, which always names the selected frame.
class PromptBinding : public navigation::HostBinding {
 public:
  void AnchorAt(const frame::ExecutionContext& context, size_t index) override;

  [[nodiscard]] auto Prompt() const -> const std::string& {
    return prompt_;
  }

 private:
  std::string prompt_ = "[framewalk]> ";
};

}  // namespace framewalk::driver
