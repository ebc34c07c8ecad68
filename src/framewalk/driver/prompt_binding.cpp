#include "prompt_binding.hpp"

#include <cstddef>
#include <format>

#include <spdlog/spdlog.h>

#include "framewalk/frame/execution_context.hpp"
#include "framewalk/frame/frame_renderer.hpp"

namespace framewalk::driver {

void PromptBinding::AnchorAt(
    const frame::ExecutionContext& context, size_t index) {
  prompt_ = std::format(
      "[framewalk #{} {}]> ", index,
      frame::DescribeConstruct(context.Construct()));

  auto location = context.Location();
  spdlog::debug(
      "anchored evaluation context at frame {} ({}:{})", index, location.file,
      location.line);
}

}  // namespace framewalk::driver
