#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "framewalk/frame/execution_context.hpp"
#include "framewalk/frame/frame.hpp"

namespace framewalk::frame {

struct RenderOptions {
  // Width the "[type]" column is padded to.
  size_t type_width = 9;
  // Maximum length of the self-description in verbose output.
  size_t self_clip_width = 60;
};

// Fallback description derived from the defining construct:
// routine name, "<module:Name>", "<class:Name>" or "<main>".
auto DescribeConstruct(const DefiningConstruct& construct) -> std::string;

// "Owner#name(a, b=?, *rest, &blk)" or
// "Owner#name(UNKNOWN) (undefined method)".
auto FormatSignature(const RoutineSignature& signature) -> std::string;

// Clip text to max_width characters, marking truncation with "...".
auto ClipText(std::string_view text, size_t max_width) -> std::string;

// Short form:   "{type} {desc} {sig}"
// Verbose form: short form + "\n      in {self} @ {file}:{line}"
//
// Pure: queries the context every call. FrameStack owns memoization.
auto RenderFrame(
    const Frame& frame, bool verbose, const RenderOptions& options = {})
    -> std::string;

}  // namespace framewalk::frame
