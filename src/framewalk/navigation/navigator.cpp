#include "framewalk/navigation/navigator.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <limits>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/common/internal_error.hpp"
#include "framewalk/navigation/frame_stack.hpp"
#include "framewalk/navigation/stack_registry.hpp"

namespace framewalk::navigation {

namespace {

// Signed cursor arithmetic that cannot overflow. Saturates at the int64
// limits, which are out of range for any stack anyway.
auto OffsetCursor(size_t cursor, int64_t delta) -> int64_t {
  auto base = static_cast<int64_t>(cursor);
  if (delta > 0 && base > std::numeric_limits<int64_t>::max() - delta) {
    return std::numeric_limits<int64_t>::max();
  }
  if (delta < 0 && base < std::numeric_limits<int64_t>::min() - delta) {
    return std::numeric_limits<int64_t>::min();
  }
  return base + delta;
}

// -n without overflow on INT64_MIN
auto Negate(int64_t n) -> int64_t {
  if (n == std::numeric_limits<int64_t>::min()) {
    return std::numeric_limits<int64_t>::max();
  }
  return -n;
}

auto RenderOrThrow(FrameStack& stack, size_t index, bool verbose)
    -> std::string {
  auto rendered = stack.RenderFrame(static_cast<int64_t>(index), verbose);
  if (!rendered) {
    common::ThrowInternalError("Navigator", rendered.error().Message());
  }
  return std::move(*rendered);
}

}  // namespace

Navigator::Navigator(
    StackRegistry& registry, SessionId session, HostBinding* binding)
    : registry_(registry), session_(std::move(session)), binding_(binding) {
}

auto Navigator::Report(FrameStack& stack, bool moved, bool clamped)
    -> NavigationReport {
  size_t index = stack.CurrentIndex();
  if (moved && binding_ != nullptr) {
    binding_->AnchorAt(stack.CurrentFrame().Context(), index);
  }
  return NavigationReport{
      .index = index,
      .text = std::format("#{} {}", index, RenderOrThrow(stack, index, true)),
      .moved = moved,
      .clamped = clamped,
  };
}

auto Navigator::Up(int64_t n) -> Result<NavigationReport> {
  return registry_.WithActiveStack(
      session_, [&](FrameStack* stack) -> Result<NavigationReport> {
        if (stack == nullptr) {
          return std::unexpected(Diagnostic::NoContext());
        }

        int64_t target = OffsetCursor(stack->CurrentIndex(), n);
        if (target < 0) {
          return std::unexpected(Diagnostic::BelowBottom());
        }
        auto last = static_cast<int64_t>(stack->Size() - 1);
        bool clamped = target > last;
        if (clamped) {
          spdlog::debug(
              "navigator: up {} overshoots, clamping to frame {}", n, last);
          target = last;
        }

        if (auto moved = stack->MoveTo(target); !moved) {
          return std::unexpected(std::move(moved).error());
        }
        return Report(*stack, true, clamped);
      });
}

auto Navigator::Down(int64_t n) -> Result<NavigationReport> {
  return registry_.WithActiveStack(
      session_, [&](FrameStack* stack) -> Result<NavigationReport> {
        if (stack == nullptr) {
          return std::unexpected(Diagnostic::NoContext());
        }

        int64_t target = OffsetCursor(stack->CurrentIndex(), Negate(n));
        if (target < 0) {
          return std::unexpected(Diagnostic::BelowBottom());
        }

        if (auto moved = stack->MoveTo(target); !moved) {
          return std::unexpected(std::move(moved).error());
        }
        return Report(*stack, true, false);
      });
}

auto Navigator::Frame(std::optional<int64_t> index)
    -> Result<NavigationReport> {
  return registry_.WithActiveStack(
      session_, [&](FrameStack* stack) -> Result<NavigationReport> {
        if (stack == nullptr) {
          return std::unexpected(Diagnostic::NoContext());
        }

        if (!index) {
          return Report(*stack, false, false);
        }

        int64_t target = *index;
        if (target < 0) {
          target = OffsetCursor(stack->Size(), target);
        }

        if (auto moved = stack->MoveTo(target); !moved) {
          // Report the index as the user typed it.
          return std::unexpected(
              Diagnostic::OutOfRange(*index, stack->Size()));
        }
        return Report(*stack, true, false);
      });
}

auto Navigator::ShowStack(const ShowStackOptions& options) -> ShowStackResult {
  return registry_.WithActiveStack(
      session_, [&](FrameStack* stack) -> ShowStackResult {
        if (stack == nullptr) {
          return ShowStackResult{
              .text = kNoStackMessage, .total = 0, .has_stack = false};
        }

        size_t total = stack->Size();
        size_t begin = 0;
        size_t end = total;
        if (options.head) {
          end = std::min(*options.head, total);
        } else if (options.tail) {
          begin = total - std::min(*options.tail, total);
        }

        std::string text = std::format(
            "Showing all accessible frames in stack ({} in total):\n--",
            total);
        for (size_t i = begin; i < end; ++i) {
          const char* marker = i == stack->CurrentIndex() ? "=>" : "  ";
          text += std::format(
              "\n{} #{} {}", marker, i,
              RenderOrThrow(*stack, i, options.verbose));
        }

        return ShowStackResult{
            .text = std::move(text), .total = total, .has_stack = true};
      });
}

}  // namespace framewalk::navigation
