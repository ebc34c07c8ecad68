#pragma once

#include <optional>
#include <string>
#include <utility>

#include "framewalk/frame/execution_context.hpp"

namespace framewalk::snapshot {

// Execution context replayed from a captured snapshot: every answer was
// recorded at capture time.
class SnapshotContext : public frame::ExecutionContext {
 public:
  SnapshotContext(
      frame::DefiningConstruct construct, std::string self_description,
      frame::SourceLocation location,
      std::optional<frame::RoutineSignature> signature)
      : construct_(std::move(construct)),
        self_description_(std::move(self_description)),
        location_(std::move(location)),
        signature_(std::move(signature)) {
  }

  [[nodiscard]] auto Construct() const -> frame::DefiningConstruct override {
    return construct_;
  }

  [[nodiscard]] auto DescribeSelf() const -> std::string override {
    return self_description_;
  }

  [[nodiscard]] auto Location() const -> frame::SourceLocation override {
    return location_;
  }

  [[nodiscard]] auto Signature() const
      -> std::optional<frame::RoutineSignature> override {
    return signature_;
  }

 private:
  frame::DefiningConstruct construct_;
  std::string self_description_;
  frame::SourceLocation location_;
  std::optional<frame::RoutineSignature> signature_;
};

}  // namespace framewalk::snapshot
