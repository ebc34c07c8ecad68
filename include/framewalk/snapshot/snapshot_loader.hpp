#pragma once

#include <filesystem>
#include <memory>
#include <string_view>
#include <vector>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/frame/frame_renderer.hpp"
#include "framewalk/navigation/frame_stack.hpp"
#include "framewalk/navigation/stack_registry.hpp"
#include "framewalk/snapshot/snapshot_context.hpp"

namespace framewalk::snapshot {

/// Captured stacks read from a snapshot file.
///
/// Lifetime contract: the snapshot owns the contexts its frames point to and
/// must outlive every FrameStack built from it, including stacks already
/// moved into a registry.
struct Snapshot {
  std::vector<std::unique_ptr<SnapshotContext>> contexts;
  // Oldest first; the last stack is the innermost (active) one.
  std::vector<navigation::FrameStack> stacks;
};

// Parse snapshot TOML text. source_name is used in diagnostics.
auto ParseSnapshot(
    std::string_view text, std::string_view source_name,
    const frame::RenderOptions& options = {}) -> Result<Snapshot>;

auto LoadSnapshot(
    const std::filesystem::path& path,
    const frame::RenderOptions& options = {}) -> Result<Snapshot>;

// Move every stack of the snapshot into the registry, in file order.
void RegisterSnapshot(
    Snapshot& snapshot, navigation::StackRegistry& registry,
    const navigation::SessionId& session);

}  // namespace framewalk::snapshot
