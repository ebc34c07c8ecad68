#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/frame/frame_renderer.hpp"

namespace framewalk::config {

inline constexpr std::string_view kConfigFileName = "framewalk.toml";

struct ProjectConfig {
  frame::RenderOptions render;
  // Count used by show-stack -H / -T when no number follows the flag.
  size_t default_count = 10;
  std::string log_level = "warn";

  // Directory where framewalk.toml was found (empty for defaults)
  std::filesystem::path root_dir;
};

// Search for framewalk.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse framewalk.toml text. source_name is used in diagnostics.
auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<ProjectConfig>;

// Parse a framewalk.toml file.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// FindConfig + LoadConfig, falling back to defaults when no file exists.
auto LoadOptionalConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> Result<ProjectConfig>;

}  // namespace framewalk::config
