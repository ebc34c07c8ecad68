#include "framewalk/config/project_config.hpp"

#include <array>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "framewalk/common/diagnostic.hpp"

namespace framewalk::config {

namespace {

namespace fs = std::filesystem;

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

// Read an optional positive integer at table[section][key].
auto ReadPositive(
    const toml::table& tbl, std::string_view section, std::string_view key,
    std::string_view source_name) -> Result<std::optional<size_t>> {
  const toml::node* node = tbl[section][key].node();
  if (node == nullptr) {
    return std::nullopt;
  }
  const auto* integer = node->as_integer();
  if (integer == nullptr || integer->get() <= 0) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "{}: '{}.{}' must be a positive integer", source_name, section,
                key)));
  }
  return static_cast<size_t>(integer->get());
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<ProjectConfig> {
  ProjectConfig config;

  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("failed to parse {}: {}", source_name, e.what())));
  }

  // [render] section (optional)
  auto clip = ReadPositive(tbl, "render", "self_clip_width", source_name);
  if (!clip) {
    return std::unexpected(clip.error());
  }
  if (*clip) {
    config.render.self_clip_width = **clip;
  }

  auto type_width = ReadPositive(tbl, "render", "type_width", source_name);
  if (!type_width) {
    return std::unexpected(type_width.error());
  }
  if (*type_width) {
    config.render.type_width = **type_width;
  }

  // [show_stack] section (optional)
  auto count = ReadPositive(tbl, "show_stack", "default_count", source_name);
  if (!count) {
    return std::unexpected(count.error());
  }
  if (*count) {
    config.default_count = **count;
  }

  // [log] section (optional)
  if (auto level = tbl["log"]["level"].value<std::string>()) {
    bool known = false;
    for (auto name : kLogLevels) {
      known = known || name == *level;
    }
    if (!known) {
      return std::unexpected(
          Diagnostic::HostError(
              std::format(
                  "{}: unknown log level '{}'", source_name, *level))
              .WithNote(
                  "expected one of: trace, debug, info, warn, error, "
                  "critical, off"));
    }
    config.log_level = *level;
  }

  return config;
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open config '{}'", config_path.string())));
  }
  std::ostringstream contents;
  contents << in.rdbuf();

  auto config = ParseConfig(contents.str(), config_path.string());
  if (config) {
    config->root_dir = config_path.parent_path();
    spdlog::info("using config {}", config_path.string());
  }
  return config;
}

auto LoadOptionalConfig(const fs::path& start_dir) -> Result<ProjectConfig> {
  auto config_path = FindConfig(start_dir);
  if (!config_path) {
    return ProjectConfig{};
  }
  return LoadConfig(*config_path);
}

}  // namespace framewalk::config
