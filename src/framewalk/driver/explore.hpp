#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "framewalk/config/project_config.hpp"
#include "framewalk/navigation/navigator.hpp"

namespace framewalk::driver {

struct ExploreOptions {
  std::filesystem::path snapshot;
  // Scripted commands; an interactive loop runs when empty.
  std::vector<std::string> commands;
  std::string session = "main";
  config::ProjectConfig config;
};

struct ShowOptions {
  std::filesystem::path snapshot;
  navigation::ShowStackOptions show;
  config::ProjectConfig config;
};

auto Explore(const ExploreOptions& options) -> int;
auto Show(const ShowOptions& options) -> int;

}  // namespace framewalk::driver
