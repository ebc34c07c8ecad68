#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>

#include "explore.hpp"
#include "framewalk/config/project_config.hpp"
#include "print.hpp"

namespace {

namespace fs = std::filesystem;

// All log output goes to stderr so stdout carries only command results.
void SetupLogging() {
  auto logger = spdlog::stderr_color_mt("framewalk");
  logger->set_pattern("[%n][%H:%M:%S][%l] %v");
  spdlog::set_default_logger(std::move(logger));
  spdlog::set_level(spdlog::level::warn);
}

auto ApplyLogLevel(const std::string& level) -> bool {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (parsed == spdlog::level::off && level != "off") {
    framewalk::driver::PrintError(std::format("unknown log level '{}'", level));
    return false;
  }
  spdlog::set_level(parsed);
  return true;
}

auto LoadConfigOrReport() -> std::optional<framewalk::config::ProjectConfig> {
  auto config = framewalk::config::LoadOptionalConfig();
  if (!config) {
    framewalk::driver::PrintDiagnostic(config.error());
    return std::nullopt;
  }
  return *config;
}

auto ExploreCommand(
    const argparse::ArgumentParser& cmd,
    const framewalk::config::ProjectConfig& config) -> int {
  framewalk::driver::ExploreOptions options{
      .snapshot = cmd.get<std::string>("snapshot"),
      .commands = {},
      .session = cmd.get<std::string>("--session"),
      .config = config,
  };
  if (auto commands = cmd.present<std::vector<std::string>>("-c")) {
    options.commands = *commands;
  }
  return framewalk::driver::Explore(options);
}

auto ShowCommand(
    const argparse::ArgumentParser& cmd,
    const framewalk::config::ProjectConfig& config) -> int {
  framewalk::driver::ShowOptions options{
      .snapshot = cmd.get<std::string>("snapshot"),
      .show = {},
      .config = config,
  };
  options.show.verbose = cmd.get<bool>("--verbose");

  if (auto head = cmd.present<int>("--head")) {
    if (*head < 0) {
      framewalk::driver::PrintError("--head must not be negative");
      return 1;
    }
    options.show.head = static_cast<size_t>(*head);
  }
  if (auto tail = cmd.present<int>("--tail")) {
    if (*tail < 0) {
      framewalk::driver::PrintError("--tail must not be negative");
      return 1;
    }
    options.show.tail = static_cast<size_t>(*tail);
  }
  return framewalk::driver::Show(options);
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("framewalk", "0.1.0");
  program.add_description("Navigate captured call-stack frames");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");
  program.add_argument("--log-level")
      .help("trace, debug, info, warn, error, critical or off (default: warn)");

  // Subcommand: explore
  argparse::ArgumentParser explore_cmd("explore");
  explore_cmd.add_description(
      "Load a snapshot and navigate it interactively or with scripted "
      "commands");
  explore_cmd.add_argument("snapshot").help("Snapshot file (TOML)");
  explore_cmd.add_argument("-c", "--command")
      .append()
      .help("Run a navigation command instead of prompting (repeatable)");
  explore_cmd.add_argument("--session")
      .default_value(std::string("main"))
      .help("Session identity to register the stacks under");

  // Subcommand: show
  argparse::ArgumentParser show_cmd("show");
  show_cmd.add_description("Print the frames of the active stack");
  show_cmd.add_argument("snapshot").help("Snapshot file (TOML)");
  show_cmd.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Include self and source location");
  show_cmd.add_argument("-H", "--head")
      .scan<'i', int>()
      .help("Display the first N frames");
  show_cmd.add_argument("-T", "--tail")
      .scan<'i', int>()
      .help("Display the last N frames");

  program.add_subparser(explore_cmd);
  program.add_subparser(show_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    framewalk::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before loading config or snapshots
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      framewalk::driver::PrintError(
          std::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  SetupLogging();
  if (auto level = program.present("--log-level")) {
    if (!ApplyLogLevel(*level)) {
      return 1;
    }
  }

  auto config = LoadConfigOrReport();
  if (!config) {
    return 1;
  }
  if (auto level = program.present("--log-level")) {
    config->log_level = *level;
  }
  if (!ApplyLogLevel(config->log_level)) {
    return 1;
  }

  if (program.is_subcommand_used("explore")) {
    return ExploreCommand(explore_cmd, *config);
  }

  if (program.is_subcommand_used("show")) {
    return ShowCommand(show_cmd, *config);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
