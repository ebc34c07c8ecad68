#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/navigation/navigator.hpp"
#include "framewalk/navigation/stack_registry.hpp"
#include "framewalk/repl/output_sink.hpp"

namespace framewalk::repl {

// Outcome of one command line.
struct CommandStatus {
  // False once the session has no stack left to navigate.
  bool keep_running = true;
  bool failed = false;
};

/// Line-oriented command surface over a Navigator.
///
/// Commands: up [n], down [n], frame [n], show-stack [-v] [-H [n]] [-T [n]],
/// help [command], exit. Each command either completes or fails as a whole;
/// a failed command leaves navigation state unchanged.
class CommandProcessor {
 public:
  // Handler result: whether the processor should keep running.
  using Handler =
      std::function<Result<bool>(std::span<const std::string> args)>;

  struct Command {
    std::string name;
    std::string shortcut;
    std::string usage;
    std::string description;
    Handler handler;
  };

  CommandProcessor(
      navigation::Navigator& navigator, navigation::StackRegistry& registry,
      OutputSink& sink, size_t default_count = 10);

  /// Parse and run one line. Empty lines are a no-op.
  auto Execute(std::string_view line) -> Result<bool>;

  /// Execute() and report a failure to the sink's error channel.
  auto Process(std::string_view line) -> CommandStatus;

  void RegisterCommand(Command cmd);

  [[nodiscard]] auto HasCommand(std::string_view name) const -> bool;

  /// Command names in registration-independent (sorted) order.
  [[nodiscard]] auto CommandNames() const -> std::vector<std::string>;

  /// Names and shortcuts starting with `partial`, for line completion.
  [[nodiscard]] auto Completions(std::string_view partial) const
      -> std::vector<std::string>;

 private:
  void RegisterBuiltins();

  [[nodiscard]] auto Lookup(std::string_view name) const -> const Command*;

  auto CmdUp(std::span<const std::string> args) -> Result<bool>;
  auto CmdDown(std::span<const std::string> args) -> Result<bool>;
  auto CmdFrame(std::span<const std::string> args) -> Result<bool>;
  auto CmdShowStack(std::span<const std::string> args) -> Result<bool>;
  auto CmdHelp(std::span<const std::string> args) -> Result<bool>;
  auto CmdExit(std::span<const std::string> args) -> Result<bool>;

  navigation::Navigator& navigator_;
  navigation::StackRegistry& registry_;
  OutputSink& sink_;
  size_t default_count_;

  std::map<std::string, Command, std::less<>> commands_;
  // shortcut -> command name
  std::map<std::string, std::string, std::less<>> shortcuts_;
};

// Split a command line on whitespace.
auto SplitCommandLine(std::string_view line) -> std::vector<std::string>;

}  // namespace framewalk::repl
