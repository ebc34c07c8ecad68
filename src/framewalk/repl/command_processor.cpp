#include "framewalk/repl/command_processor.hpp"

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/navigation/navigator.hpp"
#include "framewalk/navigation/stack_registry.hpp"
#include "framewalk/repl/output_sink.hpp"

namespace framewalk::repl {

namespace {

auto ParseInteger(const std::string& text) -> std::optional<int64_t> {
  int64_t value = 0;
  const char* first = text.data();
  const char* last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

// Optional single integer argument, defaulting to 1.
auto ParseStepCount(std::span<const std::string> args, std::string_view usage)
    -> Result<int64_t> {
  if (args.empty()) {
    return 1;
  }
  if (args.size() > 1) {
    return std::unexpected(
        Diagnostic::Usage(
            std::format("too many arguments (usage: {})", usage)));
  }
  auto value = ParseInteger(args[0]);
  if (!value) {
    return std::unexpected(
        Diagnostic::Usage(
            std::format("invalid number '{}' (usage: {})", args[0], usage)));
  }
  return *value;
}

}  // namespace

auto SplitCommandLine(std::string_view line) -> std::vector<std::string> {
  std::vector<std::string> tokens;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t start = line.find_first_not_of(" \t\r\n", pos);
    if (start == std::string_view::npos) {
      break;
    }
    size_t end = line.find_first_of(" \t\r\n", start);
    if (end == std::string_view::npos) {
      end = line.size();
    }
    tokens.emplace_back(line.substr(start, end - start));
    pos = end;
  }
  return tokens;
}

CommandProcessor::CommandProcessor(
    navigation::Navigator& navigator, navigation::StackRegistry& registry,
    OutputSink& sink, size_t default_count)
    : navigator_(navigator),
      registry_(registry),
      sink_(sink),
      default_count_(default_count) {
  RegisterBuiltins();
}

void CommandProcessor::RegisterBuiltins() {
  RegisterCommand(
      {.name = "up",
       .shortcut = "u",
       .usage = "up [n]",
       .description = "Go up to the caller's context (n frames, default 1)",
       .handler = [this](auto args) { return CmdUp(args); }});
  RegisterCommand(
      {.name = "down",
       .shortcut = "d",
       .usage = "down [n]",
       .description = "Go down to the callee's context (n frames, default 1)",
       .handler = [this](auto args) { return CmdDown(args); }});
  RegisterCommand(
      {.name = "frame",
       .shortcut = "f",
       .usage = "frame [n]",
       .description =
           "Switch to frame n (negative counts from the end), or show the "
           "current frame",
       .handler = [this](auto args) { return CmdFrame(args); }});
  RegisterCommand(
      {.name = "show-stack",
       .shortcut = "bt",
       .usage = "show-stack [-v] [-H [n]] [-T [n]]",
       .description = "Show all accessible frames",
       .handler = [this](auto args) { return CmdShowStack(args); }});
  RegisterCommand(
      {.name = "help",
       .shortcut = "h",
       .usage = "help [command]",
       .description = "Display help for commands",
       .handler = [this](auto args) { return CmdHelp(args); }});
  RegisterCommand(
      {.name = "exit",
       .shortcut = "q",
       .usage = "exit",
       .description = "Leave the current stack and return to the prior one",
       .handler = [this](auto args) { return CmdExit(args); }});
}

void CommandProcessor::RegisterCommand(Command cmd) {
  if (!cmd.shortcut.empty()) {
    shortcuts_[cmd.shortcut] = cmd.name;
  }
  std::string name = cmd.name;
  commands_[name] = std::move(cmd);
}

auto CommandProcessor::Lookup(std::string_view name) const -> const Command* {
  if (auto it = commands_.find(name); it != commands_.end()) {
    return &it->second;
  }
  if (auto it = shortcuts_.find(name); it != shortcuts_.end()) {
    return Lookup(it->second);
  }
  return nullptr;
}

auto CommandProcessor::HasCommand(std::string_view name) const -> bool {
  return Lookup(name) != nullptr;
}

auto CommandProcessor::CommandNames() const -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(commands_.size());
  for (const auto& [name, cmd] : commands_) {
    names.push_back(name);
  }
  return names;
}

auto CommandProcessor::Completions(std::string_view partial) const
    -> std::vector<std::string> {
  std::vector<std::string> matches;
  for (const auto& [name, cmd] : commands_) {
    if (name.starts_with(partial)) {
      matches.push_back(name);
    }
  }
  for (const auto& [shortcut, name] : shortcuts_) {
    if (shortcut.starts_with(partial)) {
      matches.push_back(shortcut);
    }
  }
  return matches;
}

auto CommandProcessor::Execute(std::string_view line) -> Result<bool> {
  auto tokens = SplitCommandLine(line);
  if (tokens.empty()) {
    return true;
  }

  const Command* cmd = Lookup(tokens[0]);
  if (cmd == nullptr) {
    return std::unexpected(
        Diagnostic::Usage(std::format("unknown command '{}'", tokens[0]))
            .WithNote("type 'help' for a list of commands"));
  }

  spdlog::debug("command: {}", line);
  return cmd->handler(std::span<const std::string>(tokens).subspan(1));
}

auto CommandProcessor::Process(std::string_view line) -> CommandStatus {
  auto result = Execute(line);
  if (!result) {
    const Diagnostic& diag = result.error();
    sink_.WriteError(diag.Message());
    for (const auto& note : diag.notes) {
      sink_.WriteNote(note.message);
    }
    return CommandStatus{.keep_running = true, .failed = true};
  }
  return CommandStatus{.keep_running = *result, .failed = false};
}

auto CommandProcessor::CmdUp(std::span<const std::string> args)
    -> Result<bool> {
  auto count = ParseStepCount(args, "up [n]");
  if (!count) {
    return std::unexpected(std::move(count).error());
  }
  auto report = navigator_.Up(*count);
  if (!report) {
    return std::unexpected(std::move(report).error());
  }
  sink_.Write(report->text + "\n");
  return true;
}

auto CommandProcessor::CmdDown(std::span<const std::string> args)
    -> Result<bool> {
  auto count = ParseStepCount(args, "down [n]");
  if (!count) {
    return std::unexpected(std::move(count).error());
  }
  auto report = navigator_.Down(*count);
  if (!report) {
    return std::unexpected(std::move(report).error());
  }
  sink_.Write(report->text + "\n");
  return true;
}

auto CommandProcessor::CmdFrame(std::span<const std::string> args)
    -> Result<bool> {
  if (args.size() > 1) {
    return std::unexpected(
        Diagnostic::Usage("too many arguments (usage: frame [n])"));
  }

  std::optional<int64_t> index;
  if (!args.empty()) {
    index = ParseInteger(args[0]);
    if (!index) {
      return std::unexpected(
          Diagnostic::Usage(
              std::format("invalid frame number '{}'", args[0])));
    }
  }

  auto report = navigator_.Frame(index);
  if (!report) {
    return std::unexpected(std::move(report).error());
  }
  sink_.Write(report->text + "\n");
  return true;
}

auto CommandProcessor::CmdShowStack(std::span<const std::string> args)
    -> Result<bool> {
  navigation::ShowStackOptions options;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "-v" || arg == "--verbose") {
      options.verbose = true;
      continue;
    }

    bool is_head = arg == "-H" || arg == "--head";
    bool is_tail = arg == "-T" || arg == "--tail";
    if (!is_head && !is_tail) {
      return std::unexpected(
          Diagnostic::Usage(
              std::format(
                  "unknown option '{}' (usage: show-stack [-v] [-H [n]] "
                  "[-T [n]])",
                  arg)));
    }

    size_t count = default_count_;
    if (i + 1 < args.size() && !args[i + 1].starts_with('-')) {
      auto value = ParseInteger(args[i + 1]);
      if (!value || *value < 0) {
        return std::unexpected(
            Diagnostic::Usage(
                std::format(
                    "invalid frame count '{}' for {}", args[i + 1], arg)));
      }
      count = static_cast<size_t>(*value);
      ++i;
    }

    if (is_head) {
      options.head = count;
    } else {
      options.tail = count;
    }
  }

  auto result = navigator_.ShowStack(options);
  sink_.Write(result.text + "\n");
  return true;
}

auto CommandProcessor::CmdHelp(std::span<const std::string> args)
    -> Result<bool> {
  if (!args.empty()) {
    const Command* cmd = Lookup(args[0]);
    if (cmd == nullptr) {
      return std::unexpected(
          Diagnostic::Usage(std::format("unknown command '{}'", args[0])));
    }
    sink_.Write(
        std::format("Usage: {}\n  {}\n", cmd->usage, cmd->description));
    return true;
  }

  std::string text = "Commands:\n";
  for (const auto& [name, cmd] : commands_) {
    text += std::format(
        "  {:<12} {:<4} {}\n", name, cmd.shortcut, cmd.description);
  }
  sink_.Write(text);
  return true;
}

auto CommandProcessor::CmdExit(std::span<const std::string> args)
    -> Result<bool> {
  if (!args.empty()) {
    return std::unexpected(
        Diagnostic::Usage("too many arguments (usage: exit)"));
  }

  const navigation::SessionId& session = navigator_.Session();
  auto popped = registry_.Pop(session);
  if (popped == nullptr) {
    return false;
  }

  size_t remaining = registry_.StackCount(session);
  if (remaining > 0) {
    auto report = navigator_.Frame(std::nullopt);
    if (!report) {
      return std::unexpected(std::move(report).error());
    }
    sink_.Write(
        std::format(
            "Returned to enclosing stack ({} remaining)\n{}\n", remaining,
            report->text));
    return true;
  }

  if (const auto* prior = popped->PriorBinding()) {
    auto location = prior->Location();
    sink_.Write(
        std::format(
            "Returned to prior context @ {}:{}\n", location.file,
            location.line));
  }
  return false;
}

}  // namespace framewalk::repl
