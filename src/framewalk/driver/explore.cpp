#include "explore.hpp"

#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <unistd.h>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "framewalk/navigation/navigator.hpp"
#include "framewalk/navigation/stack_registry.hpp"
#include "framewalk/repl/command_processor.hpp"
#include "framewalk/repl/output_sink.hpp"
#include "framewalk/snapshot/snapshot_loader.hpp"
#include "line_reader.hpp"
#include "print.hpp"
#include "prompt_binding.hpp"

namespace framewalk::driver {

namespace {

auto RunScript(
    repl::CommandProcessor& processor,
    const std::vector<std::string>& commands) -> int {
  bool any_failed = false;
  for (const auto& command : commands) {
    auto status = processor.Process(command);
    any_failed = any_failed || status.failed;
    if (!status.keep_running) {
      spdlog::info("no stack left after '{}', stopping", command);
      break;
    }
  }
  return any_failed ? 1 : 0;
}

auto RunInteractive(
    repl::CommandProcessor& processor, const PromptBinding& binding) -> int {
  LineReader reader([&processor](std::string_view partial) {
    return processor.Completions(partial);
  });

  processor.Process("frame");
  while (true) {
    auto line = reader.ReadLine(binding.Prompt());
    if (!line) {
      fmt::print("\n");
      break;
    }
    if (!processor.Process(*line).keep_running) {
      break;
    }
  }
  return 0;
}

}  // namespace

auto Explore(const ExploreOptions& options) -> int {
  auto snapshot =
      snapshot::LoadSnapshot(options.snapshot, options.config.render);
  if (!snapshot) {
    PrintDiagnostic(snapshot.error());
    return 1;
  }

  // Declared after the snapshot so stacks are destroyed before the contexts
  // their frames point to.
  navigation::StackRegistry registry;
  snapshot::RegisterSnapshot(*snapshot, registry, options.session);

  PromptBinding binding;
  if (auto* active = registry.ActiveStack(options.session)) {
    binding.AnchorAt(active->CurrentFrame().Context(), active->CurrentIndex());
  }

  navigation::Navigator navigator(registry, options.session, &binding);
  repl::StreamSink sink(stdout, stderr, isatty(STDERR_FILENO) != 0);
  repl::CommandProcessor processor(
      navigator, registry, sink, options.config.default_count);

  if (!options.commands.empty()) {
    return RunScript(processor, options.commands);
  }
  return RunInteractive(processor, binding);
}

auto Show(const ShowOptions& options) -> int {
  auto snapshot =
      snapshot::LoadSnapshot(options.snapshot, options.config.render);
  if (!snapshot) {
    PrintDiagnostic(snapshot.error());
    return 1;
  }

  const navigation::SessionId session = "main";
  navigation::StackRegistry registry;
  snapshot::RegisterSnapshot(*snapshot, registry, session);

  navigation::Navigator navigator(registry, session);
  auto result = navigator.ShowStack(options.show);
  fmt::print("{}\n", result.text);
  return 0;
}

}  // namespace framewalk::driver
