#include "line_reader.hpp"

#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <readline/history.h>
#include <readline/readline.h>

namespace framewalk::driver {

namespace {

// readline callbacks are plain C functions; they reach the active reader
// through this pointer.
LineReader::CompletionFn* active_completion = nullptr;

auto CompletionGenerator(const char* text, int state) -> char* {
  static std::vector<std::string> matches;
  static size_t match_index = 0;

  if (state == 0) {
    matches.clear();
    match_index = 0;
    if (active_completion != nullptr) {
      matches = (*active_completion)(text);
    }
  }

  if (match_index >= matches.size()) {
    return nullptr;
  }
  return strdup(matches[match_index++].c_str());
}

auto CommandCompletion(const char* text, int start, int /*end*/) -> char** {
  rl_attempted_completion_over = 1;
  // Only the command word is completed.
  if (start != 0) {
    return nullptr;
  }
  return rl_completion_matches(text, CompletionGenerator);
}

}  // namespace

LineReader::LineReader(CompletionFn completion, size_t max_history)
    : completion_(std::move(completion)), max_history_(max_history) {
  active_completion = &completion_;
  rl_attempted_completion_function = CommandCompletion;
  using_history();
}

LineReader::~LineReader() {
  active_completion = nullptr;
  rl_attempted_completion_function = nullptr;
  clear_history();
}

auto LineReader::ReadLine(const std::string& prompt)
    -> std::optional<std::string> {
  char* line = readline(prompt.c_str());
  if (line == nullptr) {
    return std::nullopt;
  }

  std::string input(line);
  std::free(line);

  if (!input.empty()) {
    add_history(input.c_str());
    if (history_length > static_cast<int>(max_history_)) {
      HIST_ENTRY* removed = remove_history(0);
      if (removed != nullptr) {
        free_history_entry(removed);
      }
    }
  }
  return input;
}

}  // namespace framewalk::driver
