#include "framewalk/repl/output_sink.hpp"

#include <cstdio>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

namespace framewalk::repl {

void StreamSink::Write(std::string_view text) {
  fmt::print(out_, "{}", text);
  std::fflush(out_);
}

void StreamSink::WriteError(std::string_view message) {
  if (colors_) {
    fmt::print(
        err_, "{} {}\n",
        fmt::styled(
            "error:",
            fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold),
        fmt::styled(message, fmt::emphasis::bold));
  } else {
    fmt::print(err_, "error: {}\n", message);
  }
  std::fflush(err_);
}

void StreamSink::WriteNote(std::string_view message) {
  if (colors_) {
    fmt::print(
        err_, "{} {}\n",
        fmt::styled(
            "note:",
            fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold),
        message);
  } else {
    fmt::print(err_, "note: {}\n", message);
  }
  std::fflush(err_);
}

}  // namespace framewalk::repl
