#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace framewalk::driver {

// Interactive line input with history and command-name completion, backed
// by GNU readline. Only one LineReader may exist at a time.
class LineReader {
 public:
  using CompletionFn =
      std::function<std::vector<std::string>(std::string_view partial)>;

  explicit LineReader(CompletionFn completion, size_t max_history = 500);
  ~LineReader();

  LineReader(const LineReader&) = delete;
  auto operator=(const LineReader&) -> LineReader& = delete;
  LineReader(LineReader&&) = delete;
  auto operator=(LineReader&&) -> LineReader& = delete;

  // Returns nullopt at end of input.
  auto ReadLine(const std::string& prompt) -> std::optional<std::string>;

 private:
  CompletionFn completion_;
  size_t max_history_;
};

}  // namespace framewalk::driver
