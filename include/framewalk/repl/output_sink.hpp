#pragma once

#include <cstdio>
#include <string>
#include <string_view>

namespace framewalk::repl {

// Destination for composed command output. Paging is the host's concern.
class OutputSink {
 public:
  OutputSink() = default;
  virtual ~OutputSink() = default;

  OutputSink(const OutputSink&) = delete;
  auto operator=(const OutputSink&) -> OutputSink& = delete;
  OutputSink(OutputSink&&) = delete;
  auto operator=(OutputSink&&) -> OutputSink& = delete;

  virtual void Write(std::string_view text) = 0;
  virtual void WriteError(std::string_view message) = 0;
  // Follow-up line attached to the preceding error.
  virtual void WriteNote(std::string_view message) = 0;
};

// Writes results to `out`, "error: ..." and "note: ..." lines to `err`.
class StreamSink : public OutputSink {
 public:
  explicit StreamSink(
      FILE* out = stdout, FILE* err = stderr, bool colors = false)
      : out_(out), err_(err), colors_(colors) {
  }

  void Write(std::string_view text) override;
  void WriteError(std::string_view message) override;
  void WriteNote(std::string_view message) override;

 private:
  FILE* out_;
  FILE* err_;
  bool colors_;
};

// Collects output in memory.
class BufferSink : public OutputSink {
 public:
  void Write(std::string_view text) override {
    output_ += text;
  }

  void WriteError(std::string_view message) override {
    errors_ += message;
    errors_ += '\n';
  }

  void WriteNote(std::string_view message) override {
    errors_ += "note: ";
    errors_ += message;
    errors_ += '\n';
  }

  [[nodiscard]] auto Output() const -> const std::string& {
    return output_;
  }

  [[nodiscard]] auto Errors() const -> const std::string& {
    return errors_;
  }

  void Clear() {
    output_.clear();
    errors_.clear();
  }

 private:
  std::string output_;
  std::string errors_;
};

}  // namespace framewalk::repl
