#include "framewalk/snapshot/snapshot_loader.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "framewalk/common/diagnostic.hpp"
#include "framewalk/frame/execution_context.hpp"
#include "framewalk/frame/frame.hpp"
#include "framewalk/navigation/frame_stack.hpp"
#include "framewalk/navigation/stack_registry.hpp"
#include "framewalk/snapshot/snapshot_context.hpp"

namespace framewalk::snapshot {

namespace {

namespace fs = std::filesystem;

// Typed field access on one TOML table with located error messages.
class FieldReader {
 public:
  FieldReader(const toml::table& table, std::string where)
      : table_(table), where_(std::move(where)) {
  }

  [[nodiscard]] auto Error(std::string_view message) const -> Diagnostic {
    return Diagnostic::HostError(std::format("{}: {}", where_, message));
  }

  [[nodiscard]] auto OptString(std::string_view key) const
      -> Result<std::optional<std::string>> {
    const toml::node* node = table_.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    if (const auto* str = node->as_string()) {
      return str->get();
    }
    return std::unexpected(Error(std::format("'{}' must be a string", key)));
  }

  [[nodiscard]] auto String(std::string_view key) const
      -> Result<std::string> {
    auto value = OptString(key);
    if (!value) {
      return std::unexpected(std::move(value).error());
    }
    if (!*value) {
      return std::unexpected(
          Error(std::format("missing required field '{}'", key)));
    }
    return std::move(**value);
  }

  [[nodiscard]] auto OptInt(std::string_view key) const
      -> Result<std::optional<int64_t>> {
    const toml::node* node = table_.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    if (const auto* integer = node->as_integer()) {
      return integer->get();
    }
    return std::unexpected(Error(std::format("'{}' must be an integer", key)));
  }

  [[nodiscard]] auto OptBool(std::string_view key) const
      -> Result<std::optional<bool>> {
    const toml::node* node = table_.get(key);
    if (node == nullptr) {
      return std::nullopt;
    }
    if (const auto* boolean = node->as_boolean()) {
      return boolean->get();
    }
    return std::unexpected(Error(std::format("'{}' must be a boolean", key)));
  }

 private:
  const toml::table& table_;
  std::string where_;
};

auto ParseConstructKind(std::string_view text)
    -> std::optional<frame::ConstructKind> {
  if (text == "routine") {
    return frame::ConstructKind::kRoutine;
  }
  if (text == "module") {
    return frame::ConstructKind::kModuleBody;
  }
  if (text == "class") {
    return frame::ConstructKind::kClassBody;
  }
  if (text == "top-level") {
    return frame::ConstructKind::kTopLevel;
  }
  return std::nullopt;
}

auto ParseParamKind(std::string_view text) -> frame::ParamKind {
  if (text == "req") {
    return frame::ParamKind::kRequired;
  }
  if (text == "opt") {
    return frame::ParamKind::kOptional;
  }
  if (text == "rest") {
    return frame::ParamKind::kRest;
  }
  if (text == "block") {
    return frame::ParamKind::kBlock;
  }
  // Keyword and other host-specific kinds render as "?"
  return frame::ParamKind::kOther;
}

auto ParseParams(const toml::array& params, const FieldReader& reader)
    -> Result<std::vector<frame::RoutineParam>> {
  std::vector<frame::RoutineParam> result;
  for (size_t i = 0; i < params.size(); ++i) {
    const auto* entry = params[i].as_array();
    if (entry == nullptr || entry->empty() || entry->size() > 2) {
      return std::unexpected(
          reader.Error(
              std::format("params[{}] must be [kind] or [kind, name]", i)));
    }

    const auto* kind = (*entry)[0].as_string();
    if (kind == nullptr) {
      return std::unexpected(
          reader.Error(std::format("params[{}] kind must be a string", i)));
    }

    frame::RoutineParam param{.kind = ParseParamKind(kind->get())};
    if (entry->size() == 2) {
      const auto* name = (*entry)[1].as_string();
      if (name == nullptr) {
        return std::unexpected(
            reader.Error(std::format("params[{}] name must be a string", i)));
      }
      param.name = name->get();
    }
    result.push_back(std::move(param));
  }
  return result;
}

auto ParseSignature(
    const toml::table& table, const FieldReader& reader,
    const std::string& routine_name) -> Result<frame::RoutineSignature> {
  frame::RoutineSignature signature;

  auto owner = reader.OptString("owner");
  if (!owner) {
    return std::unexpected(std::move(owner).error());
  }
  signature.qualified_name = owner->value_or(routine_name);

  auto defined = reader.OptBool("defined");
  if (!defined) {
    return std::unexpected(std::move(defined).error());
  }
  signature.defined = defined->value_or(true);

  if (const toml::node* params = table.get("params")) {
    const auto* arr = params->as_array();
    if (arr == nullptr) {
      return std::unexpected(reader.Error("'params' must be an array"));
    }
    auto parsed = ParseParams(*arr, reader);
    if (!parsed) {
      return std::unexpected(std::move(parsed).error());
    }
    signature.params = std::move(*parsed);
  }
  return signature;
}

auto ParseLocation(const FieldReader& reader) -> Result<frame::SourceLocation> {
  auto file = reader.String("file");
  if (!file) {
    return std::unexpected(std::move(file).error());
  }
  auto line = reader.OptInt("line");
  if (!line) {
    return std::unexpected(std::move(line).error());
  }
  if (!*line) {
    return std::unexpected(reader.Error("missing required field 'line'"));
  }
  if (**line < 0) {
    return std::unexpected(reader.Error("'line' must not be negative"));
  }
  if (**line > std::numeric_limits<uint32_t>::max()) {
    return std::unexpected(
        reader.Error(
            std::format(
                "'line' must be at most {}",
                std::numeric_limits<uint32_t>::max())));
  }
  return frame::SourceLocation{
      .file = std::move(*file), .line = static_cast<uint32_t>(**line)};
}

// Parse one [[stack.frame]] table into a context (owned by `snapshot`) and a
// frame pointing at it.
auto ParseFrame(const toml::table& table, std::string where, Snapshot& snapshot)
    -> Result<frame::Frame> {
  FieldReader reader(table, std::move(where));

  auto construct_text = reader.String("construct");
  if (!construct_text) {
    return std::unexpected(std::move(construct_text).error());
  }
  auto kind = ParseConstructKind(*construct_text);
  if (!kind) {
    return std::unexpected(
        reader.Error(
            std::format(
                "unknown construct '{}' (expected routine, module, class or "
                "top-level)",
                *construct_text)));
  }

  frame::DefiningConstruct construct{.kind = *kind, .name = {}};
  if (*kind != frame::ConstructKind::kTopLevel) {
    auto name = reader.String("name");
    if (!name) {
      return std::unexpected(std::move(name).error());
    }
    construct.name = std::move(*name);
  }

  auto self = reader.OptString("self");
  if (!self) {
    return std::unexpected(std::move(self).error());
  }

  auto location = ParseLocation(reader);
  if (!location) {
    return std::unexpected(std::move(location).error());
  }

  std::optional<frame::RoutineSignature> signature;
  if (*kind == frame::ConstructKind::kRoutine) {
    auto parsed = ParseSignature(table, reader, construct.name);
    if (!parsed) {
      return std::unexpected(std::move(parsed).error());
    }
    signature = std::move(*parsed);
  }

  auto type = reader.OptString("type");
  if (!type) {
    return std::unexpected(std::move(type).error());
  }
  auto label = reader.OptString("label");
  if (!label) {
    return std::unexpected(std::move(label).error());
  }

  snapshot.contexts.push_back(
      std::make_unique<SnapshotContext>(
          std::move(construct), self->value_or("main"), std::move(*location),
          std::move(signature)));
  return frame::Frame(
      snapshot.contexts.back().get(), std::move(*type), std::move(*label));
}

// The context a stack was entered from. Recorded as a top-level context.
auto ParsePrior(const toml::table& table, std::string where, Snapshot& snapshot)
    -> Result<const SnapshotContext*> {
  FieldReader reader(table, std::move(where));

  auto self = reader.OptString("self");
  if (!self) {
    return std::unexpected(std::move(self).error());
  }
  auto location = ParseLocation(reader);
  if (!location) {
    return std::unexpected(std::move(location).error());
  }

  snapshot.contexts.push_back(
      std::make_unique<SnapshotContext>(
          frame::DefiningConstruct{}, self->value_or("main"),
          std::move(*location), std::nullopt));
  return snapshot.contexts.back().get();
}

auto ParseStack(
    const toml::table& table, std::string where, Snapshot& snapshot,
    const frame::RenderOptions& options) -> Result<navigation::FrameStack> {
  FieldReader reader(table, where);

  const auto* frames_node = table.get("frame");
  const auto* frames =
      frames_node != nullptr ? frames_node->as_array() : nullptr;
  if (frames == nullptr || frames->empty()) {
    return std::unexpected(
        reader.Error("stack has no [[stack.frame]] entries"));
  }

  std::vector<frame::Frame> parsed_frames;
  parsed_frames.reserve(frames->size());
  for (size_t i = 0; i < frames->size(); ++i) {
    const auto* frame_table = (*frames)[i].as_table();
    if (frame_table == nullptr) {
      return std::unexpected(
          reader.Error(std::format("frame {} must be a table", i)));
    }
    auto parsed = ParseFrame(
        *frame_table, std::format("{} frame {}", where, i), snapshot);
    if (!parsed) {
      return std::unexpected(std::move(parsed).error());
    }
    parsed_frames.push_back(std::move(*parsed));
  }

  auto cursor = reader.OptInt("cursor");
  if (!cursor) {
    return std::unexpected(std::move(cursor).error());
  }
  int64_t initial = cursor->value_or(0);
  if (initial < 0) {
    return std::unexpected(reader.Error("'cursor' must not be negative"));
  }

  const SnapshotContext* prior = nullptr;
  if (const toml::node* prior_node = table.get("prior")) {
    const auto* prior_table = prior_node->as_table();
    if (prior_table == nullptr) {
      return std::unexpected(reader.Error("'prior' must be a table"));
    }
    auto parsed = ParsePrior(*prior_table, where + " prior", snapshot);
    if (!parsed) {
      return std::unexpected(std::move(parsed).error());
    }
    prior = *parsed;
  }

  auto stack = navigation::FrameStack::Create(
      std::move(parsed_frames), static_cast<size_t>(initial), prior, options);
  if (!stack) {
    return std::unexpected(std::move(stack).error().WithNote(where));
  }
  return std::move(*stack);
}

}  // namespace

auto ParseSnapshot(
    std::string_view text, std::string_view source_name,
    const frame::RenderOptions& options) -> Result<Snapshot> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format(
                "failed to parse {}:{}: {}", source_name,
                e.source().begin.line, e.description())));
  }

  const auto* stacks = tbl["stack"].as_array();
  if (stacks == nullptr || stacks->empty()) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("{}: missing [[stack]] entries", source_name)));
  }

  Snapshot snapshot;
  for (size_t i = 0; i < stacks->size(); ++i) {
    std::string where = std::format("{}: stack {}", source_name, i);
    const auto* stack_table = (*stacks)[i].as_table();
    if (stack_table == nullptr) {
      return std::unexpected(
          Diagnostic::HostError(std::format("{}: must be a table", where)));
    }
    auto stack = ParseStack(*stack_table, where, snapshot, options);
    if (!stack) {
      return std::unexpected(std::move(stack).error());
    }
    snapshot.stacks.push_back(std::move(*stack));
  }

  spdlog::info(
      "loaded snapshot {}: {} stack(s), {} context(s)", source_name,
      snapshot.stacks.size(), snapshot.contexts.size());
  return snapshot;
}

auto LoadSnapshot(
    const fs::path& path, const frame::RenderOptions& options)
    -> Result<Snapshot> {
  std::ifstream in(path);
  if (!in) {
    return std::unexpected(
        Diagnostic::HostError(
            std::format("cannot open snapshot '{}'", path.string())));
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return ParseSnapshot(contents.str(), path.string(), options);
}

void RegisterSnapshot(
    Snapshot& snapshot, navigation::StackRegistry& registry,
    const navigation::SessionId& session) {
  for (auto& stack : snapshot.stacks) {
    registry.Push(session, std::move(stack));
  }
  snapshot.stacks.clear();
}

}  // namespace framewalk::snapshot
