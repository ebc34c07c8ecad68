#include "framewalk/frame/frame_renderer.hpp"

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <vector>

#include "framewalk/frame/execution_context.hpp"
#include "framewalk/frame/frame.hpp"

namespace framewalk::frame {

namespace {

constexpr std::string_view kEllipsis = "...";

auto FormatParam(const RoutineParam& param, size_t position) -> std::string {
  std::string name;
  if (param.name) {
    name = *param.name;
  } else if (param.kind == ParamKind::kBlock) {
    name = "block";
  } else {
    name = std::format("arg{}", position);
  }

  switch (param.kind) {
    case ParamKind::kRequired:
      return name;
    case ParamKind::kOptional:
      return name + "=?";
    case ParamKind::kRest:
      return "*" + name;
    case ParamKind::kBlock:
      return "&" + name;
    case ParamKind::kOther:
      return "?";
  }
  return "?";
}

auto FormatTypeColumn(const Frame& frame, size_t width) -> std::string {
  if (!frame.Type()) {
    return "";
  }
  std::string column = std::format("[{}]", *frame.Type());
  if (column.size() < width) {
    column.append(width - column.size(), ' ');
  }
  return column;
}

}  // namespace

auto DescribeConstruct(const DefiningConstruct& construct) -> std::string {
  switch (construct.kind) {
    case ConstructKind::kRoutine:
      return construct.name;
    case ConstructKind::kModuleBody:
      return std::format("<module:{}>", construct.name);
    case ConstructKind::kClassBody:
      return std::format("<class:{}>", construct.name);
    case ConstructKind::kTopLevel:
      return "<main>";
  }
  return "<main>";
}

auto FormatSignature(const RoutineSignature& signature) -> std::string {
  if (!signature.defined) {
    return std::format(
        "{}(UNKNOWN) (undefined method)", signature.qualified_name);
  }

  std::string args;
  for (size_t i = 0; i < signature.params.size(); ++i) {
    if (i > 0) {
      args += ", ";
    }
    args += FormatParam(signature.params[i], i + 1);
  }
  return std::format("{}({})", signature.qualified_name, args);
}

auto ClipText(std::string_view text, size_t max_width) -> std::string {
  if (text.size() <= max_width) {
    return std::string(text);
  }
  if (max_width <= kEllipsis.size()) {
    return std::string(text.substr(0, max_width));
  }
  std::string clipped(text.substr(0, max_width - kEllipsis.size()));
  clipped += kEllipsis;
  return clipped;
}

auto RenderFrame(const Frame& frame, bool verbose, const RenderOptions& options)
    -> std::string {
  const ExecutionContext& context = frame.Context();

  std::string type = FormatTypeColumn(frame, options.type_width);
  std::string desc =
      frame.Label() ? *frame.Label() : DescribeConstruct(context.Construct());

  std::string sig;
  if (auto signature = context.Signature()) {
    sig = std::format("<{}>", FormatSignature(*signature));
  }

  std::string summary = std::format("{} {} {}", type, desc, sig);
  if (!verbose) {
    return summary;
  }

  SourceLocation location = context.Location();
  return std::format(
      "{}\n      in {} @ {}:{}", summary,
      ClipText(context.DescribeSelf(), options.self_clip_width), location.file,
      location.line);
}

}  // namespace framewalk::frame
