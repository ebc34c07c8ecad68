#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace framewalk::frame {

// What kind of construct a context is lexically inside of.
enum class ConstructKind : uint8_t {
  kRoutine,     // Function or method body
  kModuleBody,  // Self is a module-like type
  kClassBody,   // Self is a class-like type
  kTopLevel,    // Anything else
};

struct DefiningConstruct {
  ConstructKind kind = ConstructKind::kTopLevel;
  // Routine name for kRoutine, type name for module/class bodies, unused
  // otherwise.
  std::string name;
};

struct SourceLocation {
  std::string file;
  uint32_t line = 0;
};

enum class ParamKind : uint8_t {
  kRequired,
  kOptional,
  kRest,
  kBlock,
  kOther,
};

struct RoutineParam {
  ParamKind kind = ParamKind::kRequired;
  std::optional<std::string> name;
};

// Signature of the routine a context executes in.
struct RoutineSignature {
  // Owner-qualified name, e.g. "Calc#compute".
  std::string qualified_name;
  // False when the host can no longer resolve the routine definition.
  bool defined = true;
  std::vector<RoutineParam> params;
};

/// Read-only capability view of one host execution context.
///
/// Contexts are owned by whatever captured them. framewalk only holds
/// non-owning pointers and never copies, mutates or releases a context.
/// Implementations may be expensive to query; FrameStack memoizes the
/// rendered result so each query runs at most once per stack.
class ExecutionContext {
 public:
  ExecutionContext() = default;
  virtual ~ExecutionContext() = default;

  ExecutionContext(const ExecutionContext&) = delete;
  auto operator=(const ExecutionContext&) -> ExecutionContext& = delete;
  ExecutionContext(ExecutionContext&&) = delete;
  auto operator=(ExecutionContext&&) -> ExecutionContext& = delete;

  /// The construct the context is defined in.
  [[nodiscard]] virtual auto Construct() const -> DefiningConstruct = 0;

  /// Stringified description of "self" in this context.
  [[nodiscard]] virtual auto DescribeSelf() const -> std::string = 0;

  [[nodiscard]] virtual auto Location() const -> SourceLocation = 0;

  /// Routine signature, or nullopt when the context is not inside a routine.
  [[nodiscard]] virtual auto Signature() const
      -> std::optional<RoutineSignature> = 0;
};

}  // namespace framewalk::frame
