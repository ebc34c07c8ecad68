#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "framewalk/navigation/frame_stack.hpp"

namespace framewalk::navigation {

// Identity under which navigation state is scoped.
using SessionId = std::string;

/// Per-session nesting history of frame stacks (stack of stacks).
///
/// The active stack of a session is the most recently pushed one. Entering a
/// nested inspection pushes; leaving it pops. The registry owns its stacks;
/// pointers handed out stay valid until the stack is popped or the session
/// ends.
///
/// Sessions are independent and share no FrameStack state. Each session has
/// its own mutex so a lookup followed by a mutation can run as one step
/// through WithActiveStack(). The session map lock is never held while a
/// session mutex is taken, so fn may query other sessions.
class StackRegistry {
 public:
  StackRegistry() = default;
  ~StackRegistry() = default;

  StackRegistry(const StackRegistry&) = delete;
  auto operator=(const StackRegistry&) -> StackRegistry& = delete;
  StackRegistry(StackRegistry&&) = delete;
  auto operator=(StackRegistry&&) -> StackRegistry& = delete;

  /// Last pushed stack for the session, or nullptr.
  [[nodiscard]] auto ActiveStack(const SessionId& session) const
      -> FrameStack*;

  /// Full nesting history, oldest first.
  [[nodiscard]] auto AllStacks(const SessionId& session) const
      -> std::vector<FrameStack*>;

  [[nodiscard]] auto StackCount(const SessionId& session) const -> size_t;

  /// Append a stack; it becomes the active one. Returns the stored stack.
  auto Push(const SessionId& session, FrameStack stack) -> FrameStack&;

  /// Remove and return the active stack, or nullptr when none remain.
  auto Pop(const SessionId& session) -> std::unique_ptr<FrameStack>;

  /// Drop every stack of the session.
  void EndSession(const SessionId& session);

  /// True when the active stack has a prior binding or another stack sits
  /// below it. False when the session has no stack.
  [[nodiscard]] auto HasPriorContext(const SessionId& session) const -> bool;

  /// Run fn with the active stack (nullptr when absent) while holding the
  /// session's mutex. fn must not push or pop the same session.
  template <typename Fn>
  auto WithActiveStack(const SessionId& session, Fn&& fn)
      -> std::invoke_result_t<Fn, FrameStack*> {
    std::shared_ptr<SessionState> state = FindSession(session);
    if (state == nullptr) {
      FrameStack* none = nullptr;
      return std::invoke(std::forward<Fn>(fn), none);
    }
    std::lock_guard lock(state->mutex);
    FrameStack* active =
        state->stacks.empty() ? nullptr : state->stacks.back().get();
    return std::invoke(std::forward<Fn>(fn), active);
  }

 private:
  struct SessionState {
    std::mutex mutex;
    std::vector<std::unique_ptr<FrameStack>> stacks;
    // Set under `mutex` once the state is being removed from the map. Push
    // never stores into a retired state.
    std::atomic<bool> retired = false;
  };

  // Shared so a caller inside WithActiveStack keeps the state alive while
  // another thread ends the session.
  [[nodiscard]] auto FindSession(const SessionId& session) const
      -> std::shared_ptr<SessionState>;

  mutable std::mutex sessions_mutex_;
  std::unordered_map<SessionId, std::shared_ptr<SessionState>> sessions_;
};

}  // namespace framewalk::navigation
