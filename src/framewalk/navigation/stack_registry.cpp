#include "framewalk/navigation/stack_registry.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "framewalk/navigation/frame_stack.hpp"

namespace framewalk::navigation {

auto StackRegistry::FindSession(const SessionId& session) const
    -> std::shared_ptr<SessionState> {
  std::lock_guard lock(sessions_mutex_);
  auto it = sessions_.find(session);
  return it == sessions_.end() ? nullptr : it->second;
}

auto StackRegistry::ActiveStack(const SessionId& session) const
    -> FrameStack* {
  auto state = FindSession(session);
  if (state == nullptr) {
    return nullptr;
  }
  std::lock_guard lock(state->mutex);
  return state->stacks.empty() ? nullptr : state->stacks.back().get();
}

auto StackRegistry::AllStacks(const SessionId& session) const
    -> std::vector<FrameStack*> {
  std::vector<FrameStack*> result;
  auto state = FindSession(session);
  if (state == nullptr) {
    return result;
  }
  std::lock_guard lock(state->mutex);
  result.reserve(state->stacks.size());
  for (const auto& stack : state->stacks) {
    result.push_back(stack.get());
  }
  return result;
}

auto StackRegistry::StackCount(const SessionId& session) const -> size_t {
  auto state = FindSession(session);
  if (state == nullptr) {
    return 0;
  }
  std::lock_guard lock(state->mutex);
  return state->stacks.size();
}

auto StackRegistry::Push(const SessionId& session, FrameStack stack)
    -> FrameStack& {
  while (true) {
    std::shared_ptr<SessionState> state;
    {
      std::lock_guard lock(sessions_mutex_);
      auto& slot = sessions_[session];
      if (slot == nullptr || slot->retired) {
        slot = std::make_shared<SessionState>();
      }
      state = slot;
    }

    std::lock_guard lock(state->mutex);
    if (state->retired) {
      // Lost a race with Pop or EndSession; the next lookup replaces it.
      continue;
    }
    state->stacks.push_back(std::make_unique<FrameStack>(std::move(stack)));
    spdlog::debug(
        "registry: session '{}' pushed stack #{} ({} frames)", session,
        state->stacks.size(), state->stacks.back()->Size());
    return *state->stacks.back();
  }
}

auto StackRegistry::Pop(const SessionId& session)
    -> std::unique_ptr<FrameStack> {
  auto state = FindSession(session);
  if (state == nullptr) {
    return nullptr;
  }

  std::unique_ptr<FrameStack> popped;
  {
    std::lock_guard lock(state->mutex);
    auto& stacks = state->stacks;
    if (stacks.empty()) {
      return nullptr;
    }
    popped = std::move(stacks.back());
    stacks.pop_back();
    spdlog::debug(
        "registry: session '{}' popped stack, {} remaining", session,
        stacks.size());
    if (!stacks.empty()) {
      return popped;
    }
    state->retired = true;
  }

  std::lock_guard sessions_lock(sessions_mutex_);
  auto it = sessions_.find(session);
  if (it != sessions_.end() && it->second == state) {
    sessions_.erase(it);
  }
  return popped;
}

void StackRegistry::EndSession(const SessionId& session) {
  std::shared_ptr<SessionState> state;
  {
    std::lock_guard lock(sessions_mutex_);
    auto it = sessions_.find(session);
    if (it == sessions_.end()) {
      return;
    }
    state = std::move(it->second);
    sessions_.erase(it);
  }

  // Destroy the stacks only after any in-flight WithActiveStack call is done.
  std::lock_guard lock(state->mutex);
  state->retired = true;
  spdlog::debug(
      "registry: session '{}' ended, dropping {} stack(s)", session,
      state->stacks.size());
  state->stacks.clear();
}

auto StackRegistry::HasPriorContext(const SessionId& session) const -> bool {
  auto state = FindSession(session);
  if (state == nullptr) {
    return false;
  }
  std::lock_guard lock(state->mutex);
  if (state->stacks.empty()) {
    return false;
  }
  return state->stacks.back()->HasPriorContext(state->stacks.size());
}

}  // namespace framewalk::navigation
