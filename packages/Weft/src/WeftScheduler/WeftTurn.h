#pragma once

#include <cstddef>
#include <functional>
#include <type_traits>

namespace weft {

using DeferredTask = std::function<void()>;

/**
 * Marks one synchronous pass of engine work. Turns nest; only the outermost
 * one drains the deferred queue when it completes. A scope left by an
 * exception does not drain, and its tasks run at the end of the next turn.
 */
class TurnScope {
public:
  TurnScope();
  ~TurnScope();

  TurnScope(const TurnScope&) = delete;
  TurnScope& operator=(const TurnScope&) = delete;

  // Ends the turn. Deferred tasks may throw; the exception reaches the caller.
  void complete();

private:
  bool completed_{false};
};

// Queues `task` for the end of the current turn, or runs it now when no turn
// is active.
void deferToEndOfTurn(DeferredTask task);

[[nodiscard]] bool isTurnActive() noexcept;
[[nodiscard]] std::size_t getPendingDeferredTaskCount() noexcept;

template <typename Fn>
auto runInTurn(Fn&& fn) -> decltype(fn()) {
  TurnScope scope;
  if constexpr (std::is_void_v<decltype(fn())>) {
    fn();
    scope.complete();
  } else {
    auto result = fn();
    scope.complete();
    return result;
  }
}

} // namespace weft
