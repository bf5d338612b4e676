#include "WeftScheduler/WeftTurn.h"

#include <iterator>
#include <utility>
#include <vector>

namespace weft {

namespace {

thread_local std::size_t turnDepth = 0;

std::vector<DeferredTask>& deferredQueue() {
  thread_local std::vector<DeferredTask> queue;
  return queue;
}

void drainDeferredTasks() {
  auto& queue = deferredQueue();
  while (!queue.empty()) {
    std::vector<DeferredTask> batch;
    batch.swap(queue);

    for (std::size_t index = 0; index < batch.size(); ++index) {
      try {
        batch[index]();
      } catch (...) {
        std::vector<DeferredTask> remaining(
            std::make_move_iterator(batch.begin() + static_cast<std::ptrdiff_t>(index + 1)),
            std::make_move_iterator(batch.end()));
        remaining.insert(
            remaining.end(),
            std::make_move_iterator(queue.begin()),
            std::make_move_iterator(queue.end()));
        queue.swap(remaining);
        throw;
      }
    }
  }
}

} // namespace

TurnScope::TurnScope() {
  ++turnDepth;
}

TurnScope::~TurnScope() {
  if (!completed_) {
    --turnDepth;
  }
}

void TurnScope::complete() {
  if (completed_) {
    return;
  }
  if (turnDepth == 1) {
    try {
      drainDeferredTasks();
    } catch (...) {
      completed_ = true;
      --turnDepth;
      throw;
    }
  }
  completed_ = true;
  --turnDepth;
}

void deferToEndOfTurn(DeferredTask task) {
  if (!task) {
    return;
  }
  if (turnDepth == 0) {
    task();
    return;
  }
  deferredQueue().push_back(std::move(task));
}

bool isTurnActive() noexcept {
  return turnDepth > 0;
}

std::size_t getPendingDeferredTaskCount() noexcept {
  return deferredQueue().size();
}

} // namespace weft
