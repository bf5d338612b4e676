#include "WeftScheduler/WeftTurn.h"

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

namespace weft::test {

bool runWeftTurnTests() {
  std::vector<std::string> log;

  // Outside a turn deferred work runs immediately.
  assert(!isTurnActive());
  deferToEndOfTurn([&] { log.push_back("immediate"); });
  assert(log.size() == 1);
  log.clear();

  // Only the outermost turn drains, in queue order.
  runInTurn([&] {
    assert(isTurnActive());
    deferToEndOfTurn([&] { log.push_back("first"); });
    runInTurn([&] {
      deferToEndOfTurn([&] { log.push_back("nested"); });
    });
    assert(log.empty());
    assert(getPendingDeferredTaskCount() == 2);
    log.push_back("body");
  });
  assert((log == std::vector<std::string>{"body", "first", "nested"}));
  assert(!isTurnActive());
  assert(getPendingDeferredTaskCount() == 0);
  log.clear();

  // Tasks queued while draining run in the same drain.
  runInTurn([&] {
    deferToEndOfTurn([&] {
      log.push_back("outer");
      deferToEndOfTurn([&] { log.push_back("chained"); });
    });
  });
  assert((log == std::vector<std::string>{"outer", "chained"}));
  log.clear();

  // Results pass through.
  const int value = runInTurn([] { return 42; });
  assert(value == 42);

  // A failing task reaches the caller; the rest wait for the next turn.
  bool caught = false;
  try {
    runInTurn([&] {
      deferToEndOfTurn([] { throw std::runtime_error("deferred failure"); });
      deferToEndOfTurn([&] { log.push_back("survivor"); });
    });
  } catch (const std::runtime_error& error) {
    caught = std::string(error.what()) == "deferred failure";
  }
  assert(caught);
  assert(!isTurnActive());
  assert(log.empty());
  assert(getPendingDeferredTaskCount() == 1);
  runInTurn([] {});
  assert((log == std::vector<std::string>{"survivor"}));
  log.clear();

  // A body that throws leaves its tasks queued.
  caught = false;
  try {
    runInTurn([&] {
      deferToEndOfTurn([&] { log.push_back("after failure"); });
      throw std::logic_error("body failure");
    });
  } catch (const std::logic_error&) {
    caught = true;
  }
  assert(caught);
  assert(!isTurnActive());
  assert(getPendingDeferredTaskCount() == 1);
  {
    TurnScope scope;
    scope.complete();
  }
  assert((log == std::vector<std::string>{"after failure"}));

  return true;
}

} // namespace weft::test
