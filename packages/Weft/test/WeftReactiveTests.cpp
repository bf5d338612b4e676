#include "WeftReactive/WeftComputation.h"
#include "WeftReactive/WeftOwner.h"
#include "WeftReactive/WeftSignal.h"
#include "shared/WeftGlobalError.h"

#include <cassert>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace weft::test {

namespace {

void testComputationTracksSignals() {
  Signal<int> count(1);
  int seen = 0;
  Computation* computation = nullptr;
  auto root = createRoot([&](Owner&) {
    computation = &Computation::create([&] { seen = count.get() * 10; });
  });

  assert(seen == 10);
  assert(computation->getRunCount() == 1);
  assert(computation->getSourceCount() == 1);
  assert(count.getObserverCount() == 1);

  count.set(2);
  assert(seen == 20);
  assert(computation->getRunCount() == 2);

  // Equal values do not notify.
  count.set(2);
  assert(computation->getRunCount() == 2);

  count.update([](int value) { return value + 1; });
  assert(seen == 30);
  assert(count.peek() == 3);

  root->dispose();
  assert(count.getObserverCount() == 0);
  count.set(4);
  assert(seen == 30);
}

void testDynamicDependencies() {
  Signal<bool> useLeft(true);
  Signal<std::string> left("left");
  Signal<std::string> right("right");
  std::string seen;
  int runs = 0;
  auto root = createRoot([&](Owner&) {
    Computation::create([&] {
      ++runs;
      seen = useLeft.get() ? left.get() : right.get();
    });
  });

  assert(seen == "left");
  right.set("RIGHT");
  assert(runs == 1);

  useLeft.set(false);
  assert(seen == "RIGHT");
  assert(runs == 2);
  assert(left.getObserverCount() == 0);

  left.set("LEFT");
  assert(runs == 2);

  // Reading the same source twice subscribes once.
  Signal<int> twice(0);
  int total = 0;
  auto second = createRoot([&](Owner&) {
    Computation::create([&] { total = twice.get() + twice.get(); });
  });
  assert(twice.getObserverCount() == 1);
  twice.set(2);
  assert(total == 4);
}

void testUntrackAndPeek() {
  Signal<int> tracked(0);
  Signal<int> ignored(0);
  int runs = 0;
  auto root = createRoot([&](Owner&) {
    Computation::create([&] {
      ++runs;
      tracked.get();
      untrack([&] { return ignored.get(); });
    });
  });

  ignored.set(5);
  assert(runs == 1);
  tracked.set(1);
  assert(runs == 2);
  assert(ignored.getObserverCount() == 0);
}

void testCleanupsAndNestedComputations() {
  Signal<std::string> name("a");
  std::vector<std::string> log;
  auto root = createRoot([&](Owner&) {
    Computation::create([&] {
      const std::string current = name.get();
      onCleanup([&log, current] { log.push_back("cleanup " + current); });
      log.push_back("run " + current);
    });
  });

  name.set("b");
  assert((log == std::vector<std::string>{"run a", "cleanup a", "run b"}));
  root.reset();
  assert(log.back() == "cleanup b");

  Signal<int> outer(0);
  Signal<int> inner(0);
  int innerRuns = 0;
  auto nested = createRoot([&](Owner&) {
    Computation::create([&] {
      outer.get();
      Computation::create([&] {
        inner.get();
        ++innerRuns;
      });
    });
  });

  assert(innerRuns == 1);
  inner.set(1);
  assert(innerRuns == 2);

  // The re-run disposes the previous child before creating a new one.
  outer.set(1);
  assert(innerRuns == 3);
  assert(inner.getObserverCount() == 1);
  inner.set(2);
  assert(innerRuns == 4);
}

void testSelfTriggeringComputation() {
  Signal<int> count(0);
  Computation* computation = nullptr;
  auto root = createRoot([&](Owner&) {
    computation = &Computation::create([&] {
      const int current = count.get();
      if (current < 3) {
        count.set(current + 1);
      }
    });
  });

  assert(count.peek() == 3);
  assert(computation->getRunCount() == 4);
}

void testDisposalOrder() {
  std::vector<std::string> log;
  auto root = createRoot([&](Owner& owner) {
    owner.onDispose([&] { log.push_back("disposer 1"); });
    owner.onDispose([&] { log.push_back("disposer 2"); });
    onCleanup([&] { log.push_back("cleanup"); });
    Owner& child = owner.createChildScope();
    child.onDispose([&] { log.push_back("child"); });
  });

  assert(root->getChildCount() == 1);
  root->dispose();
  assert((log == std::vector<std::string>{"child", "cleanup", "disposer 2", "disposer 1"}));
  assert(root->isDisposed());

  root->dispose();
  assert(log.size() == 4);

  bool threw = false;
  try {
    root->onDispose([] {});
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void testErrors() {
  bool threw = false;
  try {
    onCleanup([] {});
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    Computation::create([] {});
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);

  // Explicit disposal propagates the first failure after running everything.
  int ran = 0;
  auto failing = createRoot([&](Owner& owner) {
    owner.onDispose([&] { ++ran; });
    owner.onDispose([] { throw std::runtime_error("disposer failed"); });
  });
  threw = false;
  try {
    failing->dispose();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(ran == 1);

  // Destructors report instead of throwing.
  std::vector<std::string> reports;
  auto previousHandler = setGlobalErrorHandler([&](const std::string& message) { reports.push_back(message); });
  {
    Owner owner;
    owner.onDispose([] { throw std::runtime_error("late failure"); });
  }
  setGlobalErrorHandler(previousHandler);
  assert((reports == std::vector<std::string>{"late failure"}));
}

} // namespace

bool runWeftReactiveTests() {
  testComputationTracksSignals();
  testDynamicDependencies();
  testUntrackAndPeek();
  testCleanupsAndNestedComputations();
  testSelfTriggeringComputation();
  testDisposalOrder();
  testErrors();
  return true;
}

} // namespace weft::test
