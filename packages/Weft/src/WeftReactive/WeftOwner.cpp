#include "WeftReactive/WeftOwner.h"

#include "WeftReactive/WeftComputation.h"
#include "WeftScheduler/WeftTurn.h"
#include "shared/WeftGlobalError.h"

#include <exception>
#include <stdexcept>
#include <utility>

namespace weft {

namespace {

thread_local Owner* currentOwner = nullptr;

void runAll(std::vector<std::function<void()>>& callbacks, std::exception_ptr& firstError) {
  auto pending = std::move(callbacks);
  callbacks.clear();
  for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
    if (!*it) {
      continue;
    }
    try {
      (*it)();
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }
}

} // namespace

Owner::Owner() = default;

Owner::~Owner() {
  try {
    dispose();
  } catch (const std::exception& ex) {
    reportGlobalError(ex);
  }
}

void Owner::onCleanup(std::function<void()> cleanup) {
  if (disposed_) {
    throw std::logic_error("Cannot register a cleanup on a disposed owner");
  }
  cleanups_.push_back(std::move(cleanup));
}

void Owner::onDispose(std::function<void()> disposer) {
  if (disposed_) {
    throw std::logic_error("Cannot register a disposer on a disposed owner");
  }
  disposers_.push_back(std::move(disposer));
}

void Owner::dispose() {
  if (disposed_) {
    return;
  }
  disposed_ = true;

  runInTurn([this] {
    onDisposed();

    std::exception_ptr firstError;
    try {
      disposeChildren();
    } catch (...) {
      firstError = std::current_exception();
    }
    runAll(cleanups_, firstError);
    runAll(disposers_, firstError);

    if (firstError) {
      std::rethrow_exception(firstError);
    }
  });
}

bool Owner::isDisposed() const noexcept {
  return disposed_;
}

Owner* Owner::getParent() const noexcept {
  return parent_;
}

std::size_t Owner::getChildCount() const noexcept {
  return children_.size();
}

Owner& Owner::createChildScope() {
  return adoptChild(std::make_unique<Owner>());
}

void Owner::attachChild(std::unique_ptr<Owner> child) {
  if (disposed_) {
    throw std::logic_error("Cannot attach a child to a disposed owner");
  }
  child->parent_ = this;
  children_.push_back(std::move(child));
}

void Owner::disposeChildren() {
  if (children_.empty()) {
    return;
  }

  // A child may still be on the call stack (its run triggered ours), so its
  // storage is released only at the end of the turn.
  auto released = std::make_shared<std::vector<std::unique_ptr<Owner>>>(std::move(children_));
  children_.clear();

  std::exception_ptr firstError;
  for (auto it = released->rbegin(); it != released->rend(); ++it) {
    try {
      (*it)->dispose();
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }

  deferToEndOfTurn([released] { released->clear(); });

  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

void Owner::runCleanups() {
  std::exception_ptr firstError;
  runAll(cleanups_, firstError);
  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

Owner* getCurrentOwner() noexcept {
  return currentOwner;
}

OwnerScope::OwnerScope(Owner* owner) : previous_(currentOwner) {
  currentOwner = owner;
}

OwnerScope::~OwnerScope() {
  currentOwner = previous_;
}

void onCleanup(std::function<void()> cleanup) {
  Owner* owner = getCurrentOwner();
  if (owner == nullptr) {
    throw std::logic_error("onCleanup called outside of an owner");
  }
  owner->onCleanup(std::move(cleanup));
}

std::unique_ptr<Owner> createRoot(const std::function<void(Owner&)>& fn) {
  auto root = std::make_unique<Owner>();
  runInTurn([&] {
    OwnerScope ownerScope(root.get());
    ListenerScope listenerScope(nullptr);
    fn(*root);
  });
  return root;
}

} // namespace weft
