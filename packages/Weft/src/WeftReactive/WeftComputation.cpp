#include "WeftReactive/WeftComputation.h"

#include "WeftScheduler/WeftTurn.h"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>

namespace weft {

namespace {

thread_local Computation* currentListener = nullptr;

class RunningFlag {
public:
  explicit RunningFlag(bool& flag) : flag_(flag) {
    flag_ = true;
  }

  ~RunningFlag() {
    flag_ = false;
  }

private:
  bool& flag_;
};

} // namespace

Computation::Computation(std::function<void()> fn) : fn_(std::move(fn)) {
  if (!fn_) {
    throw std::invalid_argument("Computation requires a function");
  }
}

Computation::~Computation() {
  clearSources();
}

Computation& Computation::create(std::function<void()> fn) {
  Owner* owner = getCurrentOwner();
  if (owner == nullptr) {
    throw std::logic_error("Computations must be created under an owner");
  }
  auto computation = std::make_unique<Computation>(std::move(fn));
  Computation& ref = *computation;
  owner->attachChild(std::move(computation));
  ref.run();
  return ref;
}

void Computation::run() {
  if (isDisposed()) {
    return;
  }
  if (running_) {
    rerunRequested_ = true;
    return;
  }

  runInTurn([this] {
    do {
      rerunRequested_ = false;
      disposeChildren();
      runCleanups();
      clearSources();

      RunningFlag running(running_);
      OwnerScope ownerScope(this);
      ListenerScope listenerScope(this);
      ++runCount_;
      fn_();
    } while (rerunRequested_ && !isDisposed());
  });
}

std::size_t Computation::getRunCount() const noexcept {
  return runCount_;
}

std::size_t Computation::getSourceCount() const noexcept {
  return sources_.size();
}

void Computation::onDisposed() {
  clearSources();
}

void Computation::addSource(SourceBase* source) {
  sources_.push_back(source);
}

void Computation::clearSources() {
  auto sources = std::move(sources_);
  sources_.clear();
  for (SourceBase* source : sources) {
    source->removeObserver(this);
  }
}

Computation* getCurrentListener() noexcept {
  return currentListener;
}

ListenerScope::ListenerScope(Computation* listener) : previous_(currentListener) {
  currentListener = listener;
}

ListenerScope::~ListenerScope() {
  currentListener = previous_;
}

SourceBase::SourceBase() = default;

SourceBase::~SourceBase() {
  for (Computation* observer : observers_) {
    auto& sources = observer->sources_;
    sources.erase(std::remove(sources.begin(), sources.end(), this), sources.end());
  }
}

std::size_t SourceBase::getObserverCount() const noexcept {
  return observers_.size();
}

void SourceBase::track() {
  Computation* listener = currentListener;
  if (listener == nullptr) {
    return;
  }
  if (std::find(observers_.begin(), observers_.end(), listener) != observers_.end()) {
    return;
  }
  observers_.push_back(listener);
  listener->addSource(this);
}

void SourceBase::notifyObservers() {
  runInTurn([this] {
    const auto snapshot = observers_;
    for (Computation* observer : snapshot) {
      // An earlier observer may have disposed this one.
      if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
        continue;
      }
      observer->run();
    }
  });
}

void SourceBase::removeObserver(Computation* observer) {
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

} // namespace weft
