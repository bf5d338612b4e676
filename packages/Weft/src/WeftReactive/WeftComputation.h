#pragma once

#include "WeftReactive/WeftOwner.h"

#include <cstddef>
#include <functional>
#include <vector>

namespace weft {

class SourceBase;

// A tracked function. Every source read during a run subscribes the
// computation; a notification from any of them re-runs it synchronously.
class Computation final : public Owner {
public:
  explicit Computation(std::function<void()> fn);
  ~Computation() override;

  // Creates a computation owned by the current owner and runs it once.
  static Computation& create(std::function<void()> fn);

  void run();

  [[nodiscard]] std::size_t getRunCount() const noexcept;
  [[nodiscard]] std::size_t getSourceCount() const noexcept;

private:
  friend class SourceBase;

  void onDisposed() override;
  void addSource(SourceBase* source);
  void clearSources();

  std::function<void()> fn_;
  std::vector<SourceBase*> sources_{};
  bool running_{false};
  bool rerunRequested_{false};
  std::size_t runCount_{0};
};

[[nodiscard]] Computation* getCurrentListener() noexcept;

class ListenerScope {
public:
  explicit ListenerScope(Computation* listener);
  ~ListenerScope();

  ListenerScope(const ListenerScope&) = delete;
  ListenerScope& operator=(const ListenerScope&) = delete;

private:
  Computation* previous_;
};

template <typename Fn>
auto untrack(Fn&& fn) -> decltype(fn()) {
  ListenerScope scope(nullptr);
  return fn();
}

class SourceBase {
public:
  SourceBase();
  virtual ~SourceBase();

  SourceBase(const SourceBase&) = delete;
  SourceBase& operator=(const SourceBase&) = delete;

  [[nodiscard]] std::size_t getObserverCount() const noexcept;

protected:
  void track();
  void notifyObservers();

private:
  friend class Computation;

  void removeObserver(Computation* observer);

  std::vector<Computation*> observers_{};
};

} // namespace weft
