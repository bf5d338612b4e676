#pragma once

#include <functional>
#include <memory>
#include <vector>

namespace weft {

/**
 * Disposal scope. Child owners, cleanups and disposers registered here end
 * when the owner is disposed:
 * - cleanups run before every re-run of a computation and at disposal
 * - disposers run once, at disposal
 * Disposal order is children (newest first), then cleanups, then disposers
 * (newest first).
 */
class Owner {
public:
  Owner();
  virtual ~Owner();

  Owner(const Owner&) = delete;
  Owner& operator=(const Owner&) = delete;

  void onCleanup(std::function<void()> cleanup);
  void onDispose(std::function<void()> disposer);

  void dispose();

  [[nodiscard]] bool isDisposed() const noexcept;
  [[nodiscard]] Owner* getParent() const noexcept;
  [[nodiscard]] std::size_t getChildCount() const noexcept;

  // Plain nested scope owned by this one.
  Owner& createChildScope();

protected:
  template <typename T>
  T& adoptChild(std::unique_ptr<T> child) {
    T& ref = *child;
    attachChild(std::move(child));
    return ref;
  }

  void disposeChildren();
  void runCleanups();

  virtual void onDisposed() {}

private:
  friend class Computation;

  void attachChild(std::unique_ptr<Owner> child);

  Owner* parent_{nullptr};
  std::vector<std::unique_ptr<Owner>> children_{};
  std::vector<std::function<void()>> cleanups_{};
  std::vector<std::function<void()>> disposers_{};
  bool disposed_{false};
};

[[nodiscard]] Owner* getCurrentOwner() noexcept;

class OwnerScope {
public:
  explicit OwnerScope(Owner* owner);
  ~OwnerScope();

  OwnerScope(const OwnerScope&) = delete;
  OwnerScope& operator=(const OwnerScope&) = delete;

private:
  Owner* previous_;
};

// Registers on the current owner. Throws std::logic_error outside any owner.
void onCleanup(std::function<void()> cleanup);

// Runs `fn` inside a new detached owner and hands the owner back. Destroying
// or disposing it tears down everything created inside.
std::unique_ptr<Owner> createRoot(const std::function<void(Owner&)>& fn);

} // namespace weft
