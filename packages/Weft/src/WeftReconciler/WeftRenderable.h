#pragma once

#include "WeftHost/WeftNodeHandle.h"

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace weft {

class Renderable;

using RenderableList = std::vector<Renderable>;
using Producer = std::function<Renderable()>;

enum class RenderableKind {
  Empty,
  Bool,
  Number,
  String,
  Node,
  List,
  Producer,
};

const char* renderableKindName(RenderableKind kind);

// A value a producer may yield. Lists nest; producers are zero-argument
// functions that are invoked inside the computation rendering them.
class Renderable {
public:
  using Storage = std::variant<std::monostate, bool, double, std::string, NodeHandle, RenderableList, Producer>;

  Renderable() = default;
  Renderable(std::nullptr_t) {}
  Renderable(bool value) : storage_(value) {}
  Renderable(double value) : storage_(value) {}
  Renderable(int value) : storage_(static_cast<double>(value)) {}
  Renderable(std::string value) : storage_(std::move(value)) {}
  Renderable(const char* value) : storage_(std::string(value)) {}
  Renderable(NodeHandle node) : storage_(node) {}
  Renderable(RenderableList items) : storage_(std::move(items)) {}
  Renderable(Producer producer) : storage_(std::move(producer)) {}

  template <
      typename Fn,
      typename = std::enable_if_t<
          !std::is_same_v<std::decay_t<Fn>, Renderable> && !std::is_same_v<std::decay_t<Fn>, Producer> &&
          std::is_invocable_v<std::decay_t<Fn>&>>>
  Renderable(Fn&& fn) : storage_(Producer(std::forward<Fn>(fn))) {}

  static Renderable list(RenderableList items) {
    return Renderable(std::move(items));
  }

  [[nodiscard]] RenderableKind getKind() const noexcept;

  [[nodiscard]] bool isEmpty() const noexcept {
    return std::holds_alternative<std::monostate>(storage_);
  }
  [[nodiscard]] bool isBool() const noexcept {
    return std::holds_alternative<bool>(storage_);
  }
  [[nodiscard]] bool isNumber() const noexcept {
    return std::holds_alternative<double>(storage_);
  }
  [[nodiscard]] bool isString() const noexcept {
    return std::holds_alternative<std::string>(storage_);
  }
  [[nodiscard]] bool isNode() const noexcept {
    return std::holds_alternative<NodeHandle>(storage_);
  }
  [[nodiscard]] bool isList() const noexcept {
    return std::holds_alternative<RenderableList>(storage_);
  }
  [[nodiscard]] bool isProducer() const noexcept {
    return std::holds_alternative<Producer>(storage_);
  }

  // Strings and numbers render as one text node.
  [[nodiscard]] bool isTextLike() const noexcept {
    return isString() || isNumber();
  }

  [[nodiscard]] bool getBool() const;
  [[nodiscard]] double getNumber() const;
  [[nodiscard]] const std::string& getString() const;
  [[nodiscard]] NodeHandle getNode() const;
  [[nodiscard]] const RenderableList& getList() const;
  [[nodiscard]] const Producer& getProducer() const;

  [[nodiscard]] const Storage& storage() const noexcept {
    return storage_;
  }

private:
  Storage storage_{};
};

// Text rendered for a string or number value.
std::string valueToText(const Renderable& value);

// True for a producer, or a list holding one at any depth.
bool isDynamic(const Renderable& value);

// Calls nested producers until a non-producer value comes out.
Renderable unwrapProducers(Renderable value);

} // namespace weft
