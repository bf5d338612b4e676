#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <variant>

namespace weft {

class PropertyValue;

struct HostEvent {
  std::string type;
  std::string detail;
};

using EventCallback = std::function<void(const HostEvent&)>;
// Handlers are compared by reference, so the same callback object must be
// passed again to keep a subscription unchanged.
using EventHandler = std::shared_ptr<const EventCallback>;

struct StyleMap;
using StyleMapPtr = std::shared_ptr<const StyleMap>;

class PropertyValue {
public:
  using Storage = std::variant<std::monostate, bool, double, std::string, EventHandler, StyleMapPtr>;

  PropertyValue() = default;
  PropertyValue(bool value) : storage_(value) {}
  PropertyValue(double value) : storage_(value) {}
  PropertyValue(int value) : storage_(static_cast<double>(value)) {}
  PropertyValue(std::string value) : storage_(std::move(value)) {}
  PropertyValue(const char* value) : storage_(std::string(value)) {}
  PropertyValue(EventHandler handler) : storage_(std::move(handler)) {}
  PropertyValue(StyleMapPtr style) : storage_(std::move(style)) {}

  [[nodiscard]] bool isEmpty() const noexcept;
  [[nodiscard]] bool isBool() const noexcept;
  [[nodiscard]] bool isNumber() const noexcept;
  [[nodiscard]] bool isString() const noexcept;
  [[nodiscard]] bool isEventHandler() const noexcept;
  [[nodiscard]] bool isStyleMap() const noexcept;

  [[nodiscard]] bool getBool() const;
  [[nodiscard]] double getNumber() const;
  [[nodiscard]] const std::string& getString() const;
  [[nodiscard]] const EventHandler& getEventHandler() const;
  [[nodiscard]] const StyleMapPtr& getStyleMap() const;

  [[nodiscard]] const Storage& storage() const noexcept {
    return storage_;
  }

  [[nodiscard]] std::string debugDescription() const;

  // Primitives compare by value, handlers and style maps by reference.
  friend bool operator==(const PropertyValue& a, const PropertyValue& b);
  friend bool operator!=(const PropertyValue& a, const PropertyValue& b) {
    return !(a == b);
  }

private:
  Storage storage_{};
};

struct StyleMap {
  std::map<std::string, PropertyValue> entries;
};

using PropertyMap = std::map<std::string, PropertyValue>;

EventHandler makeEventHandler(EventCallback callback);
StyleMapPtr makeStyleMap(std::map<std::string, PropertyValue> entries);

} // namespace weft
