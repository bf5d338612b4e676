#include "WeftHost/WeftPropertyValue.h"

#include "shared/WeftNumberFormat.h"

#include <stdexcept>

namespace weft {

bool PropertyValue::isEmpty() const noexcept {
  return std::holds_alternative<std::monostate>(storage_);
}

bool PropertyValue::isBool() const noexcept {
  return std::holds_alternative<bool>(storage_);
}

bool PropertyValue::isNumber() const noexcept {
  return std::holds_alternative<double>(storage_);
}

bool PropertyValue::isString() const noexcept {
  return std::holds_alternative<std::string>(storage_);
}

bool PropertyValue::isEventHandler() const noexcept {
  return std::holds_alternative<EventHandler>(storage_);
}

bool PropertyValue::isStyleMap() const noexcept {
  return std::holds_alternative<StyleMapPtr>(storage_);
}

bool PropertyValue::getBool() const {
  if (!isBool()) {
    throw std::invalid_argument("Property value is not a boolean");
  }
  return std::get<bool>(storage_);
}

double PropertyValue::getNumber() const {
  if (!isNumber()) {
    throw std::invalid_argument("Property value is not a number");
  }
  return std::get<double>(storage_);
}

const std::string& PropertyValue::getString() const {
  if (!isString()) {
    throw std::invalid_argument("Property value is not a string");
  }
  return std::get<std::string>(storage_);
}

const EventHandler& PropertyValue::getEventHandler() const {
  if (!isEventHandler()) {
    throw std::invalid_argument("Property value is not an event handler");
  }
  return std::get<EventHandler>(storage_);
}

const StyleMapPtr& PropertyValue::getStyleMap() const {
  if (!isStyleMap()) {
    throw std::invalid_argument("Property value is not a style map");
  }
  return std::get<StyleMapPtr>(storage_);
}

std::string PropertyValue::debugDescription() const {
  if (isEmpty()) {
    return "undefined";
  }
  if (isBool()) {
    return getBool() ? "true" : "false";
  }
  if (isNumber()) {
    return numberToString(getNumber());
  }
  if (isString()) {
    return "\"" + getString() + "\"";
  }
  if (isEventHandler()) {
    return "[handler]";
  }

  std::string out = "{";
  bool first = true;
  const auto& style = getStyleMap();
  if (style) {
    for (const auto& entry : style->entries) {
      if (!first) {
        out += ", ";
      }
      first = false;
      out += entry.first + ": " + entry.second.debugDescription();
    }
  }
  out += "}";
  return out;
}

bool operator==(const PropertyValue& a, const PropertyValue& b) {
  return a.storage_ == b.storage_;
}

EventHandler makeEventHandler(EventCallback callback) {
  return std::make_shared<const EventCallback>(std::move(callback));
}

StyleMapPtr makeStyleMap(std::map<std::string, PropertyValue> entries) {
  auto style = std::make_shared<StyleMap>();
  style->entries = std::move(entries);
  return style;
}

} // namespace weft
