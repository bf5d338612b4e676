#include "WeftReconciler/WeftPropertySpreader.h"

#include "WeftRuntime/WeftRenderer.h"

#include <stdexcept>

namespace weft {

namespace {

void applyEvent(
    HostTree& host,
    const RendererConfig& config,
    NodeHandle node,
    const std::string& name,
    const PropertyValue& newValue,
    const PropertyValue& previousValue) {
  if (!newValue.isEmpty() && !newValue.isEventHandler()) {
    throw std::invalid_argument("Event property " + name + " expects a handler, got " + newValue.debugDescription());
  }
  const EventHandler next = newValue.isEventHandler() ? newValue.getEventHandler() : EventHandler{};
  const EventHandler previous = previousValue.isEventHandler() ? previousValue.getEventHandler() : EventHandler{};
  if (next == previous) {
    return;
  }

  const std::string event = config.eventTypeFor(name);
  if (previous) {
    host.unsubscribeEvent(node, event, previous);
  }
  if (next) {
    host.subscribeEvent(node, event, next);
  }
}

void applyStyle(
    HostTree& host,
    NodeHandle node,
    const std::string& name,
    const PropertyValue& newValue,
    const PropertyValue& previousValue) {
  const StyleMap* next = newValue.isStyleMap() ? newValue.getStyleMap().get() : nullptr;
  const StyleMap* previous = previousValue.isStyleMap() ? previousValue.getStyleMap().get() : nullptr;

  if (previous != nullptr) {
    for (const auto& entry : previous->entries) {
      if (next == nullptr || next->entries.count(entry.first) == 0) {
        host.setField(node, entry.first, PropertyValue{});
      }
    }
  }

  if (next != nullptr) {
    if (previous == nullptr && !previousValue.isEmpty()) {
      host.setField(node, name, PropertyValue{});
    }
    for (const auto& entry : next->entries) {
      host.setField(node, entry.first, entry.second);
    }
    return;
  }

  // A plain value under the style name is an ordinary field.
  if (!newValue.isEmpty() || (!previousValue.isEmpty() && previous == nullptr)) {
    host.setField(node, name, newValue);
  }
}

} // namespace

PropertyCategory classifyProperty(const RendererConfig& config, const std::string& name) {
  if (config.isEventName(name)) {
    return PropertyCategory::Event;
  }
  if (config.isStyleName(name)) {
    return PropertyCategory::Style;
  }
  return PropertyCategory::Field;
}

void applyPropertyValue(
    HostTree& host,
    const RendererConfig& config,
    NodeHandle node,
    const std::string& name,
    const PropertyValue& newValue,
    const PropertyValue& previousValue) {
  switch (classifyProperty(config, name)) {
    case PropertyCategory::Event:
      applyEvent(host, config, node, name, newValue, previousValue);
      return;
    case PropertyCategory::Style:
      applyStyle(host, node, name, newValue, previousValue);
      return;
    case PropertyCategory::Field:
      host.setField(node, name, newValue);
      return;
  }
}

std::vector<PropertyChange> diffPropertyMaps(const PropertyMap& previous, const PropertyMap& next) {
  std::vector<PropertyChange> changes;
  for (const auto& entry : previous) {
    if (next.count(entry.first) == 0) {
      changes.push_back(PropertyChange{entry.first, PropertyValue{}, entry.second});
    }
  }
  for (const auto& entry : next) {
    auto it = previous.find(entry.first);
    if (it == previous.end()) {
      changes.push_back(PropertyChange{entry.first, entry.second, PropertyValue{}});
    } else if (it->second != entry.second) {
      changes.push_back(PropertyChange{entry.first, entry.second, it->second});
    }
  }
  return changes;
}

} // namespace weft
