#pragma once

#include "WeftHost/WeftHostTree.h"
#include "WeftHost/WeftNodeHandle.h"
#include "WeftHost/WeftPropertyValue.h"

#include <string>
#include <vector>

namespace weft {

struct RendererConfig;

enum class PropertyCategory {
  Event,
  Style,
  Field,
};

PropertyCategory classifyProperty(const RendererConfig& config, const std::string& name);

// Applies one property change to the host. Events swap subscriptions, the
// style name fans out into one field per entry and anything else becomes a
// field assignment. An empty value clears.
void applyPropertyValue(
    HostTree& host,
    const RendererConfig& config,
    NodeHandle node,
    const std::string& name,
    const PropertyValue& newValue,
    const PropertyValue& previousValue);

struct PropertyChange {
  std::string name;
  PropertyValue newValue;
  PropertyValue previousValue;
};

// Names whose value differs between the two maps. Names missing from `next`
// come back with an empty new value.
std::vector<PropertyChange> diffPropertyMaps(const PropertyMap& previous, const PropertyMap& next);

} // namespace weft
