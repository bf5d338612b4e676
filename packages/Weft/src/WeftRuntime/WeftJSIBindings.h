#pragma once

#include "WeftHost/WeftNodeHandle.h"
#include "WeftHost/WeftPropertyValue.h"
#include "WeftReconciler/WeftRenderable.h"

#include <jsi/jsi.h>

#include <vector>

namespace weft {

class Renderer;

namespace jsi = facebook::jsi;

// JS-side wrapper of a NodeHandle.
class NodeHostObject : public jsi::HostObject {
 public:
  explicit NodeHostObject(NodeHandle node) : node_(node) {}

  [[nodiscard]] NodeHandle node() const noexcept {
    return node_;
  }

  jsi::Value get(jsi::Runtime& runtime, const jsi::PropNameID& name) override;
  std::vector<jsi::PropNameID> getPropertyNames(jsi::Runtime& runtime) override;

 private:
  NodeHandle node_;
};

jsi::Value createNodeValue(jsi::Runtime& runtime, NodeHandle node);

// NoNode when `value` is not a node wrapper.
NodeHandle nodeFromValue(jsi::Runtime& runtime, const jsi::Value& value);

// Functions become producers, arrays lists and node wrappers nodes. Other
// objects throw std::invalid_argument.
Renderable toRenderable(jsi::Runtime& runtime, const jsi::Value& value);

// Functions become event handlers and plain objects style maps.
PropertyValue toPropertyValue(jsi::Runtime& runtime, const jsi::Value& value);

// Installs the global `weft` object: createElement, createTextNode, insert,
// setProp, createSignal and render.
void installWeftBindings(jsi::Runtime& runtime, Renderer& renderer);

} // namespace weft
