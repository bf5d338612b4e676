#pragma once

#include "WeftHost/WeftNodeHandle.h"
#include "WeftHost/WeftPropertyValue.h"

#include <string>

namespace weft {

// The only surface through which the engine touches native nodes. Embedders
// implement it for their own backend; MemoryHostTree is the in-process one.
class HostTree {
public:
  HostTree() = default;
  virtual ~HostTree() = default;

  HostTree(const HostTree&) = delete;
  HostTree& operator=(const HostTree&) = delete;

  [[nodiscard]] virtual bool hasElementType(const std::string& tag) const = 0;

  virtual NodeHandle createElement(const std::string& tag) = 0;
  virtual NodeHandle createTextNode(const std::string& text) = 0;
  virtual void replaceText(NodeHandle node, const std::string& text) = 0;
  virtual NodeHandle createPlaceholder(PlaceholderContext context) = 0;

  virtual void setField(NodeHandle node, const std::string& name, const PropertyValue& value) = 0;
  virtual void subscribeEvent(NodeHandle node, const std::string& event, const EventHandler& handler) = 0;
  virtual void unsubscribeEvent(NodeHandle node, const std::string& event, const EventHandler& handler) = 0;

  // Inserts before `anchor`, or appends when `anchor` is NoNode. A node that
  // already has a parent is detached from it first.
  virtual void insertNode(NodeHandle parent, NodeHandle node, NodeHandle anchor) = 0;
  virtual void removeNode(NodeHandle parent, NodeHandle node) = 0;

  [[nodiscard]] virtual NodeHandle getParentNode(NodeHandle node) const = 0;
  [[nodiscard]] virtual NodeHandle getFirstChild(NodeHandle node) const = 0;
  [[nodiscard]] virtual NodeHandle getNextSibling(NodeHandle node) const = 0;
  [[nodiscard]] virtual bool isTextNode(NodeHandle node) const = 0;

  // Releases a node that no longer has a parent.
  virtual void destroyNode(NodeHandle node) = 0;
};

} // namespace weft
