#include "WeftHost/WeftMemoryHostTree.h"

#include "shared/WeftFeatureFlags.h"
#include "shared/WeftGlobalError.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace weft {

namespace {

std::string describeHandle(NodeHandle node) {
  return node.debugDescription();
}

} // namespace

const char* hostOperationName(HostOperationKind kind) {
  switch (kind) {
    case HostOperationKind::CreateElement:
      return "createElement";
    case HostOperationKind::CreateText:
      return "createTextNode";
    case HostOperationKind::CreatePlaceholder:
      return "createPlaceholder";
    case HostOperationKind::ReplaceText:
      return "replaceText";
    case HostOperationKind::SetField:
      return "setField";
    case HostOperationKind::Subscribe:
      return "subscribeEvent";
    case HostOperationKind::Unsubscribe:
      return "unsubscribeEvent";
    case HostOperationKind::Insert:
      return "insertNode";
    case HostOperationKind::Move:
      return "moveNode";
    case HostOperationKind::Remove:
      return "removeNode";
    case HostOperationKind::Destroy:
      return "destroyNode";
    default:
      return "unknown";
  }
}

MemoryHostTree::MemoryHostTree() = default;

MemoryHostTree::MemoryHostTree(const std::vector<std::string>& elementTypes) {
  for (const auto& tag : elementTypes) {
    registerElementType(tag);
  }
}

void MemoryHostTree::registerElementType(const std::string& tag, bool isTextContainer) {
  elementTypes_[tag] = isTextContainer;
}

bool MemoryHostTree::hasElementType(const std::string& tag) const {
  return elementTypes_.find(tag) != elementTypes_.end();
}

MemoryHostTree::Slot& MemoryHostTree::slotFor(NodeHandle node) {
  return const_cast<Slot&>(static_cast<const MemoryHostTree&>(*this).slotFor(node));
}

const MemoryHostTree::Slot& MemoryHostTree::slotFor(NodeHandle node) const {
  if (!node || node.index >= slots_.size()) {
    throw std::logic_error("Unknown node handle " + describeHandle(node));
  }
  const Slot& slot = slots_[node.index];
  if (!slot.alive || slot.generation != node.generation) {
    throw std::logic_error("Stale node handle " + describeHandle(node));
  }
  return slot;
}

NodeHandle MemoryHostTree::allocate(HostNodeKind kind) {
  std::uint32_t index = 0;
  if (!freeSlots_.empty()) {
    index = freeSlots_.back();
    freeSlots_.pop_back();
  } else {
    index = static_cast<std::uint32_t>(slots_.size());
    slots_.emplace_back();
  }

  Slot& slot = slots_[index];
  const std::uint32_t generation = slot.generation;
  slot = Slot{};
  slot.generation = generation;
  slot.alive = true;
  slot.kind = kind;
  ++liveNodes_;
  return NodeHandle{index, generation};
}

void MemoryHostTree::record(
    HostOperationKind kind,
    NodeHandle node,
    NodeHandle parent,
    NodeHandle anchor,
    std::string detail) {
  if (!enableHostOperationJournal) {
    return;
  }
  journal_.push_back(HostOperation{kind, node, parent, anchor, std::move(detail)});
}

NodeHandle MemoryHostTree::createElement(const std::string& tag) {
  if (!hasElementType(tag)) {
    throw std::invalid_argument("Unregistered element type: " + tag);
  }
  NodeHandle node = allocate(HostNodeKind::Element);
  slotFor(node).type = tag;
  record(HostOperationKind::CreateElement, node, {}, {}, tag);
  return node;
}

NodeHandle MemoryHostTree::createTextNode(const std::string& text) {
  NodeHandle node = allocate(HostNodeKind::Text);
  Slot& slot = slotFor(node);
  slot.type = "#text";
  slot.textContent = text;
  record(HostOperationKind::CreateText, node, {}, {}, text);
  return node;
}

void MemoryHostTree::replaceText(NodeHandle node, const std::string& text) {
  Slot& slot = slotFor(node);
  if (slot.kind != HostNodeKind::Text) {
    throw std::logic_error("replaceText called on a non-text node " + describeHandle(node));
  }
  slot.textContent = text;
  record(HostOperationKind::ReplaceText, node, {}, {}, text);
}

NodeHandle MemoryHostTree::createPlaceholder(PlaceholderContext context) {
  NodeHandle node = allocate(HostNodeKind::Placeholder);
  Slot& slot = slotFor(node);
  slot.type = "#slot";
  slot.placeholderContext = context;
  record(HostOperationKind::CreatePlaceholder, node, {}, {}, placeholderContextName(context));
  return node;
}

void MemoryHostTree::setField(NodeHandle node, const std::string& name, const PropertyValue& value) {
  Slot& slot = slotFor(node);
  if (value.isEmpty()) {
    slot.fields.erase(name);
  } else {
    slot.fields[name] = value;
  }
  record(HostOperationKind::SetField, node, {}, {}, name);
}

void MemoryHostTree::subscribeEvent(NodeHandle node, const std::string& event, const EventHandler& handler) {
  if (!handler) {
    throw std::invalid_argument("Cannot subscribe an empty handler to " + event);
  }
  Slot& slot = slotFor(node);
  slot.listeners.emplace_back(event, handler);
  record(HostOperationKind::Subscribe, node, {}, {}, event);
}

void MemoryHostTree::unsubscribeEvent(NodeHandle node, const std::string& event, const EventHandler& handler) {
  Slot& slot = slotFor(node);
  auto it = std::find_if(
      slot.listeners.begin(),
      slot.listeners.end(),
      [&](const std::pair<std::string, EventHandler>& entry) {
        return entry.first == event && entry.second == handler;
      });
  if (it == slot.listeners.end()) {
    throw std::logic_error("Handler for " + event + " is not subscribed on " + describeHandle(node));
  }
  slot.listeners.erase(it);
  record(HostOperationKind::Unsubscribe, node, {}, {}, event);
}

void MemoryHostTree::detachFromParent(NodeHandle node) {
  Slot& slot = slotFor(node);
  if (!slot.parent) {
    return;
  }
  auto& siblings = slotFor(slot.parent).children;
  siblings.erase(std::remove(siblings.begin(), siblings.end(), node), siblings.end());
  slot.parent = NoNode;
}

void MemoryHostTree::insertNode(NodeHandle parent, NodeHandle node, NodeHandle anchor) {
  Slot& parentSlot = slotFor(parent);
  if (parentSlot.kind != HostNodeKind::Element) {
    throw std::logic_error("Cannot insert into " + parentSlot.type + " node " + describeHandle(parent));
  }
  if (parent == node) {
    throw std::logic_error("Cannot insert a node into itself");
  }
  if (anchor == node) {
    return;
  }
  if (anchor && slotFor(anchor).parent != parent) {
    throw std::logic_error("Anchor " + describeHandle(anchor) + " is not a child of " + describeHandle(parent));
  }
  for (NodeHandle ancestor = parent; ancestor; ancestor = slotFor(ancestor).parent) {
    if (ancestor == node) {
      throw std::logic_error("Cannot insert a node into its own descendant");
    }
  }

  const bool isMove = slotFor(node).parent == parent;
  detachFromParent(node);

  auto& siblings = slotFor(parent).children;
  if (!anchor) {
    siblings.push_back(node);
  } else {
    auto it = std::find(siblings.begin(), siblings.end(), anchor);
    siblings.insert(it, node);
  }
  slotFor(node).parent = parent;
  record(isMove ? HostOperationKind::Move : HostOperationKind::Insert, node, parent, anchor);
}

void MemoryHostTree::removeNode(NodeHandle parent, NodeHandle node) {
  Slot& slot = slotFor(node);
  if (slot.parent != parent) {
    throw std::logic_error(describeHandle(node) + " is not a child of " + describeHandle(parent));
  }
  detachFromParent(node);
  record(HostOperationKind::Remove, node, parent);
}

NodeHandle MemoryHostTree::getParentNode(NodeHandle node) const {
  return slotFor(node).parent;
}

NodeHandle MemoryHostTree::getFirstChild(NodeHandle node) const {
  const auto& children = slotFor(node).children;
  return children.empty() ? NoNode : children.front();
}

NodeHandle MemoryHostTree::getNextSibling(NodeHandle node) const {
  const Slot& slot = slotFor(node);
  if (!slot.parent) {
    return NoNode;
  }
  const auto& siblings = slotFor(slot.parent).children;
  auto it = std::find(siblings.begin(), siblings.end(), node);
  if (it == siblings.end() || ++it == siblings.end()) {
    return NoNode;
  }
  return *it;
}

bool MemoryHostTree::isTextNode(NodeHandle node) const {
  const Slot& slot = slotFor(node);
  if (slot.kind == HostNodeKind::Text) {
    return true;
  }
  if (slot.kind != HostNodeKind::Element) {
    return false;
  }
  auto it = elementTypes_.find(slot.type);
  return it != elementTypes_.end() && it->second;
}

void MemoryHostTree::destroyNode(NodeHandle node) {
  Slot& slot = slotFor(node);
  if (slot.parent) {
    throw std::logic_error("Destroying " + describeHandle(node) + " while it is still attached");
  }

  for (NodeHandle child : slot.children) {
    slotFor(child).parent = NoNode;
  }

  record(HostOperationKind::Destroy, node);

  Slot& released = slots_[node.index];
  released.alive = false;
  released.children.clear();
  released.listeners.clear();
  released.fields.clear();
  released.generation = released.generation + 1 == 0 ? 1 : released.generation + 1;
  freeSlots_.push_back(node.index);
  --liveNodes_;
}

bool MemoryHostTree::isAlive(NodeHandle node) const noexcept {
  if (!node || node.index >= slots_.size()) {
    return false;
  }
  const Slot& slot = slots_[node.index];
  return slot.alive && slot.generation == node.generation;
}

HostNodeKind MemoryHostTree::getKind(NodeHandle node) const {
  return slotFor(node).kind;
}

const std::string& MemoryHostTree::getType(NodeHandle node) const {
  return slotFor(node).type;
}

const std::string& MemoryHostTree::getTextContent(NodeHandle node) const {
  return slotFor(node).textContent;
}

PlaceholderContext MemoryHostTree::getPlaceholderContext(NodeHandle node) const {
  const Slot& slot = slotFor(node);
  if (slot.kind != HostNodeKind::Placeholder) {
    throw std::logic_error(describeHandle(node) + " is not a placeholder");
  }
  return slot.placeholderContext;
}

const std::vector<NodeHandle>& MemoryHostTree::getChildren(NodeHandle node) const {
  return slotFor(node).children;
}

PropertyValue MemoryHostTree::getField(NodeHandle node, const std::string& name) const {
  const auto& fields = slotFor(node).fields;
  auto it = fields.find(name);
  if (it == fields.end()) {
    return PropertyValue{};
  }
  return it->second;
}

std::size_t MemoryHostTree::getListenerCount(NodeHandle node, const std::string& event) const {
  const auto& listeners = slotFor(node).listeners;
  return static_cast<std::size_t>(std::count_if(
      listeners.begin(),
      listeners.end(),
      [&](const std::pair<std::string, EventHandler>& entry) {
        return entry.first == event;
      }));
}

std::size_t MemoryHostTree::getLiveNodeCount() const noexcept {
  return liveNodes_;
}

std::size_t MemoryHostTree::dispatchEvent(NodeHandle node, const HostEvent& event) {
  std::vector<EventHandler> handlers;
  for (const auto& entry : slotFor(node).listeners) {
    if (entry.first == event.type) {
      handlers.push_back(entry.second);
    }
  }

  for (const auto& handler : handlers) {
    try {
      (*handler)(event);
    } catch (const std::exception& ex) {
      reportGlobalError(ex);
    }
  }
  return handlers.size();
}

std::string MemoryHostTree::debugDescription(NodeHandle node) const {
  const Slot& slot = slotFor(node);
  switch (slot.kind) {
    case HostNodeKind::Text:
      return "#text{" + slot.textContent + "}";
    case HostNodeKind::Placeholder:
      return std::string("<slot:") + placeholderContextName(slot.placeholderContext) + ">";
    case HostNodeKind::Element:
    default:
      break;
  }

  std::string out = "<" + slot.type + ">";
  if (slot.children.empty()) {
    return out;
  }
  out += "[";
  for (std::size_t index = 0; index < slot.children.size(); ++index) {
    if (index > 0) {
      out += ", ";
    }
    out += debugDescription(slot.children[index]);
  }
  out += "]";
  return out;
}

const std::vector<HostOperation>& MemoryHostTree::getJournal() const noexcept {
  return journal_;
}

std::size_t MemoryHostTree::countOperations(HostOperationKind kind) const {
  return static_cast<std::size_t>(std::count_if(
      journal_.begin(),
      journal_.end(),
      [kind](const HostOperation& operation) {
        return operation.kind == kind;
      }));
}

void MemoryHostTree::clearJournal() {
  journal_.clear();
}

} // namespace weft
