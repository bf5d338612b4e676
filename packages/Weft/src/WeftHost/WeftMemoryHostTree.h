#pragma once

#include "WeftHost/WeftHostTree.h"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace weft {

enum class HostNodeKind : std::uint8_t {
  Element = 0,
  Text = 1,
  Placeholder = 2,
};

enum class HostOperationKind : std::uint8_t {
  CreateElement,
  CreateText,
  CreatePlaceholder,
  ReplaceText,
  SetField,
  Subscribe,
  Unsubscribe,
  Insert,
  Move,
  Remove,
  Destroy,
};

const char* hostOperationName(HostOperationKind kind);

struct HostOperation {
  HostOperationKind kind;
  NodeHandle node{};
  NodeHandle parent{};
  NodeHandle anchor{};
  std::string detail{};
};

// Arena-backed HostTree. Parent and child links are stored as handles, and a
// slot's generation is bumped on destroy so stale handles are rejected.
class MemoryHostTree final : public HostTree {
public:
  MemoryHostTree();
  explicit MemoryHostTree(const std::vector<std::string>& elementTypes);

  // Text containers accept text-context placeholders and report isTextNode.
  void registerElementType(const std::string& tag, bool isTextContainer = false);

  [[nodiscard]] bool hasElementType(const std::string& tag) const override;

  NodeHandle createElement(const std::string& tag) override;
  NodeHandle createTextNode(const std::string& text) override;
  void replaceText(NodeHandle node, const std::string& text) override;
  NodeHandle createPlaceholder(PlaceholderContext context) override;

  void setField(NodeHandle node, const std::string& name, const PropertyValue& value) override;
  void subscribeEvent(NodeHandle node, const std::string& event, const EventHandler& handler) override;
  void unsubscribeEvent(NodeHandle node, const std::string& event, const EventHandler& handler) override;

  void insertNode(NodeHandle parent, NodeHandle node, NodeHandle anchor) override;
  void removeNode(NodeHandle parent, NodeHandle node) override;

  [[nodiscard]] NodeHandle getParentNode(NodeHandle node) const override;
  [[nodiscard]] NodeHandle getFirstChild(NodeHandle node) const override;
  [[nodiscard]] NodeHandle getNextSibling(NodeHandle node) const override;
  [[nodiscard]] bool isTextNode(NodeHandle node) const override;

  void destroyNode(NodeHandle node) override;

  [[nodiscard]] bool isAlive(NodeHandle node) const noexcept;
  [[nodiscard]] HostNodeKind getKind(NodeHandle node) const;
  [[nodiscard]] const std::string& getType(NodeHandle node) const;
  [[nodiscard]] const std::string& getTextContent(NodeHandle node) const;
  [[nodiscard]] PlaceholderContext getPlaceholderContext(NodeHandle node) const;
  [[nodiscard]] const std::vector<NodeHandle>& getChildren(NodeHandle node) const;
  [[nodiscard]] PropertyValue getField(NodeHandle node, const std::string& name) const;
  [[nodiscard]] std::size_t getListenerCount(NodeHandle node, const std::string& event) const;
  [[nodiscard]] std::size_t getLiveNodeCount() const noexcept;

  // Invokes every handler subscribed to `event` on `node`. Returns how many
  // ran. A throwing handler is reported and does not stop the others.
  std::size_t dispatchEvent(NodeHandle node, const HostEvent& event);

  // Text rendering of a subtree, e.g. <box>[#text{a}, <slot:sequence>].
  [[nodiscard]] std::string debugDescription(NodeHandle node) const;

  [[nodiscard]] const std::vector<HostOperation>& getJournal() const noexcept;
  [[nodiscard]] std::size_t countOperations(HostOperationKind kind) const;
  void clearJournal();

private:
  struct Slot {
    std::uint32_t generation{1};
    bool alive{false};
    HostNodeKind kind{HostNodeKind::Element};
    std::string type{};
    std::string textContent{};
    PlaceholderContext placeholderContext{PlaceholderContext::Sequence};
    std::map<std::string, PropertyValue> fields{};
    std::vector<std::pair<std::string, EventHandler>> listeners{};
    NodeHandle parent{};
    std::vector<NodeHandle> children{};
  };

  Slot& slotFor(NodeHandle node);
  const Slot& slotFor(NodeHandle node) const;
  NodeHandle allocate(HostNodeKind kind);
  void detachFromParent(NodeHandle node);
  void record(HostOperationKind kind, NodeHandle node, NodeHandle parent = {}, NodeHandle anchor = {}, std::string detail = {});

  std::unordered_map<std::string, bool> elementTypes_{};
  std::vector<Slot> slots_{};
  std::vector<std::uint32_t> freeSlots_{};
  std::size_t liveNodes_{0};
  std::vector<HostOperation> journal_{};
};

} // namespace weft
