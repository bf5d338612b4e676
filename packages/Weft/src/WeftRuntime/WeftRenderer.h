#pragma once

#include "WeftHost/WeftHostTree.h"
#include "WeftHost/WeftNodeHandle.h"
#include "WeftHost/WeftPropertyValue.h"
#include "WeftReactive/WeftOwner.h"
#include "WeftReconciler/WeftRenderable.h"
#include "WeftReconciler/WeftRenderedRegion.h"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace weft {

struct RendererConfig {
  // Names starting with this prefix are event subscriptions; the rest of the
  // name is the event type.
  std::string eventPrefix{"on:"};
  // Closed set of semantic event names, mapped to event types by dropping the
  // leading "on" and lowercasing the first letter.
  std::vector<std::string> eventAliases{"onInput", "onChange", "onSubmit", "onSelect", "onKeyDown", "onMouseDown"};
  std::string styleProperty{"style"};
  // Sequences reuse a previous text node whose text is identical instead of
  // creating a new one.
  bool reuseTextNodes{true};

  [[nodiscard]] bool isEventName(const std::string& name) const;
  [[nodiscard]] std::string eventTypeFor(const std::string& name) const;
  [[nodiscard]] bool isStyleName(const std::string& name) const;
};

/**
 * Keeps a HostTree in sync with reactive expressions.
 *
 * Every node created through the renderer belongs to the owner that was
 * current at creation time (the renderer's root owner outside any owner).
 * Disposing that owner destroys the node exactly once; the registry entry is
 * erased before the host is asked to destroy it.
 */
class Renderer {
public:
  using Disposer = std::function<void()>;

  explicit Renderer(HostTree& host, RendererConfig config = {});
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  [[nodiscard]] HostTree& getHost() const noexcept {
    return host_;
  }

  [[nodiscard]] const RendererConfig& getConfig() const noexcept {
    return config_;
  }

  [[nodiscard]] Owner& getRootOwner() noexcept {
    return *rootOwner_;
  }

  NodeHandle createElement(const std::string& tag);
  NodeHandle createTextNode(const std::string& text);
  NodeHandle createPlaceholder(PlaceholderContext context);

  void insertNode(NodeHandle parent, NodeHandle node, NodeHandle anchor = NoNode);
  void removeNode(NodeHandle parent, NodeHandle node);
  void replaceText(NodeHandle node, const std::string& text);

  // Renders `code` into `container` under a fresh root kept by the renderer
  // until the returned disposer or dispose() tears it down.
  Disposer render(Producer code, NodeHandle container);

  // Materializes `value` inside `parent`. Dynamic values are re-rendered by a
  // computation owned by the current owner.
  RenderedRegion insert(
      NodeHandle parent,
      Renderable value,
      InsertionMarker marker = InsertionMarker::end(),
      RenderedRegion initial = {});

  std::vector<NodeHandle> reconcile(
      NodeHandle parent,
      const std::vector<NodeHandle>& previousNodes,
      const RenderableList& values,
      InsertionMarker marker = InsertionMarker::end());

  void applyProperty(NodeHandle node, const std::string& name, const PropertyValue& newValue, const PropertyValue& previousValue);
  void setProp(NodeHandle node, const std::string& name, PropertyValue value);
  void spread(NodeHandle node, std::function<PropertyMap()> props);
  void effect(std::function<void()> fn);

  [[nodiscard]] PropertyValue getProp(NodeHandle node, const std::string& name) const;

  // Destroys an engine-created node now. Unknown or already destroyed nodes
  // are ignored.
  void destroyNode(NodeHandle node);
  // Destroys `node` at the end of the turn unless it got a parent again or
  // belongs to a different owner than the current one.
  void deferDestroy(NodeHandle node);

  [[nodiscard]] bool isLiveNode(NodeHandle node) const;
  [[nodiscard]] std::size_t getLiveNodeCount() const noexcept;
  // Text of an engine-created text node, or nullptr for any other node.
  [[nodiscard]] const std::string* getEngineText(NodeHandle node) const;
  [[nodiscard]] bool isEnginePlaceholder(NodeHandle node) const;
  // True for every node this renderer has destroyed.
  [[nodiscard]] bool wasDestroyed(NodeHandle node) const;

  // Disposes every render root and the root owner. The renderer stays usable.
  void dispose();

private:
  struct NodeRecord {
    Owner* owner{nullptr};
    bool isText{false};
    bool isPlaceholder{false};
    std::string text{};
  };

  struct RenderRoot {
    std::shared_ptr<Owner> owner{};
    std::shared_ptr<RenderedRegion> region{};
    NodeHandle container{};
  };

  Owner* currentOwnerOrRoot() const noexcept;
  // Like insert, but hands back the region state the computation keeps
  // current across re-runs.
  std::shared_ptr<RenderedRegion> insertTracked(
      NodeHandle parent,
      Renderable value,
      InsertionMarker marker,
      RenderedRegion initial);
  void disposeRenderRoot(const RenderRoot& root);
  Owner* trackOwner();
  NodeHandle registerNode(Owner* owner, NodeHandle node, NodeRecord record);
  void destroyOwnedNodes(Owner* owner);
  void releaseProperties(NodeHandle node);

  HostTree& host_;
  RendererConfig config_;
  std::unique_ptr<Owner> rootOwner_;
  std::vector<RenderRoot> renderRoots_{};
  std::unordered_map<NodeHandle, NodeRecord> nodes_{};
  std::unordered_map<Owner*, std::vector<NodeHandle>> ownedNodes_{};
  std::unordered_map<NodeHandle, PropertyMap> properties_{};
  // Handles are never reused, so a destroyed handle can stay recorded.
  std::unordered_set<NodeHandle> destroyedNodes_{};
  std::shared_ptr<char> lifetime_;
};

} // namespace weft
