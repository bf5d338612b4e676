#include "WeftRuntime/WeftRenderer.h"

#include "WeftReactive/WeftComputation.h"
#include "WeftReconciler/WeftArrayReconciler.h"
#include "WeftReconciler/WeftInsertExpression.h"
#include "WeftReconciler/WeftPropertySpreader.h"
#include "WeftScheduler/WeftTurn.h"
#include "shared/WeftGlobalError.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <stdexcept>
#include <utility>

namespace weft {

namespace {

bool startsWith(const std::string& value, const std::string& prefix) {
  return !prefix.empty() && value.size() > prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

bool RendererConfig::isEventName(const std::string& name) const {
  if (startsWith(name, eventPrefix)) {
    return true;
  }
  return std::find(eventAliases.begin(), eventAliases.end(), name) != eventAliases.end();
}

std::string RendererConfig::eventTypeFor(const std::string& name) const {
  if (startsWith(name, eventPrefix)) {
    return name.substr(eventPrefix.size());
  }
  // "onKeyDown" -> "keyDown"
  if (name.size() > 2 && name.compare(0, 2, "on") == 0) {
    std::string type = name.substr(2);
    type[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(type[0])));
    return type;
  }
  return name;
}

bool RendererConfig::isStyleName(const std::string& name) const {
  return !styleProperty.empty() && name == styleProperty;
}

Renderer::Renderer(HostTree& host, RendererConfig config)
    : host_(host),
      config_(std::move(config)),
      rootOwner_(std::make_unique<Owner>()),
      lifetime_(std::make_shared<char>(0)) {}

Renderer::~Renderer() {
  try {
    dispose();
  } catch (const std::exception& ex) {
    reportGlobalError(ex);
  }
  lifetime_.reset();
}

Owner* Renderer::currentOwnerOrRoot() const noexcept {
  Owner* owner = getCurrentOwner();
  return owner != nullptr ? owner : rootOwner_.get();
}

Owner* Renderer::trackOwner() {
  Owner* owner = currentOwnerOrRoot();
  if (owner->isDisposed()) {
    throw std::logic_error("Cannot create nodes under a disposed owner");
  }
  auto inserted = ownedNodes_.try_emplace(owner);
  if (inserted.second) {
    std::weak_ptr<char> alive = lifetime_;
    owner->onDispose([this, alive, owner] {
      if (alive.expired()) {
        return;
      }
      destroyOwnedNodes(owner);
    });
  }
  return owner;
}

NodeHandle Renderer::registerNode(Owner* owner, NodeHandle node, NodeRecord record) {
  record.owner = owner;
  ownedNodes_[owner].push_back(node);
  nodes_.emplace(node, std::move(record));
  return node;
}

NodeHandle Renderer::createElement(const std::string& tag) {
  if (!host_.hasElementType(tag)) {
    throw std::invalid_argument("Unregistered element type: " + tag);
  }
  Owner* owner = trackOwner();
  return registerNode(owner, host_.createElement(tag), NodeRecord{});
}

NodeHandle Renderer::createTextNode(const std::string& text) {
  Owner* owner = trackOwner();
  NodeRecord record;
  record.isText = true;
  record.text = text;
  return registerNode(owner, host_.createTextNode(text), std::move(record));
}

NodeHandle Renderer::createPlaceholder(PlaceholderContext context) {
  Owner* owner = trackOwner();
  NodeRecord record;
  record.isPlaceholder = true;
  return registerNode(owner, host_.createPlaceholder(context), std::move(record));
}

void Renderer::insertNode(NodeHandle parent, NodeHandle node, NodeHandle anchor) {
  host_.insertNode(parent, node, anchor);
}

void Renderer::removeNode(NodeHandle parent, NodeHandle node) {
  host_.removeNode(parent, node);
}

void Renderer::replaceText(NodeHandle node, const std::string& text) {
  host_.replaceText(node, text);
  auto it = nodes_.find(node);
  if (it != nodes_.end() && it->second.isText) {
    it->second.text = text;
  }
}

Renderer::Disposer Renderer::render(Producer code, NodeHandle container) {
  if (!code) {
    throw std::invalid_argument("render requires a producer");
  }
  const InsertionMarker marker =
      host_.getFirstChild(container).isValid() ? InsertionMarker::end() : InsertionMarker::exclusive();

  RenderRoot root;
  root.container = container;
  root.owner = runInTurn([&] {
    return std::shared_ptr<Owner>(createRoot([&](Owner&) {
      root.region = insertTracked(container, Renderable(std::move(code)), marker, RenderedRegion{});
    }));
  });
  std::weak_ptr<Owner> weakOwner = root.owner;
  renderRoots_.push_back(std::move(root));

  std::weak_ptr<char> alive = lifetime_;
  return [this, alive, weakOwner] {
    if (alive.expired()) {
      return;
    }
    std::shared_ptr<Owner> owner = weakOwner.lock();
    if (!owner) {
      return;
    }
    auto it = std::find_if(renderRoots_.begin(), renderRoots_.end(), [&](const RenderRoot& entry) {
      return entry.owner == owner;
    });
    if (it == renderRoots_.end()) {
      return;
    }
    RenderRoot released = std::move(*it);
    renderRoots_.erase(it);
    runInTurn([&] { disposeRenderRoot(released); });
  };
}

void Renderer::disposeRenderRoot(const RenderRoot& root) {
  root.owner->dispose();
  // Nodes the tree did not create itself are detached but left alive.
  for (NodeHandle node : root.region->nodes) {
    if (!wasDestroyed(node) && host_.getParentNode(node) == root.container) {
      host_.removeNode(root.container, node);
    }
  }
}

RenderedRegion Renderer::insert(NodeHandle parent, Renderable value, InsertionMarker marker, RenderedRegion initial) {
  return runInTurn([&] {
    if (!isDynamic(value)) {
      return insertExpression(*this, parent, value, marker, std::move(initial));
    }
    return *insertTracked(parent, std::move(value), marker, std::move(initial));
  });
}

std::shared_ptr<RenderedRegion> Renderer::insertTracked(
    NodeHandle parent,
    Renderable value,
    InsertionMarker marker,
    RenderedRegion initial) {
  auto state = std::make_shared<RenderedRegion>(std::move(initial));
  runInTurn([&] {
    std::weak_ptr<char> alive = lifetime_;
    OwnerScope ownerScope(currentOwnerOrRoot());
    Computation::create([this, alive, parent, value, marker, state] {
      if (alive.expired()) {
        return;
      }
      *state = insertExpression(*this, parent, value, marker, *state);
    });
  });
  return state;
}

std::vector<NodeHandle> Renderer::reconcile(
    NodeHandle parent,
    const std::vector<NodeHandle>& previousNodes,
    const RenderableList& values,
    InsertionMarker marker) {
  return runInTurn([&] {
    std::vector<NodeHandle> previous;
    previous.reserve(previousNodes.size());
    for (NodeHandle node : previousNodes) {
      if (!wasDestroyed(node)) {
        previous.push_back(node);
      }
    }
    return reconcileArrays(*this, parent, previous, values, marker);
  });
}

void Renderer::applyProperty(
    NodeHandle node,
    const std::string& name,
    const PropertyValue& newValue,
    const PropertyValue& previousValue) {
  runInTurn([&] {
    applyPropertyValue(host_, config_, node, name, newValue, previousValue);
    if (newValue.isEmpty()) {
      auto it = properties_.find(node);
      if (it != properties_.end()) {
        it->second.erase(name);
        if (it->second.empty()) {
          properties_.erase(it);
        }
      }
    } else {
      properties_[node][name] = newValue;
    }
  });
}

void Renderer::setProp(NodeHandle node, const std::string& name, PropertyValue value) {
  applyProperty(node, name, value, getProp(node, name));
}

void Renderer::spread(NodeHandle node, std::function<PropertyMap()> props) {
  if (!props) {
    throw std::invalid_argument("spread requires a property producer");
  }
  runInTurn([&] {
    auto applied = std::make_shared<PropertyMap>();
    std::weak_ptr<char> alive = lifetime_;
    OwnerScope ownerScope(currentOwnerOrRoot());
    Computation::create([this, alive, node, props = std::move(props), applied] {
      if (alive.expired()) {
        return;
      }
      PropertyMap next = props();
      for (const auto& change : diffPropertyMaps(*applied, next)) {
        applyProperty(node, change.name, change.newValue, change.previousValue);
      }
      *applied = std::move(next);
    });
  });
}

void Renderer::effect(std::function<void()> fn) {
  runInTurn([&] {
    OwnerScope ownerScope(currentOwnerOrRoot());
    Computation::create(std::move(fn));
  });
}

PropertyValue Renderer::getProp(NodeHandle node, const std::string& name) const {
  auto it = properties_.find(node);
  if (it == properties_.end()) {
    return PropertyValue{};
  }
  auto value = it->second.find(name);
  return value == it->second.end() ? PropertyValue{} : value->second;
}

void Renderer::releaseProperties(NodeHandle node) {
  auto it = properties_.find(node);
  if (it == properties_.end()) {
    return;
  }
  PropertyMap properties = std::move(it->second);
  properties_.erase(it);
  for (const auto& entry : properties) {
    if (entry.second.isEventHandler() && config_.isEventName(entry.first)) {
      host_.unsubscribeEvent(node, config_.eventTypeFor(entry.first), entry.second.getEventHandler());
    }
  }
}

void Renderer::destroyNode(NodeHandle node) {
  auto it = nodes_.find(node);
  if (it == nodes_.end()) {
    return;
  }
  Owner* owner = it->second.owner;
  nodes_.erase(it);
  auto owned = ownedNodes_.find(owner);
  if (owned != ownedNodes_.end()) {
    auto& list = owned->second;
    list.erase(std::remove(list.begin(), list.end(), node), list.end());
  }

  std::vector<NodeHandle> children;
  for (NodeHandle child = host_.getFirstChild(node); child.isValid(); child = host_.getNextSibling(child)) {
    children.push_back(child);
  }
  for (NodeHandle child : children) {
    auto record = nodes_.find(child);
    if (record != nodes_.end() && record->second.owner == owner) {
      destroyNode(child);
    } else {
      host_.removeNode(node, child);
    }
  }

  releaseProperties(node);

  const NodeHandle parent = host_.getParentNode(node);
  if (parent.isValid()) {
    host_.removeNode(parent, node);
  }
  destroyedNodes_.insert(node);
  host_.destroyNode(node);
}

void Renderer::deferDestroy(NodeHandle node) {
  Owner* regionOwner = currentOwnerOrRoot();
  std::weak_ptr<char> alive = lifetime_;
  deferToEndOfTurn([this, alive, node, regionOwner] {
    if (alive.expired()) {
      return;
    }
    auto it = nodes_.find(node);
    if (it == nodes_.end() || it->second.owner != regionOwner) {
      return;
    }
    if (host_.getParentNode(node).isValid()) {
      return;
    }
    destroyNode(node);
  });
}

void Renderer::destroyOwnedNodes(Owner* owner) {
  auto it = ownedNodes_.find(owner);
  if (it == ownedNodes_.end()) {
    return;
  }
  std::vector<NodeHandle> nodes = std::move(it->second);
  ownedNodes_.erase(it);

  std::exception_ptr firstError;
  for (auto node = nodes.rbegin(); node != nodes.rend(); ++node) {
    try {
      destroyNode(*node);
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
  }
  if (firstError) {
    std::rethrow_exception(firstError);
  }
}

bool Renderer::isLiveNode(NodeHandle node) const {
  return nodes_.count(node) != 0;
}

std::size_t Renderer::getLiveNodeCount() const noexcept {
  return nodes_.size();
}

const std::string* Renderer::getEngineText(NodeHandle node) const {
  auto it = nodes_.find(node);
  if (it == nodes_.end() || !it->second.isText) {
    return nullptr;
  }
  return &it->second.text;
}

bool Renderer::isEnginePlaceholder(NodeHandle node) const {
  auto it = nodes_.find(node);
  return it != nodes_.end() && it->second.isPlaceholder;
}

bool Renderer::wasDestroyed(NodeHandle node) const {
  return destroyedNodes_.count(node) != 0;
}

void Renderer::dispose() {
  runInTurn([this] {
    std::exception_ptr firstError;
    auto roots = std::move(renderRoots_);
    renderRoots_.clear();
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
      try {
        disposeRenderRoot(*it);
      } catch (...) {
        if (!firstError) {
          firstError = std::current_exception();
        }
      }
    }

    try {
      rootOwner_->dispose();
    } catch (...) {
      if (!firstError) {
        firstError = std::current_exception();
      }
    }
    rootOwner_ = std::make_unique<Owner>();

    if (firstError) {
      std::rethrow_exception(firstError);
    }
  });
}

} // namespace weft
