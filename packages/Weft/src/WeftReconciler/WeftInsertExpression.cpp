#include "WeftReconciler/WeftInsertExpression.h"

#include "WeftReconciler/WeftArrayReconciler.h"
#include "WeftRuntime/WeftRenderer.h"
#include "shared/WeftFeatureFlags.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace weft {

namespace {

// First node of the region still under `parent` that is not part of the new
// content, or the marker's anchor.
NodeHandle regionAnchor(
    const Renderer& renderer,
    NodeHandle parent,
    const RenderedRegion& region,
    const InsertionMarker& marker,
    const std::unordered_set<NodeHandle>& incoming) {
  for (NodeHandle node : region.nodes) {
    if (incoming.count(node) != 0) {
      continue;
    }
    if (renderer.getHost().getParentNode(node) == parent) {
      return node;
    }
  }
  return marker.getAnchor();
}

bool isLonePlaceholder(const Renderer& renderer, const RenderedRegion& region) {
  return region.kind == RenderedRegion::Kind::Sequence && region.nodes.size() == 1 &&
      renderer.isEnginePlaceholder(region.nodes.front());
}

RenderedRegion cleanRegion(
    Renderer& renderer,
    NodeHandle parent,
    const RenderedRegion& current,
    const InsertionMarker& marker) {
  if (current.isEmpty() || isLonePlaceholder(renderer, current)) {
    return current;
  }

  if (enableEmptyRegionPlaceholder && marker.getMode() == InsertionMarker::Mode::End) {
    const PlaceholderContext context =
        renderer.getHost().isTextNode(parent) ? PlaceholderContext::Text : PlaceholderContext::Sequence;
    NodeHandle placeholder = renderer.createPlaceholder(context);
    renderer.insertNode(parent, placeholder, regionAnchor(renderer, parent, current, marker, {}));
    teardownRegion(renderer, parent, current);
    return RenderedRegion::sequence({placeholder});
  }

  teardownRegion(renderer, parent, current);
  return RenderedRegion::empty();
}

RenderedRegion insertText(
    Renderer& renderer,
    NodeHandle parent,
    std::string text,
    const InsertionMarker& marker,
    RenderedRegion current) {
  if (current.kind == RenderedRegion::Kind::Text) {
    if (current.text != text) {
      renderer.replaceText(current.nodes.front(), text);
      current.text = std::move(text);
    }
    return current;
  }

  NodeHandle node = renderer.createTextNode(text);
  renderer.insertNode(parent, node, regionAnchor(renderer, parent, current, marker, {}));
  teardownRegion(renderer, parent, current);
  return RenderedRegion::textNode(node, std::move(text));
}

RenderedRegion insertSingleNode(
    Renderer& renderer,
    NodeHandle parent,
    NodeHandle node,
    const InsertionMarker& marker,
    const RenderedRegion& current) {
  if (!node.isValid()) {
    throw std::invalid_argument("Cannot insert an invalid node handle");
  }
  if (current.kind == RenderedRegion::Kind::Node && current.nodes.front() == node &&
      renderer.getHost().getParentNode(node) == parent) {
    return current;
  }

  const std::unordered_set<NodeHandle> incoming{node};
  renderer.insertNode(parent, node, regionAnchor(renderer, parent, current, marker, incoming));
  teardownRegion(renderer, parent, current, incoming);
  return RenderedRegion::singleNode(node);
}

RenderedRegion insertList(
    Renderer& renderer,
    NodeHandle parent,
    const RenderableList& values,
    const InsertionMarker& marker,
    const RenderedRegion& current) {
  const bool isSequence = current.kind == RenderedRegion::Kind::Sequence;
  const std::vector<NodeHandle> previous = isSequence ? current.nodes : std::vector<NodeHandle>{};
  std::vector<NodeHandle> nodes = normalizeIncomingArray(renderer, values, previous);

  if (nodes.empty()) {
    return cleanRegion(renderer, parent, current, marker);
  }

  if (isSequence || current.isEmpty()) {
    applyArrayPatch(renderer, parent, diffNodeSequences(previous, nodes), marker);
    return RenderedRegion::sequence(std::move(nodes));
  }

  const std::unordered_set<NodeHandle> incoming(nodes.begin(), nodes.end());
  if (incoming.size() != nodes.size()) {
    throw std::invalid_argument("The same node appears twice in one sequence");
  }
  const NodeHandle anchor = regionAnchor(renderer, parent, current, marker, incoming);
  for (NodeHandle node : nodes) {
    renderer.insertNode(parent, node, anchor);
  }
  teardownRegion(renderer, parent, current, incoming);
  return RenderedRegion::sequence(std::move(nodes));
}

} // namespace

const char* renderedRegionKindName(RenderedRegion::Kind kind) {
  switch (kind) {
    case RenderedRegion::Kind::Empty:
      return "empty";
    case RenderedRegion::Kind::Text:
      return "text";
    case RenderedRegion::Kind::Node:
      return "node";
    case RenderedRegion::Kind::Sequence:
      return "sequence";
    default:
      return "unknown";
  }
}

void teardownRegion(
    Renderer& renderer,
    NodeHandle parent,
    const RenderedRegion& region,
    const std::unordered_set<NodeHandle>& keep) {
  for (NodeHandle node : region.nodes) {
    if (keep.count(node) != 0) {
      continue;
    }
    if (renderer.getHost().getParentNode(node) == parent) {
      renderer.removeNode(parent, node);
    }
    renderer.deferDestroy(node);
  }
}

RenderedRegion pruneDestroyedNodes(const Renderer& renderer, RenderedRegion region) {
  auto& nodes = region.nodes;
  nodes.erase(
      std::remove_if(nodes.begin(), nodes.end(), [&](NodeHandle node) { return renderer.wasDestroyed(node); }),
      nodes.end());
  if (nodes.empty()) {
    return RenderedRegion::empty();
  }
  return region;
}

RenderedRegion insertExpression(
    Renderer& renderer,
    NodeHandle parent,
    const Renderable& value,
    const InsertionMarker& marker,
    RenderedRegion current) {
  current = pruneDestroyedNodes(renderer, std::move(current));
  const Renderable resolved = unwrapProducers(value);

  switch (resolved.getKind()) {
    case RenderableKind::Empty:
    case RenderableKind::Bool:
      return cleanRegion(renderer, parent, current, marker);
    case RenderableKind::Number:
    case RenderableKind::String:
      return insertText(renderer, parent, valueToText(resolved), marker, std::move(current));
    case RenderableKind::Node:
      return insertSingleNode(renderer, parent, resolved.getNode(), marker, current);
    case RenderableKind::List:
      return insertList(renderer, parent, resolved.getList(), marker, current);
    default:
      throw std::invalid_argument(
          std::string("Unsupported renderable kind: ") + renderableKindName(resolved.getKind()));
  }
}

} // namespace weft
