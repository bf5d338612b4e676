#include "WeftReconciler/WeftArrayReconciler.h"

#include "WeftRuntime/WeftRenderer.h"

#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace weft {

namespace {

struct FlatItem {
  NodeHandle node{};
  std::string text{};
  bool isText{false};
};

void flattenInto(const Renderable& value, std::vector<FlatItem>& out) {
  Renderable resolved = unwrapProducers(value);
  switch (resolved.getKind()) {
    case RenderableKind::Empty:
    case RenderableKind::Bool:
      return;
    case RenderableKind::Number:
    case RenderableKind::String:
      out.push_back(FlatItem{NoNode, valueToText(resolved), true});
      return;
    case RenderableKind::Node:
      out.push_back(FlatItem{resolved.getNode(), {}, false});
      return;
    case RenderableKind::List:
      for (const auto& item : resolved.getList()) {
        flattenInto(item, out);
      }
      return;
    default:
      throw std::invalid_argument(
          std::string("Unsupported renderable kind: ") + renderableKindName(resolved.getKind()));
  }
}

void appendInsert(ArrayPatch& patch, NodeHandle node, NodeHandle before) {
  patch.ops.push_back(ArrayPatchOp{ArrayPatchOp::Kind::Insert, node, before});
}

void appendRemove(ArrayPatch& patch, NodeHandle node) {
  patch.ops.push_back(ArrayPatchOp{ArrayPatchOp::Kind::Remove, node, NoNode});
}

void ensureUnique(const std::vector<NodeHandle>& next) {
  std::unordered_set<NodeHandle> seen;
  seen.reserve(next.size());
  for (NodeHandle node : next) {
    if (!seen.insert(node).second) {
      throw std::invalid_argument("Node " + node.debugDescription() + " appears twice in one sequence");
    }
  }
}

} // namespace

std::size_t ArrayPatch::count(ArrayPatchOp::Kind kind) const noexcept {
  std::size_t total = 0;
  for (const auto& op : ops) {
    if (op.kind == kind) {
      ++total;
    }
  }
  return total;
}

const char* arrayPatchOpName(ArrayPatchOp::Kind kind) {
  switch (kind) {
    case ArrayPatchOp::Kind::Insert:
      return "insert";
    case ArrayPatchOp::Kind::Move:
      return "move";
    case ArrayPatchOp::Kind::Remove:
      return "remove";
    default:
      return "unknown";
  }
}

std::vector<bool> longestIncreasingRun(const std::vector<long>& sources) {
  std::vector<bool> inRun(sources.size(), false);
  // tails[k] is the position ending the smallest-valued run of length k + 1.
  std::vector<std::size_t> tails;
  std::vector<long> predecessors(sources.size(), -1);

  for (std::size_t i = 0; i < sources.size(); ++i) {
    const long value = sources[i];
    if (value < 0) {
      continue;
    }
    std::size_t low = 0;
    std::size_t high = tails.size();
    while (low < high) {
      const std::size_t mid = (low + high) / 2;
      if (sources[tails[mid]] < value) {
        low = mid + 1;
      } else {
        high = mid;
      }
    }
    if (low > 0) {
      predecessors[i] = static_cast<long>(tails[low - 1]);
    }
    if (low == tails.size()) {
      tails.push_back(i);
    } else {
      tails[low] = i;
    }
  }

  if (tails.empty()) {
    return inRun;
  }
  long cursor = static_cast<long>(tails.back());
  while (cursor >= 0) {
    inRun[static_cast<std::size_t>(cursor)] = true;
    cursor = predecessors[static_cast<std::size_t>(cursor)];
  }
  return inRun;
}

ArrayPatch diffNodeSequences(const std::vector<NodeHandle>& previous, const std::vector<NodeHandle>& next) {
  ensureUnique(next);

  ArrayPatch patch;
  if (previous.empty() && next.empty()) {
    return patch;
  }
  if (previous.empty()) {
    for (NodeHandle node : next) {
      appendInsert(patch, node, NoNode);
    }
    return patch;
  }
  if (next.empty()) {
    for (NodeHandle node : previous) {
      appendRemove(patch, node);
    }
    return patch;
  }

  std::size_t start = 0;
  std::size_t endPrevious = previous.size();
  std::size_t endNext = next.size();
  while (start < endPrevious && start < endNext && previous[start] == next[start]) {
    ++start;
  }
  while (endPrevious > start && endNext > start && previous[endPrevious - 1] == next[endNext - 1]) {
    --endPrevious;
    --endNext;
  }

  const NodeHandle tailAnchor = endNext < next.size() ? next[endNext] : NoNode;

  if (start == endPrevious) {
    for (std::size_t i = start; i < endNext; ++i) {
      appendInsert(patch, next[i], tailAnchor);
    }
    return patch;
  }
  if (start == endNext) {
    for (std::size_t i = start; i < endPrevious; ++i) {
      appendRemove(patch, previous[i]);
    }
    return patch;
  }

  const std::size_t windowSize = endNext - start;
  std::unordered_map<NodeHandle, std::size_t> targetIndex;
  targetIndex.reserve(windowSize);
  for (std::size_t i = start; i < endNext; ++i) {
    targetIndex.emplace(next[i], i - start);
  }

  std::vector<long> sources(windowSize, -1);
  for (std::size_t i = start; i < endPrevious; ++i) {
    auto it = targetIndex.find(previous[i]);
    if (it == targetIndex.end()) {
      appendRemove(patch, previous[i]);
      continue;
    }
    sources[it->second] = static_cast<long>(i - start);
  }

  const std::vector<bool> stays = longestIncreasingRun(sources);

  NodeHandle anchor = tailAnchor;
  for (std::size_t offset = windowSize; offset > 0; --offset) {
    const std::size_t position = offset - 1;
    const NodeHandle node = next[start + position];
    if (sources[position] < 0) {
      appendInsert(patch, node, anchor);
    } else if (!stays[position]) {
      patch.ops.push_back(ArrayPatchOp{ArrayPatchOp::Kind::Move, node, anchor});
    }
    anchor = node;
  }
  return patch;
}

std::vector<NodeHandle> normalizeIncomingArray(
    Renderer& renderer,
    const RenderableList& values,
    const std::vector<NodeHandle>& previous) {
  std::vector<FlatItem> items;
  for (const auto& value : values) {
    flattenInto(value, items);
  }

  std::map<std::string, std::deque<NodeHandle>> reusableText;
  if (renderer.getConfig().reuseTextNodes) {
    std::unordered_set<NodeHandle> explicitNodes;
    for (const auto& item : items) {
      if (!item.isText) {
        explicitNodes.insert(item.node);
      }
    }
    for (NodeHandle node : previous) {
      const std::string* text = renderer.getEngineText(node);
      if (text != nullptr && explicitNodes.count(node) == 0) {
        reusableText[*text].push_back(node);
      }
    }
  }

  std::vector<NodeHandle> nodes;
  nodes.reserve(items.size());
  for (auto& item : items) {
    if (!item.isText) {
      nodes.push_back(item.node);
      continue;
    }
    auto it = reusableText.find(item.text);
    if (it != reusableText.end() && !it->second.empty()) {
      nodes.push_back(it->second.front());
      it->second.pop_front();
      continue;
    }
    nodes.push_back(renderer.createTextNode(item.text));
  }
  return nodes;
}

void applyArrayPatch(Renderer& renderer, NodeHandle parent, const ArrayPatch& patch, const InsertionMarker& marker) {
  for (const auto& op : patch.ops) {
    const NodeHandle before = op.before.isValid() ? op.before : marker.getAnchor();
    switch (op.kind) {
      case ArrayPatchOp::Kind::Remove:
        renderer.removeNode(parent, op.node);
        renderer.deferDestroy(op.node);
        break;
      case ArrayPatchOp::Kind::Insert:
      case ArrayPatchOp::Kind::Move:
        renderer.insertNode(parent, op.node, before);
        break;
    }
  }
}

std::vector<NodeHandle> reconcileArrays(
    Renderer& renderer,
    NodeHandle parent,
    const std::vector<NodeHandle>& previous,
    const RenderableList& values,
    const InsertionMarker& marker) {
  std::vector<NodeHandle> next = normalizeIncomingArray(renderer, values, previous);
  const ArrayPatch patch = diffNodeSequences(previous, next);
  applyArrayPatch(renderer, parent, patch, marker);
  return next;
}

} // namespace weft
