#pragma once

#include "WeftHost/WeftNodeHandle.h"
#include "WeftReconciler/WeftRenderable.h"
#include "WeftReconciler/WeftRenderedRegion.h"

#include <cstddef>
#include <vector>

namespace weft {

class Renderer;

struct ArrayPatchOp {
  enum class Kind {
    Insert,
    Move,
    Remove,
  };

  Kind kind;
  NodeHandle node;
  // Sibling to insert before; NoNode means the region's marker.
  NodeHandle before{};
};

// Mutations turning one node sequence into another. Removals come first,
// followed by inserts and moves in the order they must be applied.
struct ArrayPatch {
  std::vector<ArrayPatchOp> ops{};

  [[nodiscard]] std::size_t count(ArrayPatchOp::Kind kind) const noexcept;
};

const char* arrayPatchOpName(ArrayPatchOp::Kind kind);

// Unkeyed diff by node identity. Nodes outside the longest run that is
// already in order are moved once each. Throws std::invalid_argument when
// `next` holds the same node twice.
ArrayPatch diffNodeSequences(const std::vector<NodeHandle>& previous, const std::vector<NodeHandle>& next);

// Positions in `sources` (old indices, -1 for new entries) that form the
// longest strictly increasing run.
std::vector<bool> longestIncreasingRun(const std::vector<long>& sources);

// Flattens `values` into nodes. Producers are invoked, empty and boolean
// entries skipped. Text reuses an unclaimed engine text node of `previous`
// with the same content before a new one is created.
std::vector<NodeHandle> normalizeIncomingArray(
    Renderer& renderer,
    const RenderableList& values,
    const std::vector<NodeHandle>& previous);

void applyArrayPatch(Renderer& renderer, NodeHandle parent, const ArrayPatch& patch, const InsertionMarker& marker);

std::vector<NodeHandle> reconcileArrays(
    Renderer& renderer,
    NodeHandle parent,
    const std::vector<NodeHandle>& previous,
    const RenderableList& values,
    const InsertionMarker& marker);

} // namespace weft
