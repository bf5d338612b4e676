#pragma once

#include "WeftHost/WeftNodeHandle.h"
#include "WeftReconciler/WeftRenderable.h"
#include "WeftReconciler/WeftRenderedRegion.h"

#include <unordered_set>

namespace weft {

class Renderer;

/**
 * Brings the region `current` in `parent` up to date with `value` and returns
 * the new region. Producers are invoked in place. Text is replaced in place
 * when the region already holds a text node; lists go through the array
 * reconciler when the region is a sequence. Any other change tears the old
 * region down and materializes the new value where the old one was.
 */
RenderedRegion insertExpression(
    Renderer& renderer,
    NodeHandle parent,
    const Renderable& value,
    const InsertionMarker& marker,
    RenderedRegion current);

// Removes the region's nodes from `parent` and schedules their destruction.
// Nodes in `keep` stay where they are.
void teardownRegion(
    Renderer& renderer,
    NodeHandle parent,
    const RenderedRegion& region,
    const std::unordered_set<NodeHandle>& keep = {});

// Drops nodes the renderer destroyed since the region was built.
RenderedRegion pruneDestroyedNodes(const Renderer& renderer, RenderedRegion region);

} // namespace weft
