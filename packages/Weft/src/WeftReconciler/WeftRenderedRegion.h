#pragma once

#include "WeftHost/WeftNodeHandle.h"

#include <string>
#include <utility>
#include <vector>

namespace weft {

// Where a region lives inside its parent.
class InsertionMarker {
public:
  enum class Mode {
    // The region is the parent's only content.
    Exclusive,
    // The region sits at the end of the parent, after any siblings.
    End,
    // The region sits right before an existing marker node.
    Before,
  };

  static InsertionMarker exclusive() {
    return InsertionMarker(Mode::Exclusive, NoNode);
  }

  static InsertionMarker end() {
    return InsertionMarker(Mode::End, NoNode);
  }

  static InsertionMarker before(NodeHandle node) {
    return node.isValid() ? InsertionMarker(Mode::Before, node) : end();
  }

  [[nodiscard]] Mode getMode() const noexcept {
    return mode_;
  }

  [[nodiscard]] bool isExclusive() const noexcept {
    return mode_ == Mode::Exclusive;
  }

  // Node new content is inserted before; NoNode appends.
  [[nodiscard]] NodeHandle getAnchor() const noexcept {
    return anchor_;
  }

private:
  InsertionMarker(Mode mode, NodeHandle anchor) : mode_(mode), anchor_(anchor) {}

  Mode mode_;
  NodeHandle anchor_;
};

struct RenderedRegion {
  enum class Kind {
    Empty,
    Text,
    Node,
    Sequence,
  };

  Kind kind{Kind::Empty};
  std::vector<NodeHandle> nodes{};
  // Current content of the text node when kind is Text.
  std::string text{};

  static RenderedRegion empty() {
    return RenderedRegion{};
  }

  static RenderedRegion textNode(NodeHandle node, std::string text) {
    return RenderedRegion{Kind::Text, {node}, std::move(text)};
  }

  static RenderedRegion singleNode(NodeHandle node) {
    return RenderedRegion{Kind::Node, {node}, {}};
  }

  static RenderedRegion sequence(std::vector<NodeHandle> nodes) {
    if (nodes.empty()) {
      return RenderedRegion{};
    }
    return RenderedRegion{Kind::Sequence, std::move(nodes), {}};
  }

  [[nodiscard]] bool isEmpty() const noexcept {
    return kind == Kind::Empty;
  }
};

const char* renderedRegionKindName(RenderedRegion::Kind kind);

} // namespace weft
