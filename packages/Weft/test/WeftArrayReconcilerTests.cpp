#include "WeftReconciler/WeftArrayReconciler.h"
#include "WeftTestSupport.h"

#include <algorithm>
#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

namespace weft::test {

namespace {

NodeHandle fakeNode(std::uint32_t index) {
  return NodeHandle{index, 1};
}

void testDiffFastPaths() {
  const NodeHandle a = fakeNode(1);
  const NodeHandle b = fakeNode(2);
  const NodeHandle c = fakeNode(3);
  const NodeHandle d = fakeNode(4);

  assert(diffNodeSequences({}, {}).ops.empty());
  assert(diffNodeSequences({a, b}, {a, b}).ops.empty());

  ArrayPatch fill = diffNodeSequences({}, {a, b});
  assert(fill.ops.size() == 2);
  assert(fill.count(ArrayPatchOp::Kind::Insert) == 2);
  assert(fill.ops[0].node == a && fill.ops[0].before == NoNode);

  ArrayPatch clear = diffNodeSequences({a, b}, {});
  assert(clear.count(ArrayPatchOp::Kind::Remove) == 2);

  ArrayPatch append = diffNodeSequences({a, b, c}, {a, b, c, d});
  assert(append.ops.size() == 1);
  assert(append.ops[0].kind == ArrayPatchOp::Kind::Insert);
  assert(append.ops[0].node == d);
  assert(append.ops[0].before == NoNode);

  ArrayPatch prepend = diffNodeSequences({b, c}, {a, b, c});
  assert(prepend.ops.size() == 1);
  assert(prepend.ops[0].before == b);

  ArrayPatch truncate = diffNodeSequences({a, b, c, d}, {a, b});
  assert(truncate.ops.size() == 2);
  assert(truncate.count(ArrayPatchOp::Kind::Remove) == 2);

  ArrayPatch middle = diffNodeSequences({a, b, c}, {a, c});
  assert(middle.ops.size() == 1);
  assert(middle.ops[0].kind == ArrayPatchOp::Kind::Remove);
  assert(middle.ops[0].node == b);
}

void testDiffGeneralPath() {
  const NodeHandle a = fakeNode(1);
  const NodeHandle b = fakeNode(2);
  const NodeHandle c = fakeNode(3);
  const NodeHandle d = fakeNode(4);

  // [a, b, c] -> [c, a, d]: a stays, c moves once, b goes, d comes.
  ArrayPatch patch = diffNodeSequences({a, b, c}, {c, a, d});
  assert(patch.count(ArrayPatchOp::Kind::Remove) == 1);
  assert(patch.count(ArrayPatchOp::Kind::Insert) == 1);
  assert(patch.count(ArrayPatchOp::Kind::Move) == 1);
  assert(patch.ops[0].kind == ArrayPatchOp::Kind::Remove && patch.ops[0].node == b);
  assert(patch.ops[1].kind == ArrayPatchOp::Kind::Insert && patch.ops[1].node == d && patch.ops[1].before == NoNode);
  assert(patch.ops[2].kind == ArrayPatchOp::Kind::Move && patch.ops[2].node == c && patch.ops[2].before == a);

  // Reversal keeps one node in place.
  std::vector<NodeHandle> forward;
  for (std::uint32_t index = 1; index <= 6; ++index) {
    forward.push_back(fakeNode(index));
  }
  std::vector<NodeHandle> backward(forward.rbegin(), forward.rend());
  ArrayPatch reversed = diffNodeSequences(forward, backward);
  assert(reversed.count(ArrayPatchOp::Kind::Move) == forward.size() - 1);
  assert(reversed.count(ArrayPatchOp::Kind::Insert) == 0);
  assert(reversed.count(ArrayPatchOp::Kind::Remove) == 0);

  // Swapping the ends of a long run moves two nodes at most.
  ArrayPatch swapped = diffNodeSequences({a, b, c, d}, {d, b, c, a});
  assert(swapped.count(ArrayPatchOp::Kind::Move) <= 2);

  bool threw = false;
  try {
    diffNodeSequences({a}, {b, b});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void testLongestIncreasingRun() {
  assert((longestIncreasingRun({2, 0, -1}) == std::vector<bool>{false, true, false}));
  assert((longestIncreasingRun({0, 3, 1, 2}) == std::vector<bool>{true, false, true, true}));
  assert((longestIncreasingRun({-1, -1}) == std::vector<bool>{false, false}));
  assert((longestIncreasingRun({0, 1, 2}) == std::vector<bool>{true, true, true}));
}

void testReconcileMatchesFreshRender() {
  RenderHarness harness;
  auto& host = harness.host;
  auto& renderer = harness.renderer;

  NodeHandle e1 = renderer.createElement("item");
  NodeHandle e2 = renderer.createElement("button");
  NodeHandle e3 = renderer.createElement("box");
  NodeHandle e4 = renderer.createElement("label");

  const std::vector<std::pair<RenderableList, RenderableList>> cases{
      {{"a", "b", "c", "d"}, {"d", "a", "x", "b"}},
      {{"a", true, "b"}, {nullptr, "b", "a", "a"}},
      {{}, {"q", 7}},
      {{"a", "b"}, {}},
      {{1.5, "z"}, {"z", 1.5, false}},
      {{e1, e2, "t", e3}, {e3, "t", e1, RenderableList{e4, "u"}, Renderable([] { return "p"; })}},
  };

  for (const auto& entry : cases) {
    NodeHandle parent = renderer.createElement("box");
    std::vector<NodeHandle> nodes = renderer.reconcile(parent, {}, entry.first);
    assert(describeChildren(host, parent) == describeValues(host, entry.first));

    nodes = renderer.reconcile(parent, nodes, entry.second);
    assert(describeChildren(host, parent) == describeValues(host, entry.second));
    assert(host.getChildren(parent) == nodes);
  }

  // e2 was dropped by the last case and belonged to the same owner.
  assert(!host.isAlive(e2));
  assert(!renderer.isLiveNode(e2));
}

void testReconcileJournal() {
  RenderHarness harness;
  auto& host = harness.host;
  auto& renderer = harness.renderer;
  NodeHandle parent = renderer.createElement("box");

  RenderableList values;
  std::vector<NodeHandle> items;
  for (int index = 0; index < 5; ++index) {
    items.push_back(renderer.createElement("item"));
    values.push_back(items.back());
  }
  std::vector<NodeHandle> nodes = renderer.reconcile(parent, {}, values);

  // Append one.
  host.clearJournal();
  NodeHandle extra = renderer.createElement("item");
  values.push_back(extra);
  nodes = renderer.reconcile(parent, nodes, values);
  assert(host.countOperations(HostOperationKind::Insert) == 1);
  assert(host.countOperations(HostOperationKind::Move) == 0);
  assert(host.countOperations(HostOperationKind::Remove) == 0);

  // Reverse: only moves, every node reused.
  host.clearJournal();
  RenderableList reversed(values.rbegin(), values.rend());
  nodes = renderer.reconcile(parent, nodes, reversed);
  assert(host.countOperations(HostOperationKind::Move) <= values.size() - 1);
  assert(host.countOperations(HostOperationKind::Insert) == 0);
  assert(host.countOperations(HostOperationKind::Remove) == 0);
  assert(host.countOperations(HostOperationKind::CreateElement) == 0);
  assert(host.countOperations(HostOperationKind::Destroy) == 0);
  assert(describeChildren(host, parent) == describeValues(host, reversed));

  // [a, b, c] -> [c, a, d]
  NodeHandle list = renderer.createElement("box");
  NodeHandle a = renderer.createElement("item");
  NodeHandle b = renderer.createElement("item");
  NodeHandle c = renderer.createElement("item");
  std::vector<NodeHandle> current = renderer.reconcile(list, {}, {a, b, c});
  host.clearJournal();
  NodeHandle d = renderer.createElement("item");
  current = renderer.reconcile(list, current, {c, a, d});
  assert((current == std::vector<NodeHandle>{c, a, d}));
  assert((host.getChildren(list) == std::vector<NodeHandle>{c, a, d}));
  assert(host.countOperations(HostOperationKind::CreateElement) == 1);
  assert(host.countOperations(HostOperationKind::Insert) == 1);
  assert(host.countOperations(HostOperationKind::Move) == 1);
  assert(host.countOperations(HostOperationKind::Remove) == 1);
  assert(host.countOperations(HostOperationKind::Destroy) == 1);
  assert(!host.isAlive(b));
  for (const auto& operation : host.getJournal()) {
    if (operation.kind == HostOperationKind::Move) {
      assert(operation.node == c);
    }
  }
}

void testTextReuse() {
  RenderHarness harness;
  auto& host = harness.host;
  auto& renderer = harness.renderer;
  NodeHandle parent = renderer.createElement("box");

  std::vector<NodeHandle> first = renderer.reconcile(parent, {}, {"x", "y", "x"});
  host.clearJournal();
  std::vector<NodeHandle> second = renderer.reconcile(parent, first, {"x", "x", "z"});
  assert(second[0] == first[0]);
  assert(second[1] == first[2]);
  assert(host.countOperations(HostOperationKind::CreateText) == 1);
  assert(host.countOperations(HostOperationKind::Destroy) == 1);
  assert(!host.isAlive(first[1]));
  assert((describeChildren(host, parent) == std::vector<std::string>{"#text{x}", "#text{x}", "#text{z}"}));

  // Markers after the region stay last.
  NodeHandle marked = renderer.createElement("box");
  NodeHandle marker = renderer.createElement("item");
  renderer.insertNode(marked, marker);
  std::vector<NodeHandle> region = renderer.reconcile(marked, {}, {"a", "b"}, InsertionMarker::before(marker));
  region = renderer.reconcile(marked, region, {"b", "c", "a"}, InsertionMarker::before(marker));
  assert((describeChildren(host, marked) ==
          std::vector<std::string>{"#text{b}", "#text{c}", "#text{a}", "<item>"}));
}

void testTextReuseDisabled() {
  RendererConfig config;
  config.reuseTextNodes = false;
  MemoryHostTree host({"box"});
  Renderer renderer(host, config);
  NodeHandle parent = renderer.createElement("box");

  std::vector<NodeHandle> first = renderer.reconcile(parent, {}, {"x", "y"});
  host.clearJournal();
  std::vector<NodeHandle> second = renderer.reconcile(parent, first, {"x", "y"});
  assert(second[0] != first[0]);
  assert(second[1] != first[1]);
  assert(host.countOperations(HostOperationKind::CreateText) == 2);
  assert(host.countOperations(HostOperationKind::Destroy) == 2);
  assert((describeChildren(host, parent) == std::vector<std::string>{"#text{x}", "#text{y}"}));
}

void testDuplicateNodeRejected() {
  RenderHarness harness;
  auto& renderer = harness.renderer;
  NodeHandle parent = renderer.createElement("box");
  NodeHandle item = renderer.createElement("item");

  bool threw = false;
  try {
    renderer.reconcile(parent, {}, {item, "x", item});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(harness.host.getChildren(parent).empty());
}

} // namespace

bool runWeftArrayReconcilerTests() {
  testDiffFastPaths();
  testDiffGeneralPath();
  testLongestIncreasingRun();
  testReconcileMatchesFreshRender();
  testReconcileJournal();
  testTextReuse();
  testTextReuseDisabled();
  testDuplicateNodeRejected();
  return true;
}

} // namespace weft::test
