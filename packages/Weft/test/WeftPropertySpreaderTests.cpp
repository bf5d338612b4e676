#include "WeftReactive/WeftSignal.h"
#include "WeftReconciler/WeftPropertySpreader.h"
#include "WeftTestSupport.h"

#include <cassert>
#include <stdexcept>
#include <string>
#include <vector>

namespace weft::test {

namespace {

void testClassification() {
  RendererConfig config;
  assert(classifyProperty(config, "on:click") == PropertyCategory::Event);
  assert(classifyProperty(config, "onInput") == PropertyCategory::Event);
  assert(classifyProperty(config, "onMouseDown") == PropertyCategory::Event);
  assert(classifyProperty(config, "onHover") == PropertyCategory::Field);
  assert(classifyProperty(config, "on:") == PropertyCategory::Field);
  assert(classifyProperty(config, "style") == PropertyCategory::Style);
  assert(classifyProperty(config, "title") == PropertyCategory::Field);

  assert(config.eventTypeFor("on:click") == "click");
  assert(config.eventTypeFor("onKeyDown") == "keyDown");
  assert(config.eventTypeFor("onInput") == "input");

  RendererConfig custom;
  custom.eventPrefix = "@";
  custom.eventAliases.clear();
  custom.styleProperty = "css";
  assert(classifyProperty(custom, "@press") == PropertyCategory::Event);
  assert(classifyProperty(custom, "onInput") == PropertyCategory::Field);
  assert(classifyProperty(custom, "css") == PropertyCategory::Style);
  assert(classifyProperty(custom, "style") == PropertyCategory::Field);
}

void testIdempotentApplication() {
  RenderHarness harness;
  auto& host = harness.host;
  auto& renderer = harness.renderer;
  NodeHandle node = renderer.createElement("item");

  renderer.applyProperty(node, "title", PropertyValue("hello"), PropertyValue("hello"));
  const PropertyValue once = host.getField(node, "title");
  renderer.applyProperty(node, "title", PropertyValue("hello"), PropertyValue("hello"));
  assert(host.getField(node, "title") == once);
  assert(once == PropertyValue("hello"));

  EventHandler handler = makeEventHandler([](const HostEvent&) {});
  renderer.applyProperty(node, "on:click", handler, PropertyValue{});
  renderer.applyProperty(node, "on:click", handler, handler);
  renderer.applyProperty(node, "on:click", handler, handler);
  assert(host.getListenerCount(node, "click") == 1);

  StyleMapPtr style = makeStyleMap({{"color", "red"}, {"width", 10}});
  renderer.applyProperty(node, "style", style, PropertyValue{});
  renderer.applyProperty(node, "style", style, style);
  assert(host.getField(node, "color") == PropertyValue("red"));
  assert(host.getField(node, "width") == PropertyValue(10));
  assert(host.getField(node, "style").isEmpty());
}

void testEventSwap() {
  RenderHarness harness;
  auto& host = harness.host;
  auto& renderer = harness.renderer;
  NodeHandle button = renderer.createElement("button");

  std::vector<std::string> calls;
  EventHandler first = makeEventHandler([&](const HostEvent& event) { calls.push_back("first " + event.type); });
  EventHandler second = makeEventHandler([&](const HostEvent& event) { calls.push_back("second " + event.type); });

  renderer.setProp(button, "onInput", first);
  assert(host.getListenerCount(button, "input") == 1);
  host.dispatchEvent(button, HostEvent{"input", {}});

  host.clearJournal();
  renderer.setProp(button, "onInput", second);
  assert(host.getListenerCount(button, "input") == 1);
  assert(host.countOperations(HostOperationKind::Unsubscribe) == 1);
  assert(host.countOperations(HostOperationKind::Subscribe) == 1);
  assert(host.getJournal().front().kind == HostOperationKind::Unsubscribe);
  host.dispatchEvent(button, HostEvent{"input", {}});
  assert((calls == std::vector<std::string>{"first input", "second input"}));

  renderer.setProp(button, "onInput", PropertyValue{});
  assert(host.getListenerCount(button, "input") == 0);
  assert(renderer.getProp(button, "onInput").isEmpty());

  bool threw = false;
  try {
    renderer.setProp(button, "on:click", PropertyValue("not a handler"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void testStyleEntries() {
  RenderHarness harness;
  auto& host = harness.host;
  auto& renderer = harness.renderer;
  NodeHandle node = renderer.createElement("box");

  renderer.setProp(node, "style", makeStyleMap({{"color", "red"}, {"margin", 4}}));
  assert(host.getField(node, "color") == PropertyValue("red"));
  assert(host.getField(node, "margin") == PropertyValue(4));

  renderer.setProp(node, "style", makeStyleMap({{"color", "blue"}, {"on:click", "literal"}}));
  assert(host.getField(node, "color") == PropertyValue("blue"));
  assert(host.getField(node, "margin").isEmpty());
  // Style entries are plain fields even when they look like events.
  assert(host.getField(node, "on:click") == PropertyValue("literal"));
  assert(host.getListenerCount(node, "click") == 0);

  renderer.setProp(node, "style", PropertyValue{});
  assert(host.getField(node, "color").isEmpty());
  assert(host.getField(node, "on:click").isEmpty());

  // A plain style value is a field of its own and goes away once a map
  // replaces it.
  renderer.setProp(node, "style", "color: red");
  assert(host.getField(node, "style") == PropertyValue("color: red"));
  renderer.setProp(node, "style", makeStyleMap({{"color", "green"}}));
  assert(host.getField(node, "style").isEmpty());
  assert(host.getField(node, "color") == PropertyValue("green"));
}

void testSpread() {
  RenderHarness harness;
  auto& host = harness.host;
  auto& renderer = harness.renderer;
  NodeHandle node = renderer.createElement("item");
  Signal<bool> active(true);
  Signal<std::string> title("first");
  EventHandler onClick = makeEventHandler([](const HostEvent&) {});

  renderer.spread(node, [&] {
    PropertyMap props;
    props["title"] = title.get();
    if (active.get()) {
      props["on:click"] = onClick;
      props["checked"] = true;
    }
    return props;
  });
  assert(host.getField(node, "title") == PropertyValue("first"));
  assert(host.getField(node, "checked") == PropertyValue(true));
  assert(host.getListenerCount(node, "click") == 1);

  host.clearJournal();
  title.set("second");
  assert(host.getField(node, "title") == PropertyValue("second"));
  // Unchanged names are not re-applied.
  assert(host.getJournal().size() == 1);

  active.set(false);
  assert(host.getField(node, "checked").isEmpty());
  assert(host.getListenerCount(node, "click") == 0);
  assert(renderer.getProp(node, "on:click").isEmpty());
}

void testPropertyDiff() {
  PropertyMap previous{{"a", 1}, {"b", "x"}, {"c", true}};
  PropertyMap next{{"a", 1}, {"b", "y"}, {"d", 2.5}};
  std::vector<PropertyChange> changes = diffPropertyMaps(previous, next);
  assert(changes.size() == 3);
  for (const auto& change : changes) {
    if (change.name == "b") {
      assert(change.newValue == PropertyValue("y"));
      assert(change.previousValue == PropertyValue("x"));
    } else if (change.name == "c") {
      assert(change.newValue.isEmpty());
    } else {
      assert(change.name == "d");
      assert(change.previousValue.isEmpty());
    }
  }
}

} // namespace

bool runWeftPropertySpreaderTests() {
  testClassification();
  testIdempotentApplication();
  testEventSwap();
  testStyleEntries();
  testSpread();
  testPropertyDiff();
  return true;
}

} // namespace weft::test
