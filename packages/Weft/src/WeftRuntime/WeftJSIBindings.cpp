#include "WeftRuntime/WeftJSIBindings.h"

#include "WeftReactive/WeftSignal.h"
#include "WeftRuntime/WeftRenderer.h"

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace weft {

namespace {

// A JS value held by a signal. Equality is JS strict equality.
struct ScriptValue {
  jsi::Runtime* runtime{nullptr};
  std::shared_ptr<jsi::Value> value{};

  bool operator==(const ScriptValue& other) const {
    if (!value || !other.value) {
      return value == other.value;
    }
    return jsi::Value::strictEquals(*runtime, *value, *other.value);
  }
};

ScriptValue makeScriptValue(jsi::Runtime& runtime, const jsi::Value& value) {
  return ScriptValue{&runtime, std::make_shared<jsi::Value>(runtime, value)};
}

const jsi::Value& argumentAt(const jsi::Value* args, size_t count, size_t index) {
  static const jsi::Value undefined = jsi::Value::undefined();
  return index < count ? args[index] : undefined;
}

NodeHandle requireNode(jsi::Runtime& runtime, const jsi::Value& value, const char* what) {
  NodeHandle node = nodeFromValue(runtime, value);
  if (!node.isValid()) {
    throw std::invalid_argument(std::string(what) + " must be a node");
  }
  return node;
}

std::string requireString(jsi::Runtime& runtime, const jsi::Value& value, const char* what) {
  if (!value.isString()) {
    throw std::invalid_argument(std::string(what) + " must be a string");
  }
  return value.getString(runtime).utf8(runtime);
}

jsi::Object eventToObject(jsi::Runtime& runtime, const HostEvent& event) {
  jsi::Object object(runtime);
  object.setProperty(runtime, "type", jsi::String::createFromUtf8(runtime, event.type));
  object.setProperty(runtime, "detail", jsi::String::createFromUtf8(runtime, event.detail));
  return object;
}

jsi::Function makeFunction(
    jsi::Runtime& runtime,
    const char* name,
    unsigned int paramCount,
    jsi::HostFunctionType body) {
  return jsi::Function::createFromHostFunction(
      runtime, jsi::PropNameID::forAscii(runtime, name), paramCount, std::move(body));
}

jsi::Array createSignalPair(jsi::Runtime& runtime, const jsi::Value& initial) {
  auto signal = std::make_shared<Signal<ScriptValue>>(makeScriptValue(runtime, initial));

  auto getter = makeFunction(runtime, "get", 0, [signal](jsi::Runtime& rt, const jsi::Value&, const jsi::Value*, size_t) {
    const ScriptValue& current = signal->get();
    return jsi::Value(rt, *current.value);
  });
  auto setter = makeFunction(
      runtime, "set", 1, [signal](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
        signal->set(makeScriptValue(rt, argumentAt(args, count, 0)));
        return jsi::Value::undefined();
      });

  jsi::Array pair(runtime, 2);
  pair.setValueAtIndex(runtime, 0, jsi::Value(runtime, getter));
  pair.setValueAtIndex(runtime, 1, jsi::Value(runtime, setter));
  return pair;
}

} // namespace

jsi::Value NodeHostObject::get(jsi::Runtime& runtime, const jsi::PropNameID& name) {
  const auto property = name.utf8(runtime);
  if (property == "handle") {
    return jsi::String::createFromUtf8(runtime, node_.debugDescription());
  }
  return jsi::Value::undefined();
}

std::vector<jsi::PropNameID> NodeHostObject::getPropertyNames(jsi::Runtime& runtime) {
  std::vector<jsi::PropNameID> names;
  names.push_back(jsi::PropNameID::forAscii(runtime, "handle"));
  return names;
}

jsi::Value createNodeValue(jsi::Runtime& runtime, NodeHandle node) {
  auto host = std::make_shared<NodeHostObject>(node);
  return jsi::Value(runtime, jsi::Object::createFromHostObject(runtime, host));
}

NodeHandle nodeFromValue(jsi::Runtime& runtime, const jsi::Value& value) {
  if (!value.isObject()) {
    return NoNode;
  }
  auto object = value.getObject(runtime);
  if (!object.isHostObject(runtime)) {
    return NoNode;
  }
  auto typed = std::dynamic_pointer_cast<NodeHostObject>(runtime.getHostObject(object));
  return typed ? typed->node() : NoNode;
}

Renderable toRenderable(jsi::Runtime& runtime, const jsi::Value& value) {
  if (value.isUndefined() || value.isNull()) {
    return Renderable{};
  }
  if (value.isBool()) {
    return Renderable(value.getBool());
  }
  if (value.isNumber()) {
    return Renderable(value.getNumber());
  }
  if (value.isString()) {
    return Renderable(value.getString(runtime).utf8(runtime));
  }
  if (!value.isObject()) {
    throw std::invalid_argument("Unsupported script value in render position");
  }

  auto object = value.getObject(runtime);
  if (object.isFunction(runtime)) {
    auto fn = std::make_shared<jsi::Function>(object.getFunction(runtime));
    return Renderable(Producer([&runtime, fn]() { return toRenderable(runtime, fn->call(runtime)); }));
  }
  if (object.isArray(runtime)) {
    auto array = object.getArray(runtime);
    const size_t length = array.size(runtime);
    RenderableList items;
    items.reserve(length);
    for (size_t index = 0; index < length; ++index) {
      items.push_back(toRenderable(runtime, array.getValueAtIndex(runtime, index)));
    }
    return Renderable(std::move(items));
  }
  NodeHandle node = nodeFromValue(runtime, value);
  if (node.isValid()) {
    return Renderable(node);
  }
  throw std::invalid_argument("Unsupported script object in render position");
}

PropertyValue toPropertyValue(jsi::Runtime& runtime, const jsi::Value& value) {
  if (value.isUndefined() || value.isNull()) {
    return PropertyValue{};
  }
  if (value.isBool()) {
    return PropertyValue(value.getBool());
  }
  if (value.isNumber()) {
    return PropertyValue(value.getNumber());
  }
  if (value.isString()) {
    return PropertyValue(value.getString(runtime).utf8(runtime));
  }
  if (!value.isObject()) {
    throw std::invalid_argument("Unsupported script value for a property");
  }

  auto object = value.getObject(runtime);
  if (object.isFunction(runtime)) {
    auto fn = std::make_shared<jsi::Function>(object.getFunction(runtime));
    return PropertyValue(makeEventHandler([&runtime, fn](const HostEvent& event) {
      fn->call(runtime, eventToObject(runtime, event));
    }));
  }
  if (object.isArray(runtime) || object.isHostObject(runtime)) {
    throw std::invalid_argument("Unsupported script object for a property");
  }

  std::map<std::string, PropertyValue> entries;
  auto names = object.getPropertyNames(runtime);
  const size_t length = names.size(runtime);
  for (size_t index = 0; index < length; ++index) {
    auto nameValue = names.getValueAtIndex(runtime, index);
    if (!nameValue.isString()) {
      continue;
    }
    const auto name = nameValue.getString(runtime).utf8(runtime);
    entries.emplace(name, toPropertyValue(runtime, object.getProperty(runtime, name.c_str())));
  }
  return PropertyValue(makeStyleMap(std::move(entries)));
}

void installWeftBindings(jsi::Runtime& runtime, Renderer& renderer) {
  jsi::Object weft(runtime);

  auto set = [&runtime, &weft](const char* name, jsi::Function fn) {
    weft.setProperty(runtime, name, jsi::Value(runtime, fn));
  };

  set("createElement",
      makeFunction(runtime, "createElement", 1, [&renderer](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
        const auto tag = requireString(rt, argumentAt(args, count, 0), "createElement tag");
        return createNodeValue(rt, renderer.createElement(tag));
      }));

  set("createTextNode",
      makeFunction(runtime, "createTextNode", 1, [&renderer](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
        const auto text = requireString(rt, argumentAt(args, count, 0), "createTextNode text");
        return createNodeValue(rt, renderer.createTextNode(text));
      }));

  set("insert",
      makeFunction(runtime, "insert", 3, [&renderer](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
        NodeHandle parent = requireNode(rt, argumentAt(args, count, 0), "insert parent");
        Renderable value = toRenderable(rt, argumentAt(args, count, 1));
        const jsi::Value& markerValue = argumentAt(args, count, 2);
        InsertionMarker marker = markerValue.isUndefined() || markerValue.isNull()
            ? InsertionMarker::end()
            : InsertionMarker::before(requireNode(rt, markerValue, "insert marker"));
        renderer.insert(parent, std::move(value), marker);
        return jsi::Value::undefined();
      }));

  set("setProp",
      makeFunction(runtime, "setProp", 3, [&renderer](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
        NodeHandle node = requireNode(rt, argumentAt(args, count, 0), "setProp node");
        const auto name = requireString(rt, argumentAt(args, count, 1), "setProp name");
        renderer.setProp(node, name, toPropertyValue(rt, argumentAt(args, count, 2)));
        return jsi::Value::undefined();
      }));

  set("createSignal",
      makeFunction(runtime, "createSignal", 1, [](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
        return jsi::Value(rt, createSignalPair(rt, argumentAt(args, count, 0)));
      }));

  set("render",
      makeFunction(runtime, "render", 2, [&renderer](jsi::Runtime& rt, const jsi::Value&, const jsi::Value* args, size_t count) {
        const jsi::Value& code = argumentAt(args, count, 0);
        if (!code.isObject() || !code.getObject(rt).isFunction(rt)) {
          throw std::invalid_argument("render expects a function");
        }
        NodeHandle container = requireNode(rt, argumentAt(args, count, 1), "render container");
        Renderable producer = toRenderable(rt, code);
        auto disposer = std::make_shared<Renderer::Disposer>(renderer.render(producer.getProducer(), container));
        return jsi::Value(
            rt,
            makeFunction(rt, "dispose", 0, [disposer](jsi::Runtime&, const jsi::Value&, const jsi::Value*, size_t) {
              (*disposer)();
              return jsi::Value::undefined();
            }));
      }));

  runtime.global().setProperty(runtime, "weft", weft);
}

} // namespace weft
