#include "WeftReconciler/WeftRenderable.h"

#include "shared/WeftNumberFormat.h"

#include <stdexcept>

namespace weft {

namespace {

[[noreturn]] void throwWrongKind(const Renderable& value, const char* expected) {
  throw std::invalid_argument(
      std::string("Renderable is ") + renderableKindName(value.getKind()) + ", expected " + expected);
}

} // namespace

const char* renderableKindName(RenderableKind kind) {
  switch (kind) {
    case RenderableKind::Empty:
      return "empty";
    case RenderableKind::Bool:
      return "boolean";
    case RenderableKind::Number:
      return "number";
    case RenderableKind::String:
      return "string";
    case RenderableKind::Node:
      return "node";
    case RenderableKind::List:
      return "list";
    case RenderableKind::Producer:
      return "producer";
    default:
      return "unknown";
  }
}

RenderableKind Renderable::getKind() const noexcept {
  switch (storage_.index()) {
    case 1:
      return RenderableKind::Bool;
    case 2:
      return RenderableKind::Number;
    case 3:
      return RenderableKind::String;
    case 4:
      return RenderableKind::Node;
    case 5:
      return RenderableKind::List;
    case 6:
      return RenderableKind::Producer;
    default:
      return RenderableKind::Empty;
  }
}

bool Renderable::getBool() const {
  if (!isBool()) {
    throwWrongKind(*this, "boolean");
  }
  return std::get<bool>(storage_);
}

double Renderable::getNumber() const {
  if (!isNumber()) {
    throwWrongKind(*this, "number");
  }
  return std::get<double>(storage_);
}

const std::string& Renderable::getString() const {
  if (!isString()) {
    throwWrongKind(*this, "string");
  }
  return std::get<std::string>(storage_);
}

NodeHandle Renderable::getNode() const {
  if (!isNode()) {
    throwWrongKind(*this, "node");
  }
  return std::get<NodeHandle>(storage_);
}

const RenderableList& Renderable::getList() const {
  if (!isList()) {
    throwWrongKind(*this, "list");
  }
  return std::get<RenderableList>(storage_);
}

const Producer& Renderable::getProducer() const {
  if (!isProducer()) {
    throwWrongKind(*this, "producer");
  }
  return std::get<Producer>(storage_);
}

std::string valueToText(const Renderable& value) {
  if (value.isString()) {
    return value.getString();
  }
  if (value.isNumber()) {
    return numberToString(value.getNumber());
  }
  throwWrongKind(value, "string or number");
}

bool isDynamic(const Renderable& value) {
  if (value.isProducer()) {
    return true;
  }
  if (!value.isList()) {
    return false;
  }
  for (const auto& item : value.getList()) {
    if (isDynamic(item)) {
      return true;
    }
  }
  return false;
}

Renderable unwrapProducers(Renderable value) {
  while (value.isProducer()) {
    Producer producer = value.getProducer();
    if (!producer) {
      throw std::invalid_argument("Producer holds no function");
    }
    value = producer();
  }
  return value;
}

} // namespace weft
