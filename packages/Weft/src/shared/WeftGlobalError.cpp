#include "shared/WeftGlobalError.h"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace weft {

namespace {

GlobalErrorHandler& currentHandler() {
  static GlobalErrorHandler handler;
  return handler;
}

void writeErrorMessage(const std::string& message) {
  const auto& handler = currentHandler();
  if (handler) {
    handler(message);
    return;
  }
  std::cerr << "Weft global error: " << message << std::endl;
}

} // namespace

void reportGlobalError(const std::exception& ex) {
  writeErrorMessage(ex.what());
}

void reportGlobalError(const std::string& message) {
  writeErrorMessage(message);
}

void reportGlobalError() {
  writeErrorMessage("Unknown error");
}

GlobalErrorHandler setGlobalErrorHandler(GlobalErrorHandler handler) {
  return std::exchange(currentHandler(), std::move(handler));
}

} // namespace weft
