#pragma once

#include <exception>
#include <functional>
#include <string>

namespace weft {

using GlobalErrorHandler = std::function<void(const std::string&)>;

void reportGlobalError(const std::exception& ex);
void reportGlobalError(const std::string& message);
void reportGlobalError();

// Replaces the default stderr sink. Passing an empty handler restores it.
GlobalErrorHandler setGlobalErrorHandler(GlobalErrorHandler handler);

} // namespace weft
