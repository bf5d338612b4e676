#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace weft {

// Opaque reference to a node owned by a HostTree. The engine only compares
// handles by identity and passes them back to the host.
struct NodeHandle {
  std::uint32_t index{0};
  std::uint32_t generation{0};

  [[nodiscard]] constexpr bool isValid() const noexcept {
    return generation != 0;
  }

  explicit constexpr operator bool() const noexcept {
    return isValid();
  }

  [[nodiscard]] std::string debugDescription() const {
    if (!isValid()) {
      return "#none";
    }
    return "#" + std::to_string(index) + "." + std::to_string(generation);
  }
};

constexpr bool operator==(NodeHandle a, NodeHandle b) noexcept {
  return a.index == b.index && a.generation == b.generation;
}

constexpr bool operator!=(NodeHandle a, NodeHandle b) noexcept {
  return !(a == b);
}

inline constexpr NodeHandle NoNode{};

enum class PlaceholderContext : std::uint8_t {
  Sequence = 0,
  Text = 1,
};

constexpr const char* placeholderContextName(PlaceholderContext context) {
  switch (context) {
    case PlaceholderContext::Sequence:
      return "sequence";
    case PlaceholderContext::Text:
      return "text";
    default:
      return "unknown";
  }
}

} // namespace weft

namespace std {

template <>
struct hash<weft::NodeHandle> {
  std::size_t operator()(const weft::NodeHandle& handle) const noexcept {
    const std::uint64_t packed =
        (static_cast<std::uint64_t>(handle.generation) << 32) | handle.index;
    return std::hash<std::uint64_t>{}(packed);
  }
};

} // namespace std
