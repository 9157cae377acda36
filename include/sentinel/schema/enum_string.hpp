#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Name <-> value lookup over constexpr mapping tables. Each enum header
// provides its own table plus try_from_string / to_string wrappers.
namespace sentinel::schema {

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// "a|b|c" listing of every name in a mapping table, for CLI help and errors.
template <typename Enum, std::size_t N>
std::string joined_names(
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  auto out = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    if (!out.empty()) {
      out.push_back('|');
    }
    out.append(name);
  }
  return out;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace sentinel::schema
