#pragma once

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>

namespace stagehand {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

template <YamlParsable T>
[[nodiscard]] auto yaml_get_optional(const YAML::Node& node,
                                     std::string_view key)
    -> std::optional<T> {
  auto field = node[std::string(key)];
  if (!field || !field.IsScalar()) {
    return std::nullopt;
  }
  T value{};
  if (!YAML::convert<T>::decode(field, value)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace stagehand
