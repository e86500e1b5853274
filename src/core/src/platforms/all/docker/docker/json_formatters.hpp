#pragma once
#include <boost/json.hpp>
#include <core/docker.hpp>
#include <string>

namespace boost::json {

using namespace portman::core;

/**
 * The Engine is not consistent when it comes to missing fields: sometimes they are absent, sometimes `null`
 */
inline std::string string_or_empty(const object &obj, string_view key) {
  if (auto value = obj.if_contains(key)) {
    if (auto str = value->if_string()) {
      return std::string{str->data(), str->size()};
    }
  }
  return {};
}

inline docker::HostBinding tag_invoke(value_to_tag<docker::HostBinding>, value const &jv) {
  // ex: { "HostIp": "0.0.0.0", "HostPort": "8080" }
  object const &obj = jv.as_object();
  return docker::HostBinding{.host_ip = string_or_empty(obj, "HostIp"), .host_port = string_or_empty(obj, "HostPort")};
}

inline docker::BindingEntry tag_invoke(value_to_tag<docker::BindingEntry>, value const &jv) {
  if (auto bindings = jv.if_array(); bindings && !bindings->empty()) {
    std::vector<docker::HostBinding> result;
    for (const auto &binding : *bindings) {
      if (binding.is_object()) {
        result.push_back(value_to<docker::HostBinding>(binding));
      }
    }
    if (!result.empty()) {
      return result;
    }
  }
  return docker::NoHostBinding{}; // `null`, `[]` or something we can't make sense of
}

inline docker::NetworkSettings tag_invoke(value_to_tag<docker::NetworkSettings>, value const &jv) {
  /**
   * Format here is:

   "NetworkSettings": {
      "Ports": {
        "80/tcp": [
          { "HostIp": "0.0.0.0", "HostPort": "8080" },
          { "HostIp": "::", "HostPort": "8080" }
        ],
        "443/tcp": null
      }
    }
   */
  docker::NetworkSettings settings;
  auto obj = jv.if_object();
  if (!obj) {
    return settings;
  }

  auto network = obj->if_contains("NetworkSettings");
  if (!network || !network->is_object()) {
    return settings;
  }

  auto ports = network->as_object().if_contains("Ports");
  if (ports && ports->is_object()) { // This can be `null` in the APIs when the container has no network
    std::vector<docker::PortMapping> mappings;
    for (auto const &port : ports->as_object()) {
      mappings.push_back(docker::PortMapping{.container_port = std::string{port.key().data(), port.key().size()},
                                             .binding = value_to<docker::BindingEntry>(port.value())});
    }
    settings.ports = std::move(mappings);
  }
  return settings;
}

inline docker::ContainerSummary tag_invoke(value_to_tag<docker::ContainerSummary>, value const &jv) {
  object const &obj = jv.as_object();

  std::string name;
  if (auto names = obj.if_contains("Names"); names && names->is_array() && !names->as_array().empty()) {
    if (auto first = names->as_array()[0].if_string()) {
      name = std::string{first->data(), first->size()};
    }
  }

  return docker::ContainerSummary{.id = string_or_empty(obj, "Id"),
                                  .name = name,
                                  .image = string_or_empty(obj, "Image"),
                                  .status = string_or_empty(obj, "Status")};
}
} // namespace boost::json
