#include <algorithm>
#include <charconv>
#include <core/ports.hpp>
#include <docker/formatters.hpp>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <ports/formatters.hpp>
#include <set>
#include <type_traits>
#include <variant>

namespace portman::core::ports {

std::optional<int> parse_port(std::string_view raw_port) {
  if (raw_port.empty() || raw_port.size() > 5) {
    return {};
  }

  int port = 0;
  auto [ptr, ec] = std::from_chars(raw_port.data(), raw_port.data() + raw_port.size(), port);
  if (ec != std::errc() || ptr != raw_port.data() + raw_port.size() || !is_valid_port(port)) {
    return {};
  }
  return port;
}

std::string normalize_name(std::string_view name) {
  if (!name.empty() && name.front() == '/') {
    name.remove_prefix(1);
  }
  return std::string{name};
}

std::string short_id(std::string_view id) {
  return std::string{id.substr(0, SHORT_ID_LENGTH)};
}

/**
 * Turns a single container port entry into bindings, anything that isn't bound on the host is dropped
 */
static std::vector<PortBinding> to_bindings(const docker::PortMapping &mapping, std::string_view container_name) {
  std::vector<PortBinding> result;
  std::visit(
      [&](auto &&entry) {
        using T = std::decay_t<decltype(entry)>;
        if constexpr (std::is_same_v<T, std::vector<docker::HostBinding>>) {
          for (const auto &host_binding : entry) {
            if (auto host_port = parse_port(host_binding.host_port)) {
              result.push_back(PortBinding{
                  .container_port = mapping.container_port,
                  .host_port = host_port.value(),
                  .host_ip = host_binding.host_ip.empty() ? std::string{DEFAULT_HOST_IP} : host_binding.host_ip,
              });
            } else {
              logs::log(logs::warning,
                        "[PORTS] Skipping binding {} of {} with invalid host port: '{}'",
                        mapping.container_port,
                        container_name,
                        host_binding.host_port);
            }
          }
        }
      },
      mapping.binding);
  return result;
}

PortInventory build_inventory(const std::vector<docker::RawContainer> &containers) {
  std::set<int> used_ports;
  PortInventory inventory;

  for (const auto &container : containers) {
    if (!container.network.ports) {
      logs::log(logs::trace, "[PORTS] {} has no binding table", container.summary);
      continue;
    }

    auto name = normalize_name(container.summary.name);
    std::vector<PortBinding> bindings;
    for (const auto &mapping : container.network.ports.value()) {
      auto mapping_bindings = to_bindings(mapping, name);
      bindings.insert(bindings.end(), mapping_bindings.begin(), mapping_bindings.end());
    }

    if (bindings.empty()) {
      continue;
    }

    for (const auto &binding : bindings) {
      used_ports.insert(binding.host_port);
    }
    inventory.containers.push_back(ContainerRecord{.id = short_id(container.summary.id),
                                                   .name = name,
                                                   .image = container.summary.image,
                                                   .status = container.summary.status,
                                                   .ports = std::move(bindings)});
    logs::log(logs::trace, "[PORTS] {}", inventory.containers.back());
  }

  inventory.used_ports = {used_ports.begin(), used_ports.end()};
  logs::log(logs::debug,
            "[PORTS] {} containers are publishing {} ports",
            inventory.containers.size(),
            inventory.used_ports.size());
  logs::log(logs::trace, "[PORTS] Used ports: [{}]", utils::join(inventory.used_ports, ", "));
  return inventory;
}

PortCheckResult check_port(int port, const PortInventory &inventory) {
  for (const auto &container : inventory.containers) {
    for (const auto &binding : container.ports) {
      if (binding.host_port == port) {
        return PortCheckResult{
            .port = port,
            .available = false,
            .used_by = UsedBy{.container = container.name, .container_port = binding.container_port},
        };
      }
    }
  }
  return PortCheckResult{.port = port, .available = true, .used_by = std::nullopt};
}

std::optional<int>
random_free_port(const PortInventory &inventory, const GeneratorSettings &settings, std::mt19937 &rng) {
  const auto &used = inventory.used_ports;
  auto is_used = [&used](int port) { return std::binary_search(used.begin(), used.end(), port); };

  std::uniform_int_distribution<int> distribution(settings.range.low, settings.range.high);
  for (int attempt = 0; attempt < settings.max_attempts; attempt++) {
    auto candidate = distribution(rng);
    if (!is_used(candidate)) {
      logs::log(logs::trace, "[PORTS] Found free port {} after {} attempts", candidate, attempt + 1);
      return candidate;
    }
  }

  if (settings.exhaustive_fallback) {
    for (int candidate = settings.range.low; candidate <= settings.range.high; candidate++) {
      if (!is_used(candidate)) {
        logs::log(logs::debug, "[PORTS] Random sampling failed, {} found by scanning the range", candidate);
        return candidate;
      }
    }
  }

  logs::log(logs::warning,
            "[PORTS] No free port found in [{}, {}] after {} attempts",
            settings.range.low,
            settings.range.high,
            settings.max_attempts);
  return {};
}

} // namespace portman::core::ports
