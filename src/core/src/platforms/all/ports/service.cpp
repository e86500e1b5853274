#include <core/ports.hpp>
#include <fmt/format.h>
#include <helpers/logger.hpp>
#include <ports/formatters.hpp>

namespace portman::core::ports {

static std::vector<docker::RawContainer> snapshot_or_throw(const docker::RuntimeClient &runtime) {
  if (auto snapshot = docker::take_snapshot(runtime)) {
    return std::move(snapshot.value());
  }
  throw RuntimeUnavailable("Unable to reach the container runtime");
}

PortInventory PortService::inventory() const {
  return build_inventory(snapshot_or_throw(runtime));
}

PortCheckResult PortService::check(std::string_view raw_port) const {
  auto port = parse_port(raw_port);
  if (!port) {
    throw ValidationError(fmt::format("Invalid port number: '{}'", raw_port));
  }

  auto result = check_port(port.value(), inventory());
  logs::log(logs::debug, "[PORTS] Checked port {}", result);
  return result;
}

int PortService::random(const std::optional<PortRange> &range) const {
  auto request_settings = settings;
  if (range) {
    if (!is_valid_range(range.value())) {
      throw ValidationError(fmt::format("Invalid port range: [{}, {}]", range->low, range->high));
    }
    request_settings.range = range.value();
  }

  std::mt19937 rng(std::random_device{}());
  if (auto port = random_free_port(inventory(), request_settings, rng)) {
    return port.value();
  }
  throw GenerationExhausted(fmt::format("Could not find an available port in [{}, {}] after {} attempts",
                                        request_settings.range.low,
                                        request_settings.range.high,
                                        request_settings.max_attempts));
}

bool PortService::health() const {
  return runtime.ping();
}

} // namespace portman::core::ports
