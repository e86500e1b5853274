#pragma once
#include <core/docker.hpp>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace portman::core::ports {

constexpr int MIN_PORT = 1;
constexpr int MAX_PORT = 65535;

constexpr int DEFAULT_RANGE_LOW = 3000;
constexpr int DEFAULT_RANGE_HIGH = 9999;
constexpr int DEFAULT_MAX_ATTEMPTS = 100;

constexpr auto DEFAULT_HOST_IP = "0.0.0.0";
constexpr std::size_t SHORT_ID_LENGTH = 12;

struct PortBinding {
  std::string container_port;
  int host_port;
  std::string host_ip;
};

struct ContainerRecord {
  std::string id;
  std::string name;
  std::string image;
  std::string status;
  std::vector<PortBinding> ports;
};

struct PortInventory {
  /* Ascending, no duplicates */
  std::vector<int> used_ports;
  /* Only containers with at least one host binding, in runtime enumeration order */
  std::vector<ContainerRecord> containers;
};

struct UsedBy {
  std::string container;
  std::string container_port;
};

struct PortCheckResult {
  int port;
  bool available;
  std::optional<UsedBy> used_by;
};

struct PortRange {
  int low = DEFAULT_RANGE_LOW;
  int high = DEFAULT_RANGE_HIGH;
};

struct GeneratorSettings {
  PortRange range = {};
  int max_attempts = DEFAULT_MAX_ATTEMPTS;
  /* After rejection sampling fails, scan the range in order */
  bool exhaustive_fallback = false;
};

/**
 * The caller supplied a port (or a range) outside of [1, 65535], or something that isn't a number at all
 */
class ValidationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * The container runtime could not be reached
 */
class RuntimeUnavailable : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * The random search used its whole attempt budget without finding a free port
 */
class GenerationExhausted : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

inline bool is_valid_port(long port) {
  return port >= MIN_PORT && port <= MAX_PORT;
}

inline bool is_valid_range(const PortRange &range) {
  return is_valid_port(range.low) && is_valid_port(range.high) && range.low <= range.high;
}

/**
 * Parses a decimal port number, returns an empty optional if the input isn't a valid port
 */
std::optional<int> parse_port(std::string_view raw_port);

/**
 * Removes the leading `/` that the Docker Engine adds to container names
 */
std::string normalize_name(std::string_view name);

std::string short_id(std::string_view id);

/**
 * Aggregates the binding tables of a snapshot into a port inventory.
 *
 * Bindings with a host port that can't be parsed are skipped (and logged),
 * they never fail the whole inventory.
 */
PortInventory build_inventory(const std::vector<docker::RawContainer> &containers);

/**
 * If more than one binding uses `port` the first one, in inventory order, is reported.
 */
PortCheckResult check_port(int port, const PortInventory &inventory);

/**
 * Rejection sampling over [range.low, range.high].
 *
 * This is not an exhaustive search: on a nearly saturated range it can miss the few free ports left,
 * `max_attempts` turns that into a failure (an empty optional) instead of an unbounded loop.
 * Enable `exhaustive_fallback` to scan the range in order once sampling has failed.
 *
 * Nothing gets reserved, the returned port is only free as of the inventory snapshot.
 */
std::optional<int>
random_free_port(const PortInventory &inventory, const GeneratorSettings &settings, std::mt19937 &rng);

/**
 * Runs each operation against a fresh snapshot of the runtime, nothing is cached between calls.
 */
class PortService {
private:
  const docker::RuntimeClient &runtime;
  GeneratorSettings settings;

public:
  inline PortService(const docker::RuntimeClient &runtime, GeneratorSettings settings)
      : runtime(runtime), settings(settings) {}

  /**
   * @throws RuntimeUnavailable
   */
  [[nodiscard]] PortInventory inventory() const;

  /**
   * The port is validated before the runtime is ever contacted.
   *
   * @throws ValidationError, RuntimeUnavailable
   */
  [[nodiscard]] PortCheckResult check(std::string_view raw_port) const;

  /**
   * @param range: overrides the configured range when present
   * @throws ValidationError, RuntimeUnavailable, GenerationExhausted
   */
  [[nodiscard]] int random(const std::optional<PortRange> &range = {}) const;

  [[nodiscard]] bool health() const;
};

} // namespace portman::core::ports
