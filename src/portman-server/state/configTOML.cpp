#include <filesystem>
#include <fstream>
#include <helpers/utils.hpp>
#include <rfl/toml.hpp>
#include <state/config.hpp>

namespace state {

/**
 * A bit of magic here, it'll load up the default/config.toml via Cmake (look for `make_includable`)
 */
constexpr char const *default_toml =
#include "state/default/config.include.toml"
    ;

using namespace portman::config;

void create_default(const std::string &source) {
  std::ofstream out_file;
  out_file.open(source);
  out_file << default_toml;
  out_file.close();
}

static PortmanConfig load_toml(const std::string &source) {
  try {
    return rfl::toml::load<PortmanConfig, rfl::DefaultIfMissing>(source).value();
  } catch (const std::exception &e) {
    logs::log(logs::error, "Unable to parse config file {}: {}, using defaults", source, e.what());
    return PortmanConfig{};
  }
}

Config load_or_default(const std::string &source) {
  if (!std::filesystem::exists(source)) {
    logs::log(logs::warning, "Unable to open config file: {}, creating one using defaults", source);
    create_default(source);
  }

  auto cfg = load_toml(source);

  auto random_port = ports::GeneratorSettings{
      .range = {.low = cfg.random.range_low, .high = cfg.random.range_high},
      .max_attempts = cfg.random.max_attempts,
      .exhaustive_fallback = cfg.random.exhaustive_fallback,
  };
  if (!ports::is_valid_range(random_port.range) || random_port.max_attempts < 1) {
    logs::log(logs::warning,
              "Invalid [random] settings: range [{}, {}], max_attempts {}; falling back to defaults",
              cfg.random.range_low,
              cfg.random.range_high,
              cfg.random.max_attempts);
    random_port = ports::GeneratorSettings{};
  }

  auto http_port = cfg.server.port;
  if (auto override_port = utils::get_env("PORTMAN_HTTP_PORT")) {
    if (auto port = ports::parse_port(override_port)) {
      http_port = port.value();
    } else {
      logs::log(logs::warning, "Ignoring invalid PORTMAN_HTTP_PORT={}", override_port);
    }
  }
  if (!ports::is_valid_port(http_port)) {
    logs::log(logs::warning, "Invalid [server] port {}, using {}", http_port, ServerConfig{}.port);
    http_port = ServerConfig{}.port;
  }

  return Config{
      .config_source = source,
      .http_address = cfg.server.address,
      .http_port = http_port,
      .docker_socket = utils::get_env("PORTMAN_DOCKER_SOCKET", cfg.docker.socket.c_str()),
      .random_port = random_port,
  };
}

} // namespace state
