#pragma once

#include <core/docker.hpp>
#include <core/ports.hpp>
#include <immer/box.hpp>
#include <memory>
#include <string>

namespace state {
using namespace portman::core;

struct Config {
  /* Where this config has been loaded from */
  std::string config_source;

  std::string http_address;
  int http_port;

  std::string docker_socket;

  ports::GeneratorSettings random_port;
};

/**
 * Shared (read only) with the HTTP server thread
 */
struct AppState {
  immer::box<Config> config;
  std::shared_ptr<docker::RuntimeClient> runtime;
};

} // namespace state
