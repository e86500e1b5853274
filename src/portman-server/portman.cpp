#include <api/api.hpp>
#include <core/docker.hpp>
#include <csignal>
#include <exceptions/exceptions.h>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <memory>
#include <state/config.hpp>

using namespace portman::core;

/**
 * @brief Local state initialization
 */
auto initialize(std::string_view config_file) {
  logs::log(logs::info, "Reading config file from: {}", config_file);
  auto config = state::load_or_default(config_file.data());

  logs::log(logs::info, "Using Docker socket: {}", config.docker_socket);
  auto runtime = std::make_shared<docker::DockerAPI>(config.docker_socket);
  if (!runtime->ping()) {
    // Not fatal, the daemon might come up later on; /api/health will report it
    logs::log(logs::warning, "Unable to reach Docker at {}", config.docker_socket);
  }

  return immer::box<state::AppState>(state::AppState{.config = config, .runtime = runtime});
}

/**
 * @brief here's where the magic starts
 */
void run() {
  docker::init(); // Need to initialise libcurl once

  auto config_file = utils::get_env("PORTMAN_CFG_FILE", "config.toml");
  auto local_state = initialize(config_file);

  HttpServer server;
  portman::api::start_server(server, local_state); // Blocks until the server is stopped
}

int main(int argc, char *argv[]) try {
  logs::init(logs::parse_level(utils::get_env("PORTMAN_LOG_LEVEL", "INFO")));
  // Exception and termination handling
  init_backtrace_file();
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);
  std::signal(SIGQUIT, shutdown_handler);
  std::signal(SIGSEGV, shutdown_handler);
  std::signal(SIGABRT, shutdown_handler);
  std::set_terminate(on_terminate);
  check_exceptions();

  run(); // Main loop
} catch (...) {
  on_terminate();
}
