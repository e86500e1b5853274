#pragma once

#include <optional>
#include <rfl.hpp>
#include <string>

namespace portman::config {

struct ServerConfig {
  std::string address = "0.0.0.0";
  int port = 3001;
};

struct DockerConfig {
  std::string socket = "/var/run/docker.sock";
};

struct RandomPortConfig {
  int range_low = 3000;
  int range_high = 9999;
  int max_attempts = 100;
  /* When random sampling fails, scan the whole range in order */
  bool exhaustive_fallback = false;
};

struct PortmanConfig {
  std::optional<int> config_version;
  ServerConfig server = {};
  DockerConfig docker = {};
  RandomPortConfig random = {};
};

} // namespace portman::config
