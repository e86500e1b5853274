#pragma once

#include <helpers/logger.hpp>
#include <state/data-structures.hpp>
#include <state/serialised_config.hpp>
#include <string>

namespace state {

/**
 * @brief Will load a configuration from the given source.
 *
 * If the source is not present a default one is created first,
 * if the source can't be parsed the defaults are used instead.
 * Env variables (PORTMAN_DOCKER_SOCKET, PORTMAN_HTTP_PORT) take precedence over the file.
 */
Config load_or_default(const std::string &source);

/**
 * Writes the bundled default config.toml to `source`
 */
void create_default(const std::string &source);

} // namespace state
