#pragma once

#include <functional>
#include <immer/box.hpp>
#include <optional>
#include <rfl.hpp>
#include <rfl/json.hpp>
#include <server_http.hpp>
#include <state/data-structures.hpp>
#include <string>

using HttpServer = SimpleWeb::Server<SimpleWeb::HTTP>;

namespace portman::api {

using namespace portman::core;

using Response = std::shared_ptr<HttpServer::Response>;
using Request = std::shared_ptr<HttpServer::Request>;

struct ErrorResponse {
  std::string error;
};

struct RandomPortResponse {
  int port;
  bool available = true;
};

struct HealthResponse {
  std::string status;
  std::string docker;
  std::optional<std::string> error;
};

/**
 * Registers all the /api routes on the given server
 */
void setup_routes(HttpServer &server, const immer::box<state::AppState> &state);

/**
 * @brief Binds to the configured address and port and serves requests, this will block until server.stop()
 *
 * @param on_listening: optional, called with the actual port once the server is accepting connections
 */
void start_server(HttpServer &server,
                  const immer::box<state::AppState> &state,
                  const std::function<void(unsigned short)> &on_listening = nullptr);

namespace endpoints {

void not_found(const Response &response, const Request &request);

void list_ports(const Response &response, const Request &request, const immer::box<state::AppState> &state);

void check_port(const Response &response, const Request &request, const immer::box<state::AppState> &state);

void random_port(const Response &response, const Request &request, const immer::box<state::AppState> &state);

void health(const Response &response, const Request &request, const immer::box<state::AppState> &state);

} // namespace endpoints

} // namespace portman::api
