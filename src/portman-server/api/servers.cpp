#include <api/api.hpp>
#include <helpers/logger.hpp>

namespace portman::api {

void setup_routes(HttpServer &server, const immer::box<state::AppState> &state) {
  server.default_resource["GET"] = endpoints::not_found;
  server.default_resource["POST"] = endpoints::not_found;

  server.resource["^/api/health$"]["GET"] = [state](auto resp, auto req) { endpoints::health(resp, req, state); };

  server.resource["^/api/ports$"]["GET"] = [state](auto resp, auto req) { endpoints::list_ports(resp, req, state); };

  // Has to be an exact match so that `random` is never taken as a {port}
  server.resource["^/api/ports/random$"]["GET"] = [state](auto resp, auto req) {
    endpoints::random_port(resp, req, state);
  };

  // Anything in between the slashes will be captured, validation happens later on
  server.resource["^/api/ports/([^/]+)/check$"]["GET"] = [state](auto resp, auto req) {
    endpoints::check_port(resp, req, state);
  };
}

void start_server(HttpServer &server,
                  const immer::box<state::AppState> &state,
                  const std::function<void(unsigned short)> &on_listening) {
  server.config.port = state->config->http_port;
  server.config.address = state->config->http_address;
  setup_routes(server, state);

  server.start([address = state->config->http_address, on_listening](unsigned short port) {
    logs::log(logs::info, "HTTP server listening on {}:{}", address, port);
    if (on_listening) {
      on_listening(port);
    }
  });
}

} // namespace portman::api
