#include <api/api.hpp>
#include <core/ports.hpp>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>

namespace portman::api::endpoints {

/**
 * @brief Log the request
 */
static void log_req(const Request &request) {
  logs::log(logs::debug,
            "{} [{}] {}{}",
            request->remote_endpoint().address().to_string(),
            request->method,
            request->path,
            request->query_string.empty() ? "" : "?" + request->query_string);
}

/**
 * @brief Serialise the body as (camelCase) JSON and send it with the specified status_code
 */
template <typename Body>
static void send_json(const Response &response, SimpleWeb::StatusCode status_code, const Body &body) {
  auto json = rfl::json::write<rfl::SnakeCaseToCamelCase>(body);
  logs::log(logs::trace, "Response: {}", json);

  SimpleWeb::CaseInsensitiveMultimap headers;
  headers.emplace("Content-Type", "application/json");
  headers.emplace("Access-Control-Allow-Origin", "*");
  response->write(status_code, json, headers);
}

static void send_error(const Response &response, SimpleWeb::StatusCode status_code, const std::string &error) {
  send_json(response, status_code, ErrorResponse{.error = error});
}

static ports::PortService get_service(const immer::box<state::AppState> &state) {
  return ports::PortService(*state->runtime, state->config->random_port);
}

void not_found(const Response &response, const Request &request) {
  log_req(request);
  send_error(response, SimpleWeb::StatusCode::client_error_not_found, "Not found");
}

void list_ports(const Response &response, const Request &request, const immer::box<state::AppState> &state) {
  log_req(request);
  try {
    send_json(response, SimpleWeb::StatusCode::success_ok, get_service(state).inventory());
  } catch (const ports::RuntimeUnavailable &e) {
    logs::log(logs::error, "Error getting Docker info: {}", e.what());
    send_error(response,
               SimpleWeb::StatusCode::server_error_internal_server_error,
               "Failed to get Docker container information");
  }
}

void check_port(const Response &response, const Request &request, const immer::box<state::AppState> &state) {
  log_req(request);
  try {
    send_json(response, SimpleWeb::StatusCode::success_ok, get_service(state).check(request->path_match[1].str()));
  } catch (const ports::ValidationError &e) {
    logs::log(logs::debug, "{}", e.what());
    send_error(response, SimpleWeb::StatusCode::client_error_bad_request, "Invalid port number");
  } catch (const ports::RuntimeUnavailable &e) {
    logs::log(logs::error, "Error checking port: {}", e.what());
    send_error(response,
               SimpleWeb::StatusCode::server_error_internal_server_error,
               "Failed to check port availability");
  }
}

/**
 * Optional `min` and `max` query parameters override the configured range,
 * when only one of them is given the other one comes from the config.
 */
static std::optional<ports::PortRange> parse_range(const Request &request, const ports::PortRange &configured) {
  auto query = request->parse_query_string();
  auto min = utils::get_optional(query, "min");
  auto max = utils::get_optional(query, "max");
  if (!min && !max) {
    return {};
  }

  auto parse_bound = [](const std::optional<std::string> &raw, int fallback) {
    if (!raw) {
      return fallback;
    }
    if (auto parsed = ports::parse_port(raw.value())) {
      return parsed.value();
    }
    throw ports::ValidationError(fmt::format("Invalid range bound: '{}'", raw.value()));
  };
  return ports::PortRange{.low = parse_bound(min, configured.low), .high = parse_bound(max, configured.high)};
}

void random_port(const Response &response, const Request &request, const immer::box<state::AppState> &state) {
  log_req(request);
  try {
    auto range = parse_range(request, state->config->random_port.range);
    auto port = get_service(state).random(range);
    send_json(response, SimpleWeb::StatusCode::success_ok, RandomPortResponse{.port = port});
  } catch (const ports::ValidationError &e) {
    logs::log(logs::debug, "{}", e.what());
    send_error(response, SimpleWeb::StatusCode::client_error_bad_request, e.what());
  } catch (const ports::GenerationExhausted &e) {
    logs::log(logs::warning, "{}", e.what());
    send_error(response, SimpleWeb::StatusCode::server_error_internal_server_error, "Could not find available port");
  } catch (const ports::RuntimeUnavailable &e) {
    logs::log(logs::error, "Error getting random port: {}", e.what());
    send_error(response, SimpleWeb::StatusCode::server_error_internal_server_error, "Failed to get random port");
  }
}

void health(const Response &response, const Request &request, const immer::box<state::AppState> &state) {
  log_req(request);
  if (get_service(state).health()) {
    send_json(response, SimpleWeb::StatusCode::success_ok, HealthResponse{.status = "healthy", .docker = "connected"});
  } else {
    logs::log(logs::warning, "Docker health check failed, socket: {}", state->config->docker_socket);
    send_json(response,
              SimpleWeb::StatusCode::server_error_internal_server_error,
              HealthResponse{.status = "unhealthy",
                             .docker = "disconnected",
                             .error = fmt::format("Unable to reach Docker at {}", state->config->docker_socket)});
  }
}

} // namespace portman::api::endpoints
