#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace portman::core::docker {
constexpr auto DOCKER_API_VERSION = "v1.40";

/**
 * A single host side allocation for a published container port.
 * `host_port` is kept exactly as the Engine reports it (a numeric string),
 * parsing is left to the inventory builder.
 */
struct HostBinding {
  std::string host_ip;
  std::string host_port;
};

/**
 * The container port is exposed but nothing on the host is bound to it.
 * The Engine reports this either as `null` or as an empty list.
 */
struct NoHostBinding {};

using BindingEntry = std::variant<NoHostBinding, std::vector<HostBinding>>;

struct PortMapping {
  std::string container_port; // ex: "80/tcp"
  BindingEntry binding;
};

struct NetworkSettings {
  /* `NetworkSettings.Ports` can be `null`, in that case there's no binding table at all */
  std::optional<std::vector<PortMapping>> ports;
};

/**
 * An entry of the container list, before being inspected
 */
struct ContainerSummary {
  std::string id;
  std::string name;
  std::string image;
  std::string status; // free text, ex: "Up 3 hours"
};

/**
 * A listed container paired with its binding table, taken within the same request
 */
struct RawContainer {
  ContainerSummary summary;
  NetworkSettings network;
};

/**
 * CURL needs to be initialised once
 */
void init();

/**
 * The read-only subset of a container runtime that we need in order to build a port inventory.
 *
 * Every method returns an empty optional when the daemon can't be reached.
 */
struct RuntimeClient {
  virtual ~RuntimeClient() = default;

  /**
   * Only running containers are returned
   */
  [[nodiscard]] virtual std::optional<std::vector<ContainerSummary>> list_containers() const = 0;

  [[nodiscard]] virtual std::optional<NetworkSettings> inspect_network(std::string_view id) const = 0;

  [[nodiscard]] virtual bool ping() const = 0;
};

class DockerAPI : public RuntimeClient {
private:
  std::string socket_path;

public:
  inline explicit DockerAPI(std::string socket_path = "/var/run/docker.sock") : socket_path(std::move(socket_path)) {}

  /**
   * https://docs.docker.com/engine/api/v1.40/#tag/Container/operation/ContainerList
   */
  [[nodiscard]] std::optional<std::vector<ContainerSummary>> list_containers() const override;

  /**
   * https://docs.docker.com/engine/api/v1.40/#tag/Container/operation/ContainerInspect
   */
  [[nodiscard]] std::optional<NetworkSettings> inspect_network(std::string_view id) const override;

  /**
   * https://docs.docker.com/engine/api/v1.40/#tag/System/operation/SystemPing
   */
  [[nodiscard]] bool ping() const override;
};

/**
 * Lists all running containers and pairs each one with its binding table.
 *
 * Returns an empty optional if the runtime is unavailable.
 * A container that disappears between listing and inspecting is skipped,
 * as long as the daemon itself is still reachable.
 */
std::optional<std::vector<RawContainer>> take_snapshot(const RuntimeClient &client);

/**
 * Parse the body of `GET /containers/json`
 */
std::vector<ContainerSummary> parse_container_list(std::string_view json);

/**
 * Parse the body of `GET /containers/{id}/json`
 */
NetworkSettings parse_network_settings(std::string_view json);

} // namespace portman::core::docker
