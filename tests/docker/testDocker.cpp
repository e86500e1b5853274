#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <catch2/matchers/catch_matchers_vector.hpp>
#include <core/docker.hpp>
#include <core/ports.hpp>
#include <helpers/utils.hpp>

using Catch::Matchers::Equals;
using namespace portman::core;

/**
 * Trimmed down from a real `GET /v1.40/containers/json`
 */
constexpr auto CONTAINER_LIST = R"([
  {
    "Id": "8dfafdbc3a40c1f5a3e0c7b5b8b9a6c7d8e9f0a1b2c3d4e5f6a7b8c9d0e1f2a3",
    "Names": ["/web"],
    "Image": "nginx:latest",
    "ImageID": "sha256:2b7d6430f78d432f89109b29d88d4c36c868cdbf15dc31d2132ceaa02b993763",
    "Command": "/docker-entrypoint.sh nginx -g 'daemon off;'",
    "Created": 1700000000,
    "Ports": [{"IP": "0.0.0.0", "PrivatePort": 80, "PublicPort": 8080, "Type": "tcp"}],
    "State": "running",
    "Status": "Up 3 hours"
  },
  {
    "Id": "9c1b2a3d4e5f",
    "Names": ["/db", "/web/db"],
    "Image": "postgres:16",
    "State": "running",
    "Status": "Up 2 minutes (healthy)"
  },
  {
    "Id": "abcdef",
    "Names": null,
    "Image": "alpine",
    "Status": "Up 1 second"
  }
])";

/**
 * Trimmed down from a real `GET /v1.40/containers/{id}/json`
 */
constexpr auto CONTAINER_INSPECT = R"({
  "Id": "8dfafdbc3a40c1f5a3e0c7b5b8b9a6c7d8e9f0a1b2c3d4e5f6a7b8c9d0e1f2a3",
  "Name": "/web",
  "State": {"Status": "running", "Running": true},
  "Config": {"Image": "nginx:latest", "ExposedPorts": {"80/tcp": {}, "443/tcp": {}, "9000/udp": {}}},
  "HostConfig": {"PortBindings": {"80/tcp": [{"HostIp": "", "HostPort": "8080"}]}},
  "NetworkSettings": {
    "Bridge": "",
    "Ports": {
      "80/tcp": [
        {"HostIp": "0.0.0.0", "HostPort": "8080"},
        {"HostIp": "::", "HostPort": "8080"}
      ],
      "443/tcp": null,
      "9000/udp": [],
      "5000/tcp": [{"HostPort": "5000"}]
    }
  }
})";

TEST_CASE("Parse container list", "[docker]") {
  auto containers = docker::parse_container_list(CONTAINER_LIST);
  REQUIRE(containers.size() == 3);

  REQUIRE_THAT(containers[0].id, Equals("8dfafdbc3a40c1f5a3e0c7b5b8b9a6c7d8e9f0a1b2c3d4e5f6a7b8c9d0e1f2a3"));
  REQUIRE_THAT(containers[0].name, Equals("/web"));
  REQUIRE_THAT(containers[0].image, Equals("nginx:latest"));
  REQUIRE_THAT(containers[0].status, Equals("Up 3 hours"));

  REQUIRE_THAT(containers[1].name, Equals("/db"));
  REQUIRE_THAT(containers[1].status, Equals("Up 2 minutes (healthy)"));

  REQUIRE_THAT(containers[2].name, Equals(""));

  REQUIRE(docker::parse_container_list("{\"message\": \"oops\"}").empty());
  REQUIRE(docker::parse_container_list("not json").empty());
}

TEST_CASE("Parse network settings", "[docker]") {
  SECTION("Binding table") {
    auto network = docker::parse_network_settings(CONTAINER_INSPECT);
    REQUIRE(network.ports.has_value());

    auto &mappings = network.ports.value();
    REQUIRE(mappings.size() == 4);

    // Same order as the JSON document
    REQUIRE_THAT(mappings[0].container_port, Equals("80/tcp"));
    REQUIRE_THAT(mappings[1].container_port, Equals("443/tcp"));
    REQUIRE_THAT(mappings[2].container_port, Equals("9000/udp"));
    REQUIRE_THAT(mappings[3].container_port, Equals("5000/tcp"));

    auto http = std::get_if<std::vector<docker::HostBinding>>(&mappings[0].binding);
    REQUIRE(http != nullptr);
    REQUIRE(http->size() == 2);
    REQUIRE_THAT(http->at(0).host_ip, Equals("0.0.0.0"));
    REQUIRE_THAT(http->at(0).host_port, Equals("8080"));
    REQUIRE_THAT(http->at(1).host_ip, Equals("::"));

    // Both `null` and `[]` mean that nothing is bound on the host
    REQUIRE(std::holds_alternative<docker::NoHostBinding>(mappings[1].binding));
    REQUIRE(std::holds_alternative<docker::NoHostBinding>(mappings[2].binding));

    auto registry = std::get_if<std::vector<docker::HostBinding>>(&mappings[3].binding);
    REQUIRE(registry != nullptr);
    REQUIRE_THAT(registry->at(0).host_ip, Equals(""));
    REQUIRE_THAT(registry->at(0).host_port, Equals("5000"));
  }

  SECTION("Null Ports") {
    auto network = docker::parse_network_settings(R"({"Id": "abc", "NetworkSettings": {"Ports": null}})");
    REQUIRE_FALSE(network.ports.has_value());
  }

  SECTION("Empty Ports") {
    auto network = docker::parse_network_settings(R"({"Id": "abc", "NetworkSettings": {"Ports": {}}})");
    REQUIRE(network.ports.has_value());
    REQUIRE(network.ports->empty());
  }

  SECTION("Missing NetworkSettings") {
    REQUIRE_FALSE(docker::parse_network_settings(R"({"Id": "abc"})").ports.has_value());
    REQUIRE_FALSE(docker::parse_network_settings(R"({"Id": "abc", "NetworkSettings": null})").ports.has_value());
    REQUIRE_FALSE(docker::parse_network_settings("[]").ports.has_value());
  }

  SECTION("Non numeric HostPort") {
    auto network = docker::parse_network_settings(
        R"({"NetworkSettings": {"Ports": {"80/tcp": [{"HostIp": "0.0.0.0", "HostPort": 8080}]}}})");
    auto bindings = std::get_if<std::vector<docker::HostBinding>>(&network.ports->at(0).binding);
    REQUIRE(bindings != nullptr);
    REQUIRE_THAT(bindings->at(0).host_port, Equals("")); // Not a string, will be skipped by the inventory
  }
}

TEST_CASE("From Engine payloads to inventory", "[docker]") {
  auto summary = docker::parse_container_list(CONTAINER_LIST)[0];
  auto network = docker::parse_network_settings(CONTAINER_INSPECT);

  auto inventory = ports::build_inventory({docker::RawContainer{.summary = summary, .network = network}});
  REQUIRE_THAT(inventory.used_ports, Equals(std::vector<int>{5000, 8080}));
  REQUIRE(inventory.containers.size() == 1);

  auto &web = inventory.containers[0];
  REQUIRE_THAT(web.id, Equals("8dfafdbc3a40"));
  REQUIRE_THAT(web.name, Equals("web"));
  REQUIRE(web.ports.size() == 3);
  REQUIRE_THAT(web.ports[2].container_port, Equals("5000/tcp"));
  REQUIRE_THAT(web.ports[2].host_ip, Equals("0.0.0.0"));
}

TEST_CASE("Docker API", "[.docker-live]") {
  docker::DockerAPI docker_api(utils::get_env("PORTMAN_DOCKER_SOCKET", "/var/run/docker.sock"));

  REQUIRE(docker_api.ping());
  auto containers = docker_api.list_containers();
  REQUIRE(containers.has_value());

  auto snapshot = docker::take_snapshot(docker_api);
  REQUIRE(snapshot.has_value());
  REQUIRE(snapshot->size() <= containers->size());
}

TEST_CASE("Docker API unreachable", "[docker]") {
  docker::DockerAPI docker_api("/tmp/portman-this-socket-does-not-exist.sock");

  REQUIRE_FALSE(docker_api.ping());
  REQUIRE_FALSE(docker_api.list_containers().has_value());
  REQUIRE_FALSE(docker_api.inspect_network("abc").has_value());
  REQUIRE_FALSE(docker::take_snapshot(docker_api).has_value());
}
