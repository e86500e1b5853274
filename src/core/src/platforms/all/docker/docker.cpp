#include <boost/json/src.hpp>
#include <curl/curl.h>
#include <docker/formatters.hpp>
#include <docker/json_formatters.hpp>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <memory>
#include <string_view>

namespace portman::core::docker {
namespace json = boost::json;

void init() {
  curl_global_init(CURL_GLOBAL_ALL);
}

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

/**
 * Initialise the curl handle and connects it to the docker socket
 */
static std::optional<curl_ptr> docker_connect(const std::string &socket_path, bool debug = false) {
  if (auto curl = curl_easy_init()) {
    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    if (debug)
      curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    return curl_ptr(curl, ::curl_easy_cleanup);
  } else {
    return {};
  }
}

/**
 * Perform a GET request using curl, we never need to write anything to the daemon
 */
static std::optional<std::pair<long /* response_code */, std::string /* raw message */>> req(CURL *handle,
                                                                                           const std::string &target) {
  logs::log(logs::trace, "[CURL] Sending [GET] -> {}", target);
  curl_easy_setopt(handle, CURLOPT_URL, target.c_str());
  curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(handle, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);

  /* Set custom writer (in order to receive back the response) */
  curl_easy_setopt(
      handle,
      CURLOPT_WRITEFUNCTION,
      static_cast<size_t (*)(char *, size_t, size_t, void *)>([](char *ptr, size_t size, size_t nmemb, void *read_buf) {
        *(static_cast<std::string *>(read_buf)) += std::string{ptr, size * nmemb};
        return size * nmemb;
      }));
  std::string read_buf;
  curl_easy_setopt(handle, CURLOPT_WRITEDATA, &read_buf);

  auto res = curl_easy_perform(handle);
  if (res != CURLE_OK) {
    logs::log(logs::warning, "[CURL] Request failed with error: {}", curl_easy_strerror(res));
    return {};
  } else {
    long response_code;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response_code);
    logs::log(logs::trace, "[CURL] Received {} - {}", response_code, read_buf);
    return {{response_code, read_buf}};
  }
}

std::vector<ContainerSummary> parse_container_list(std::string_view raw_json) {
  auto parsed = utils::parse_json(raw_json);
  std::vector<ContainerSummary> containers;
  if (auto list = parsed.if_array()) {
    for (const auto &container : *list) {
      if (container.is_object()) {
        containers.push_back(json::value_to<ContainerSummary>(container));
      }
    }
  } else {
    logs::log(logs::warning, "[DOCKER] Expected a list of containers, got: {}", raw_json);
  }
  return containers;
}

NetworkSettings parse_network_settings(std::string_view raw_json) {
  return json::value_to<NetworkSettings>(utils::parse_json(raw_json));
}

std::optional<std::vector<ContainerSummary>> DockerAPI::list_containers() const {
  if (auto conn = docker_connect(socket_path)) {
    auto url = fmt::format("http://localhost/{}/containers/json", DOCKER_API_VERSION);
    auto raw_msg = req(conn.value().get(), url);
    if (raw_msg && raw_msg->first == 200) {
      return parse_container_list(raw_msg->second);
    } else if (raw_msg) {
      logs::log(logs::warning, "[DOCKER] error {} - {}", raw_msg->first, raw_msg->second);
    }
  }

  return {};
}

std::optional<NetworkSettings> DockerAPI::inspect_network(std::string_view id) const {
  if (auto conn = docker_connect(socket_path)) {
    auto url = fmt::format("http://localhost/{}/containers/{}/json", DOCKER_API_VERSION, id);
    auto raw_msg = req(conn.value().get(), url);
    if (raw_msg && raw_msg->first == 200) {
      return parse_network_settings(raw_msg->second);
    } else if (raw_msg) {
      logs::log(logs::warning, "[DOCKER] error {} - {}", raw_msg->first, raw_msg->second);
    }
  }

  return {};
}

bool DockerAPI::ping() const {
  if (auto conn = docker_connect(socket_path)) {
    auto raw_msg = req(conn.value().get(), fmt::format("http://localhost/{}/_ping", DOCKER_API_VERSION));
    if (raw_msg && raw_msg->first == 200) {
      return true;
    } else if (raw_msg) {
      logs::log(logs::warning, "[DOCKER] error {} - {}", raw_msg->first, raw_msg->second);
    }
  }

  return false;
}

std::optional<std::vector<RawContainer>> take_snapshot(const RuntimeClient &client) {
  auto containers = client.list_containers();
  if (!containers) {
    return {};
  }

  std::vector<RawContainer> snapshot;
  snapshot.reserve(containers->size());
  for (const auto &container : *containers) {
    if (auto network = client.inspect_network(container.id)) {
      snapshot.push_back(RawContainer{.summary = container, .network = std::move(network.value())});
    } else if (client.ping()) {
      // Most likely the container went away after we listed it
      logs::log(logs::warning, "[DOCKER] Unable to inspect container {}, skipping", container);
    } else {
      return {};
    }
  }

  logs::log(logs::trace, "[DOCKER] Snapshot of {} running containers", snapshot.size());
  return snapshot;
}

} // namespace portman::core::docker
