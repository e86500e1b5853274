#pragma once
#include <boost/json.hpp>
#include <helpers/logger.hpp>
#include <map>
#include <optional>
#include <range/v3/view.hpp>
#include <stdlib.h>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

using namespace ranges;

inline const char *get_env(const char *tag, const char *def = nullptr) noexcept {
  const char *ret = std::getenv(tag);
  return ret ? ret : def;
}

/**
 * Join a list of values into a single string with separator in between elements
 */
template <typename T> inline std::string join(const std::vector<T> &vec, std::string_view separator) {
  return vec                                                                   //
         | views::transform([](const T &el) { return fmt::format("{}", el); }) //
         | views::join(separator)                                              //
         | to<std::string>();                                                  //
}

namespace json = boost::json;
inline json::value parse_json(std::string_view json) {
  json::error_code ec;
  auto parsed = json::parse({json.data(), json.size()}, ec);
  if (!ec) {
    return parsed;
  } else {
    logs::log(logs::error, "Error while parsing JSON: {} \n {}", ec.message(), json);
    return json::object(); // Returning an empty object should allow us to continue most of the times
  }
}

template <typename T, typename K> auto get_optional(T &&map, K &&key) {
  auto it = map.find(std::forward<K>(key));
  if (it == map.end())
    return std::optional<typename std::decay<T>::type::mapped_type>{};
  return std::optional<typename std::decay<T>::type::mapped_type>{it->second};
}

} // namespace utils
