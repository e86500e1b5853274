#pragma once

#include <core/docker.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fmt {

template <> struct [[maybe_unused]] formatter<portman::core::docker::HostBinding> {
public:
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.end();
  }
  template <typename FormatContext>
  auto format(const portman::core::docker::HostBinding &binding, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}:{}", binding.host_ip, binding.host_port);
  }
};

template <> struct [[maybe_unused]] formatter<portman::core::docker::PortMapping> {
public:
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.end();
  }
  template <typename FormatContext>
  auto format(const portman::core::docker::PortMapping &mapping, FormatContext &ctx) const -> decltype(ctx.out()) {
    if (auto bindings = std::get_if<std::vector<portman::core::docker::HostBinding>>(&mapping.binding)) {
      return fmt::format_to(ctx.out(), "{} -> {}", mapping.container_port, *bindings);
    }
    return fmt::format_to(ctx.out(), "{} -> (not bound)", mapping.container_port);
  }
};

template <> struct [[maybe_unused]] formatter<portman::core::docker::ContainerSummary> {
public:
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.end();
  }
  template <typename FormatContext>
  auto format(const portman::core::docker::ContainerSummary &container, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{} ({}, {})", container.name, container.id, container.image);
  }
};
} // namespace fmt
