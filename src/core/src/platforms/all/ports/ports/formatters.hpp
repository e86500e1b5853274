#pragma once

#include <core/ports.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fmt {

template <> struct [[maybe_unused]] formatter<portman::core::ports::PortBinding> {
public:
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.end();
  }
  template <typename FormatContext>
  auto format(const portman::core::ports::PortBinding &binding, FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "{}:{}->{}", binding.host_ip, binding.host_port, binding.container_port);
  }
};

template <> struct [[maybe_unused]] formatter<portman::core::ports::ContainerRecord> {
public:
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.end();
  }
  template <typename FormatContext>
  auto format(const portman::core::ports::ContainerRecord &container, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(),
                          "{{ id: {}, name: {}, image: {}, status: {}, ports: {} }}",
                          container.id,
                          container.name,
                          container.image,
                          container.status,
                          container.ports);
  }
};

template <> struct [[maybe_unused]] formatter<portman::core::ports::PortCheckResult> {
public:
  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    return ctx.end();
  }
  template <typename FormatContext>
  auto format(const portman::core::ports::PortCheckResult &result, FormatContext &ctx) const -> decltype(ctx.out()) {
    if (result.used_by) {
      return fmt::format_to(ctx.out(),
                            "{} in use by {} ({})",
                            result.port,
                            result.used_by->container,
                            result.used_by->container_port);
    }
    return fmt::format_to(ctx.out(), "{} available", result.port);
  }
};
} // namespace fmt
