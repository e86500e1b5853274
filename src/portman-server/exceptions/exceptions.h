/**
 * Implements safe stacktrace dumping and loading.
 *
 * Only uses async-signal-safe functions for dumping the stacktrace; read here for more info:
 * https://man7.org/linux/man-pages/man7/signal-safety.7.html
 */
#pragma once

#include <algorithm>
#include <chrono>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <fcntl.h>
#include <filesystem>
#include <helpers/logger.hpp>
#include <helpers/utils.hpp>
#include <memory>
#include <unistd.h>

using namespace std::string_literals;

/**
 * @return false if the dump file could not be written
 */
static bool safe_dump_stacktrace_to(const char *file_name) {
  constexpr std::size_t N = 100;
  cpptrace::frame_ptr buffer[N];
  std::size_t count = cpptrace::safe_generate_raw_trace(buffer, N);
  if (count == 0) {
    return false;
  }

  int fd = open(file_name, O_WRONLY | O_CREAT | O_TRUNC | O_DSYNC, 0666);
  if (fd < 0) {
    return false;
  }
  bool ok = write(fd, reinterpret_cast<char *>(&count), sizeof(count)) == sizeof(count);
  for (std::size_t i = 0; ok && i < count; i++) {
    cpptrace::safe_object_frame frame{};
    cpptrace::get_safe_object_frame(buffer[i], &frame);
    ok = write(fd, &frame, sizeof(frame)) == sizeof(frame);
  }
  close(fd);
  return ok;
}

static std::unique_ptr<cpptrace::object_trace> load_stacktrace_from(const std::string &file_name) {
  cpptrace::object_trace trace{};
  std::size_t count;
  int fd = open(file_name.c_str(), O_RDONLY);
  if (fd < 0) {
    logs::log(logs::warning, "Unable to open stacktrace file {}", file_name);
    return {};
  }
  if (read(fd, reinterpret_cast<char *>(&count), sizeof(count)) != sizeof(count)) {
    logs::log(logs::warning, "Stacktrace file {} is truncated", file_name);
    close(fd);
    return {};
  }
  for (std::size_t i = 0; i < count; i++) {
    cpptrace::safe_object_frame frame{};
    if (read(fd, &frame, sizeof(frame)) != sizeof(frame)) {
      logs::log(logs::debug, "Stacktrace file {} ended after {} frames", file_name, i);
      break;
    }
    try {
      trace.frames.push_back(frame.resolve());
    } catch (std::exception &ex) {
      logs::log(logs::debug, "Unable to parse stacktrace frame, skipping");
    }
  }
  close(fd);
  return std::make_unique<cpptrace::object_trace>(trace);
}

static std::string backtrace_file_src() {
  return std::string(utils::get_env("PORTMAN_CFG_FOLDER", ".")) + "/backtrace.dump"s;
}

/**
 * The path has to be computed before any signal is raised, std::string isn't async-signal-safe
 */
static char backtrace_file[4096] = "./backtrace.dump";

static void init_backtrace_file() {
  auto src = backtrace_file_src();
  src.copy(backtrace_file, sizeof(backtrace_file) - 1);
  backtrace_file[std::min(src.size(), sizeof(backtrace_file) - 1)] = '\0';
}

/**
 * Keep this as small as possible, make sure to only use async-signal-safe functions
 */
static void shutdown_handler(int signum) {
  if (signum == SIGABRT || signum == SIGSEGV) {
    safe_dump_stacktrace_to(backtrace_file);
  }
  _exit(signum);
}

/**
 * @brief: if we crashed last time we should have created a dump file, here we can pretty print it
 */
static void check_exceptions() {
  auto stack_file = backtrace_file_src();
  if (std::filesystem::exists(stack_file)) {
    logs::log(logs::warning, "Found a backtrace from a previous crash: {}", stack_file);
    if (auto object_trace = load_stacktrace_from(stack_file)) {
      object_trace->resolve().print();
    }
    auto now = std::chrono::system_clock::now();
    std::filesystem::rename(
        stack_file,
        fmt::format("{}/backtrace.{:%Y-%m-%d-%H-%M-%S}.dump", utils::get_env("PORTMAN_CFG_FOLDER", "."), now));
  }
}

static void on_terminate() {
  if (auto eptr = std::current_exception()) {
    try {
      std::rethrow_exception(eptr);
    } catch (const std::exception &e) {
      logs::log(logs::error, "Unhandled exception: {}", e.what());
    } catch (...) {
      logs::log(logs::error, "Unhandled exception of unknown type");
    }
  }

  shutdown_handler(SIGABRT);
}
