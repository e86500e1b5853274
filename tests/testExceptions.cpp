#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

using Catch::Matchers::Equals;

#include <exceptions/exceptions.h>
#include <filesystem>
#include <fstream>
#include <iostream>

TEST_CASE("Exceptions", "[Exceptions]") {
  REQUIRE(safe_dump_stacktrace_to("stacktrace.txt"));
  auto object_trace = load_stacktrace_from("stacktrace.txt");
  REQUIRE(object_trace);

  auto stacktrace = object_trace->resolve();
  REQUIRE(stacktrace.frames.size() > 0);
  stacktrace.print(std::cout, false);

  std::filesystem::remove("stacktrace.txt");
}

TEST_CASE("Missing or broken dumps", "[Exceptions]") {
  REQUIRE_FALSE(load_stacktrace_from("this-dump-does-not-exist.txt"));
  REQUIRE_FALSE(safe_dump_stacktrace_to("/this/folder/does/not/exist/stacktrace.txt"));

  {
    std::ofstream truncated("truncated.txt");
    truncated << "ab";
  }
  REQUIRE_FALSE(load_stacktrace_from("truncated.txt"));
  std::filesystem::remove("truncated.txt");
}

TEST_CASE("Backtrace file location", "[Exceptions]") {
  setenv("PORTMAN_CFG_FOLDER", "/tmp/portman-test", 1);
  init_backtrace_file();
  REQUIRE_THAT(std::string(backtrace_file), Equals("/tmp/portman-test/backtrace.dump"));

  unsetenv("PORTMAN_CFG_FOLDER");
  init_backtrace_file();
  REQUIRE_THAT(std::string(backtrace_file), Equals("./backtrace.dump"));
}
