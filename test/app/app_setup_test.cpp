#include "app/app_setup.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <spdlog/spdlog.h>

TEST_CASE("ParsePipeName finds the pipe argument", "[app]") {
  using Args = std::vector<std::string>;

  CHECK(app::ParsePipeName(Args{"xdrls", "--pipe=/tmp/xdrls.sock"}) ==
        "/tmp/xdrls.sock");
  CHECK(app::ParsePipeName(Args{"xdrls", "--stdio", "--pipe=p"}) == "p");

  CHECK_FALSE(app::ParsePipeName(Args{"xdrls"}).has_value());
  CHECK_FALSE(app::ParsePipeName(Args{"xdrls", "--pipe="}).has_value());
  CHECK_FALSE(app::ParsePipeName(Args{"xdrls", "--pipe", "p"}).has_value());
  // argv[0] is never an option
  CHECK_FALSE(app::ParsePipeName(Args{"--pipe=p"}).has_value());
}

TEST_CASE("ParseLogLevel maps level names", "[app]") {
  CHECK(app::ParseLogLevel("trace") == spdlog::level::trace);
  CHECK(app::ParseLogLevel("info") == spdlog::level::info);
  CHECK(app::ParseLogLevel("error") == spdlog::level::err);
  CHECK(app::ParseLogLevel("off") == spdlog::level::off);
  CHECK(app::ParseLogLevel("verbose") == spdlog::level::debug);
}

TEST_CASE("SetupLoggers creates the named loggers", "[app]") {
  auto loggers = app::SetupLoggers();

  REQUIRE(loggers.size() == 3);
  CHECK(loggers.contains("transport"));
  CHECK(loggers.contains("jsonrpc"));
  REQUIRE(loggers.contains("xdrls"));
  CHECK(loggers["transport"]->level() == spdlog::level::info);
  CHECK(spdlog::default_logger() == loggers["xdrls"]);
}
