#include "test_support.hpp"

#include <uidinit/app.hpp>
#include <uidinit/config.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace uidinit;
namespace fs = std::filesystem;

static fs::path mkd(const char *name) {
  auto d = fs::temp_directory_path() / (std::string("uidinit_log_") + name);
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

static std::string slurp(const fs::path &p) {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

TEST_CASE("log level comes from the environment") {
  ::setenv(kLogLevelEnv, "debug", 1);
  setup_logging(CmdRun{});
  REQUIRE(spdlog::get_level() == spdlog::level::debug);

  ::setenv(kLogLevelEnv, " warn ", 1);
  setup_logging(CmdRun{});
  REQUIRE(spdlog::get_level() == spdlog::level::warn);
  ::unsetenv(kLogLevelEnv);
}

TEST_CASE("--log-level overrides the environment") {
  ::setenv(kLogLevelEnv, "debug", 1);
  CmdRun opts;
  opts.log_level = "error";
  setup_logging(opts);
  REQUIRE(spdlog::get_level() == spdlog::level::err);
  ::unsetenv(kLogLevelEnv);
}

TEST_CASE("default level is info") {
  ::unsetenv(kLogLevelEnv);
  setup_logging(CmdRun{});
  REQUIRE(spdlog::get_level() == spdlog::level::info);
}

TEST_CASE("unknown env level keeps info and warns") {
  auto dir = mkd("badlevel");
  ::setenv(kLogLevelEnv, "loud", 1);
  CmdRun opts;
  opts.log_file = (dir / "uidinit.log").string();
  setup_logging(opts);
  spdlog::default_logger()->flush();

  REQUIRE(spdlog::get_level() == spdlog::level::info);
  REQUIRE(slurp(dir / "uidinit.log").find("ignoring unknown UIDINIT_LOG_LEVEL") !=
          std::string::npos);
  ::unsetenv(kLogLevelEnv);
}

TEST_CASE("log file receives output next to stdout") {
  ::unsetenv(kLogLevelEnv);
  auto dir = mkd("file");
  CmdRun opts;
  opts.log_file = (dir / "uidinit.log").string();
  setup_logging(opts);

  REQUIRE(spdlog::default_logger()->sinks().size() == 2);
  spdlog::info("[test] written to file");
  spdlog::default_logger()->flush();

  std::string text = slurp(dir / "uidinit.log");
  REQUIRE(text.find("[info] [test] written to file") != std::string::npos);
}

TEST_CASE("log file rotates at the configured size") {
  ::unsetenv(kLogLevelEnv);
  auto dir = mkd("rotate");
  CmdRun opts;
  opts.log_file = (dir / "uidinit.log").string();
  opts.log_rotate_max = 512;
  opts.log_rotate_files = 2;
  setup_logging(opts);

  for (int i = 0; i < 50; ++i)
    spdlog::info("[test] rotation line {}", i);
  spdlog::default_logger()->flush();

  REQUIRE(fs::exists(dir / "uidinit.1.log"));
  REQUIRE_FALSE(fs::exists(dir / "uidinit.3.log"));
}

TEST_CASE("unopenable log file falls back to stdout only") {
  ::unsetenv(kLogLevelEnv);
  CmdRun opts;
  opts.log_file = "/proc/uidinit-no-such-dir/uidinit.log";

  REQUIRE_NOTHROW(setup_logging(opts));
  REQUIRE(spdlog::default_logger()->sinks().size() == 1);
  REQUIRE(spdlog::get_level() == spdlog::level::info);
  REQUIRE_NOTHROW(spdlog::info("[test] still logging"));
}
