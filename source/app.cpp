#include <uidinit/app.hpp>
#include <uidinit/config.hpp>
#include <uidinit/idle.hpp>
#include <uidinit/uid_changer.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <unistd.h>
#include <variant>
#include <vector>

#ifndef UIDINIT_VERSION
#define UIDINIT_VERSION "unknown"
#endif

namespace uidinit {

static const char *kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

static void print_help() {
  std::cout <<
      R"(pg-uid-init - remap the UID of `postgres` from POSTGRES_UIDNUMBER, then idle

Usage:
  pg-uid-init [--log-level trace|debug|info|warn|error|critical|off]
              [--log-file PATH] [--log-rotate-max BYTES] [--log-rotate-files N]
              [--tick-sec N] [--usermod PATH]
  pg-uid-init --help | --version

Environment:
  POSTGRES_UIDNUMBER   target UID for `postgres`, 50..1000 (optional)
  UIDINIT_LOG_LEVEL    default log level (overridden by --log-level)
)";
}

static std::optional<spdlog::level::level_enum>
level_from(const std::string &name) {
  auto lvl = spdlog::level::from_str(name);
  if (lvl == spdlog::level::off && name != "off")
    return std::nullopt;
  return lvl;
}

void setup_logging(const CmdRun &opts) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  std::string file_error;
  if (opts.log_file) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          *opts.log_file, opts.log_rotate_max, opts.log_rotate_files));
    } catch (const spdlog::spdlog_ex &e) {
      file_error = e.what();
    }
  }

  auto logger =
      std::make_shared<spdlog::logger>("uidinit", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern(kLogPattern);
  spdlog::flush_on(spdlog::level::info);

  std::string level = "info";
  bool bad_env_level = false;
  if (opts.log_level) {
    level = *opts.log_level;
  } else if (auto env = get_env(kLogLevelEnv)) {
    if (level_from(trim(*env)))
      level = trim(*env);
    else
      bad_env_level = true;
  }
  spdlog::set_level(level_from(level).value_or(spdlog::level::info));

  if (bad_env_level)
    spdlog::warn("[app] ignoring unknown {} value", kLogLevelEnv);
  if (!file_error.empty())
    spdlog::warn("[app] failed to open log file {}: {}; logging to stdout only",
                 *opts.log_file, file_error);
}

StartupReport remap_from_env(const std::string &env_name, const AccountDb &db,
                             CommandRunner &runner,
                             const std::string &usermod) {
  StartupReport rep{};
  rep.target_uid = read_target_uid(env_name);
  if (!rep.target_uid) {
    spdlog::info("[app] no valid {} supplied - skipping UID change", env_name);
    return rep;
  }

  UidChanger changer(db, runner, kAccountName, usermod);
  rep.attempted = true;
  ChangeOutcome outcome = changer.apply(*rep.target_uid);
  rep.changed_ok = is_success(outcome);
  if (!rep.changed_ok) {
    spdlog::warn("[app] UID change was not successful ({}); continuing to "
                 "sleep loop anyway",
                 to_string(outcome));
  }
  return rep;
}

static int run_main(const CmdRun &opts) {
  setup_logging(opts);
  spdlog::info("[app] pg-uid-init {} starting (pid={})", UIDINIT_VERSION,
               ::getpid());

  if (::geteuid() != 0) {
    spdlog::warn("[app] not running as root; UID changes will likely fail");
  }

  // stop requests that arrive during the UID change are honoured by the
  // idle loop's first check
  static std::atomic_bool stop{false};
  install_stop_handlers(stop);

  SystemAccountDb db;
  SystemCommandRunner runner;
  (void)remap_from_env(kTargetUidEnv, db, runner, opts.usermod);

  IdleLoop idle(std::chrono::seconds(opts.tick_sec));
  idle.run(stop);

  spdlog::info("[app] received interrupt - exiting");
  spdlog::shutdown();
  return 0;
}

int App::run(int argc, char **argv) {
  spdlog::set_pattern(kLogPattern);

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;
        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("pg-uid-init {}\n", UIDINIT_VERSION);
          return 0;
        } else {
          try {
            return run_main(c);
          } catch (const std::exception &e) {
            spdlog::critical("[app] {}", e.what());
            return 1;
          }
        }
      },
      *pr.cmd);
}

} // namespace uidinit
