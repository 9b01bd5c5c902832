#pragma once
#include "accounts.hpp"
#include "cli.hpp"
#include "command.hpp"
#include "config.hpp"

#include <optional>
#include <string>

namespace uidinit {

struct StartupReport {
  std::optional<int> target_uid;
  bool attempted = false;
  bool changed_ok = false;
};

// Reads env_name and, when it holds a valid UID, applies it to the
// account. Failures are logged and reported, never thrown: the caller goes
// on to idle either way.
StartupReport remap_from_env(const std::string &env_name, const AccountDb &db,
                             CommandRunner &runner,
                             const std::string &usermod = "usermod");

void setup_logging(const CmdRun &opts);

class App {
public:
  int run(int argc, char **argv);
};

} // namespace uidinit
