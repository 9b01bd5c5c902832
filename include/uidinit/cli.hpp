#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace uidinit {

struct CmdRun {
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::size_t log_rotate_max = 10 * 1024 * 1024;
  std::size_t log_rotate_files = 3;
  int tick_sec = 3600;
  std::string usermod = "usermod";
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdRun, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace uidinit
