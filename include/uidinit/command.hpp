#pragma once
#include <string>
#include <vector>

namespace uidinit {

struct CmdResult {
  int exit_code{};
  std::string out;
  std::string err;
  int exec_errno{0}; // != 0: the command never started
};

class CommandRunner {
public:
  virtual ~CommandRunner() = default;
  virtual CmdResult run(const std::vector<std::string> &argv) = 0;
};

class SystemCommandRunner : public CommandRunner {
public:
  CmdResult run(const std::vector<std::string> &argv) override;
};

std::string join_argv(const std::vector<std::string> &argv);

} // namespace uidinit
