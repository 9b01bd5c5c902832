#pragma once
#include "accounts.hpp"
#include "command.hpp"
#include "config.hpp"

#include <string>
#include <utility>

namespace uidinit {

enum class ChangeOutcome {
  Changed,
  AlreadySet,
  AccountMissing,
  UidTaken,
  CommandFailed,
  PermissionDenied,
  Error
};

const char *to_string(ChangeOutcome o);

inline bool is_success(ChangeOutcome o) {
  return o == ChangeOutcome::Changed || o == ChangeOutcome::AlreadySet;
}

class UidChanger {
public:
  UidChanger(const AccountDb &db, CommandRunner &runner,
             std::string account = kAccountName,
             std::string usermod = "usermod")
      : db_(db), runner_(runner), account_(std::move(account)),
        usermod_(std::move(usermod)) {}

  // Read-only checks first; usermod is issued at most once and only when
  // the target uid is free. Never throws.
  ChangeOutcome apply(int target_uid);

  const std::string &account() const { return account_; }

private:
  ChangeOutcome apply_checked(int target_uid);

  const AccountDb &db_;
  CommandRunner &runner_;
  std::string account_;
  std::string usermod_;
};

} // namespace uidinit
