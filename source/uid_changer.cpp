#include <uidinit/config.hpp>
#include <uidinit/uid_changer.hpp>

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <vector>

namespace uidinit {

const char *to_string(ChangeOutcome o) {
  switch (o) {
  case ChangeOutcome::Changed:
    return "changed";
  case ChangeOutcome::AlreadySet:
    return "already_set";
  case ChangeOutcome::AccountMissing:
    return "account_missing";
  case ChangeOutcome::UidTaken:
    return "uid_taken";
  case ChangeOutcome::CommandFailed:
    return "command_failed";
  case ChangeOutcome::PermissionDenied:
    return "permission_denied";
  case ChangeOutcome::Error:
    return "error";
  }
  return "unknown";
}

ChangeOutcome UidChanger::apply(int target_uid) {
  try {
    return apply_checked(target_uid);
  } catch (const std::exception &e) {
    spdlog::error("[uid] unexpected failure while changing UID of `{}`: {}",
                  account_, e.what());
    return ChangeOutcome::Error;
  }
}

ChangeOutcome UidChanger::apply_checked(int target_uid) {
  if (!db_.by_name(account_)) {
    spdlog::error("[uid] user `{}` does not exist on this system", account_);
    return ChangeOutcome::AccountMissing;
  }

  if (auto owner = db_.by_uid(static_cast<uid_t>(target_uid))) {
    if (owner->name != account_) {
      spdlog::error("[uid] UID {} is already used by user `{}`", target_uid,
                    owner->name);
      return ChangeOutcome::UidTaken;
    }
    spdlog::info("[uid] UID {} is already the UID of `{}`; nothing to do",
                 target_uid, account_);
    return ChangeOutcome::AlreadySet;
  }

  const std::vector<std::string> cmd{usermod_, "-u",
                                     std::to_string(target_uid), account_};
  spdlog::info("[uid] running command: {}", join_argv(cmd));
  CmdResult r = runner_.run(cmd);

  if (r.exec_errno == EACCES || r.exec_errno == EPERM) {
    spdlog::error("[uid] permission denied running {} - you must run this "
                  "as root",
                  usermod_);
    return ChangeOutcome::PermissionDenied;
  }
  if (r.exec_errno != 0) {
    spdlog::error("[uid] failed to run {}: {}", usermod_,
                  std::strerror(r.exec_errno));
    return ChangeOutcome::CommandFailed;
  }

  if (r.exit_code == 0) {
    spdlog::info("[uid] success: UID of `{}` changed to {}", account_,
                 target_uid);
    return ChangeOutcome::Changed;
  }

  std::string detail = trim(r.err);
  if (detail.empty())
    detail = trim(r.out);
  spdlog::error("[uid] failed to change UID (rc={}). Command output: {}",
                r.exit_code, detail);
  return ChangeOutcome::CommandFailed;
}

} // namespace uidinit
