#include <uidinit/accounts.hpp>

#include <cerrno>
#include <pwd.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace uidinit {

static std::size_t pw_buffer_size() {
  long n = ::sysconf(_SC_GETPW_R_SIZE_MAX);
  return n > 0 ? static_cast<std::size_t>(n) : 16384;
}

static Account to_account(const struct passwd &pw) {
  Account a;
  a.name = pw.pw_name ? pw.pw_name : "";
  a.uid = pw.pw_uid;
  a.gid = pw.pw_gid;
  a.home = pw.pw_dir ? pw.pw_dir : "";
  a.shell = pw.pw_shell ? pw.pw_shell : "";
  return a;
}

// Retries with a bigger buffer on ERANGE. Any other error is not a
// "not found" and is raised.
template <typename Lookup>
static std::optional<Account> lookup(Lookup fn, const char *what) {
  std::vector<char> buf(pw_buffer_size());
  for (;;) {
    struct passwd pw {};
    struct passwd *res = nullptr;
    int rc = fn(&pw, buf.data(), buf.size(), &res);
    if (rc == ERANGE) {
      buf.resize(buf.size() * 2);
      continue;
    }
    if (rc == 0 && res)
      return to_account(pw);
    if (rc == 0 || rc == ENOENT || rc == ESRCH || rc == EBADF || rc == EPERM)
      return std::nullopt;
    throw std::system_error(rc, std::generic_category(), what);
  }
}

std::optional<Account> SystemAccountDb::by_name(const std::string &name) const {
  return lookup(
      [&](struct passwd *pw, char *b, std::size_t n, struct passwd **res) {
        return ::getpwnam_r(name.c_str(), pw, b, n, res);
      },
      "getpwnam_r");
}

std::optional<Account> SystemAccountDb::by_uid(uid_t uid) const {
  return lookup(
      [&](struct passwd *pw, char *b, std::size_t n, struct passwd **res) {
        return ::getpwuid_r(uid, pw, b, n, res);
      },
      "getpwuid_r");
}

} // namespace uidinit
