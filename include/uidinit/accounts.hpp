#pragma once
#include <optional>
#include <string>
#include <sys/types.h>

namespace uidinit {

struct Account {
  std::string name;
  uid_t uid{0};
  gid_t gid{0};
  std::string home;
  std::string shell;
};

class AccountDb {
public:
  virtual ~AccountDb() = default;
  virtual std::optional<Account> by_name(const std::string &name) const = 0;
  virtual std::optional<Account> by_uid(uid_t uid) const = 0;
};

// passwd database via getpwnam_r/getpwuid_r
class SystemAccountDb : public AccountDb {
public:
  std::optional<Account> by_name(const std::string &name) const override;
  std::optional<Account> by_uid(uid_t uid) const override;
};

} // namespace uidinit
