#include <uidinit/config.hpp>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>

namespace uidinit {

std::string trim(const std::string &s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
    ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
    --e;
  return s.substr(b, e - b);
}

std::optional<std::string> get_env(const std::string &name) {
  const char *v = ::getenv(name.c_str());
  if (!v)
    return std::nullopt;
  return std::string(v);
}

static std::optional<long long> parse_integer(const std::string &s) {
  std::size_t i = 0;
  if (i < s.size() && (s[i] == '+' || s[i] == '-'))
    ++i;
  if (i == s.size())
    return std::nullopt;
  for (std::size_t k = i; k < s.size(); ++k) {
    if (!std::isdigit(static_cast<unsigned char>(s[k])))
      return std::nullopt;
  }
  // saturates at LLONG_MIN/LLONG_MAX, which is out of range anyway
  return std::strtoll(s.c_str(), nullptr, 10);
}

std::optional<int> parse_target_uid(const std::optional<std::string> &raw,
                                    const std::string &env_name) {
  if (!raw) {
    spdlog::info("[config] environment variable {} is not set - no UID "
                 "change will be performed",
                 env_name);
    return std::nullopt;
  }

  const std::string value = trim(*raw);
  if (value.empty()) {
    spdlog::warn("[config] {} is set but empty - ignoring", env_name);
    return std::nullopt;
  }

  auto num = parse_integer(value);
  if (!num) {
    spdlog::error("[config] {}='{}' is not a valid integer", env_name, value);
    return std::nullopt;
  }

  if (*num < kMinTargetUid || *num > kMaxTargetUid) {
    spdlog::error("[config] UID {} is out of the allowed range ({}-{})", value,
                  kMinTargetUid, kMaxTargetUid);
    return std::nullopt;
  }

  spdlog::info("[config] target UID {} from {}", *num, env_name);
  return static_cast<int>(*num);
}

std::optional<int> read_target_uid(const std::string &env_name) {
  return parse_target_uid(get_env(env_name), env_name);
}

} // namespace uidinit
