#pragma once
#include <optional>
#include <string>

namespace uidinit {

inline constexpr const char *kTargetUidEnv = "POSTGRES_UIDNUMBER";
inline constexpr const char *kLogLevelEnv = "UIDINIT_LOG_LEVEL";
inline constexpr const char *kAccountName = "postgres";

inline constexpr int kMinTargetUid = 50;
inline constexpr int kMaxTargetUid = 1000;

// Validates a raw env value. nullopt for unset, blank, non-integer or
// out-of-range input; one diagnostic line is logged per call.
std::optional<int> parse_target_uid(const std::optional<std::string> &raw,
                                     const std::string &env_name = kTargetUidEnv);

std::optional<int> read_target_uid(const std::string &env_name = kTargetUidEnv);

std::optional<std::string> get_env(const std::string &name);

std::string trim(const std::string &s);

} // namespace uidinit
