#include <uidinit/cli.hpp>

#include <cerrno>
#include <cstdlib>
#include <string_view>

namespace uidinit {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static std::optional<long long> to_number(const char *s) {
  if (!s || !*s)
    return std::nullopt;
  char *end = nullptr;
  errno = 0;
  long long v = std::strtoll(s, &end, 10);
  if (errno != 0 || *end != '\0')
    return std::nullopt;
  return v;
}

static bool valid_level(std::string_view l) {
  return l == "trace" || l == "debug" || l == "info" || l == "warn" ||
         l == "warning" || l == "error" || l == "err" || l == "critical" ||
         l == "off";
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  CmdRun c{};

  for (int i = 1; i < argc; i++) {
    std::string_view a = argv[i];
    if (a == "--help" || a == "-h" || a == "help") {
      r.cmd = CmdHelp{};
      return r;
    }
    if (a == "--version" || a == "version") {
      r.cmd = CmdVersion{};
      return r;
    }

    if (a == "--log-level" && has_arg(i, argc)) {
      std::string_view l = argv[++i];
      if (!valid_level(l)) {
        r.error = "--log-level: unknown level '" + std::string(l) + "'";
        return r;
      }
      c.log_level = std::string(l);
    } else if (a == "--log-file" && has_arg(i, argc)) {
      c.log_file = std::string(argv[++i]);
    } else if (a == "--log-rotate-max" && has_arg(i, argc)) {
      auto v = to_number(argv[++i]);
      if (!v || *v <= 0) {
        r.error = "--log-rotate-max: positive number of bytes required";
        return r;
      }
      c.log_rotate_max = static_cast<std::size_t>(*v);
    } else if (a == "--log-rotate-files" && has_arg(i, argc)) {
      auto v = to_number(argv[++i]);
      if (!v || *v < 0) {
        r.error = "--log-rotate-files: non-negative number required";
        return r;
      }
      c.log_rotate_files = static_cast<std::size_t>(*v);
    } else if (a == "--tick-sec" && has_arg(i, argc)) {
      auto v = to_number(argv[++i]);
      if (!v || *v <= 0 || *v > 24 * 3600) {
        r.error = "--tick-sec: number of seconds in 1..86400 required";
        return r;
      }
      c.tick_sec = static_cast<int>(*v);
    } else if (a == "--usermod" && has_arg(i, argc)) {
      c.usermod = argv[++i];
      if (c.usermod.empty()) {
        r.error = "--usermod: path required";
        return r;
      }
    } else {
      r.error = "unknown argument: " + std::string(a);
      return r;
    }
  }

  r.cmd = c;
  return r;
}

} // namespace uidinit
