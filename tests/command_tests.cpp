#include "test_support.hpp"

#include <uidinit/command.hpp>

#include <cerrno>

using namespace uidinit;

TEST_CASE("successful command captures stdout") {
  SystemCommandRunner r;
  auto res = r.run({"/bin/sh", "-c", "echo hello"});
  REQUIRE(res.exit_code == 0);
  REQUIRE(res.exec_errno == 0);
  REQUIRE(res.out == "hello\n");
  REQUIRE(res.err.empty());
}

TEST_CASE("failing command reports exit code and stderr") {
  SystemCommandRunner r;
  auto res = r.run({"/bin/sh", "-c", "echo 'usermod: no' >&2; exit 6"});
  REQUIRE(res.exit_code == 6);
  REQUIRE(res.exec_errno == 0);
  REQUIRE(res.err == "usermod: no\n");
}

TEST_CASE("stderr larger than a pipe buffer does not block stdout") {
  SystemCommandRunner r;
  auto res = r.run(
      {"/bin/sh", "-c", "head -c 200000 /dev/zero | tr '\\0' x >&2; echo done"});
  REQUIRE(res.exit_code == 0);
  REQUIRE(res.out == "done\n");
  REQUIRE(res.err.size() == 200000);
  REQUIRE(res.err.find_first_not_of('x') == std::string::npos);
}

TEST_CASE("killed command maps to 128+signal") {
  SystemCommandRunner r;
  auto res = r.run({"/bin/sh", "-c", "kill -9 $$"});
  REQUIRE(res.exit_code == 128 + 9);
}

TEST_CASE("missing binary reports exec errno") {
  SystemCommandRunner r;
  auto res = r.run({"/nonexistent/uidinit-usermod"});
  REQUIRE(res.exec_errno == ENOENT);
  REQUIRE(res.exit_code == 127);
  REQUIRE_FALSE(res.err.empty());
}

TEST_CASE("empty argv is rejected without forking") {
  SystemCommandRunner r;
  auto res = r.run({});
  REQUIRE(res.exit_code == -1);
  REQUIRE(res.err == "empty argv");
}

TEST_CASE("join_argv") {
  REQUIRE(join_argv({"usermod", "-u", "999", "postgres"}) ==
          "usermod -u 999 postgres");
  REQUIRE(join_argv({}).empty());
}
