#include <uidinit/command.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace uidinit {

static int safe_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC); }

static void close_all(std::initializer_list<int> fds) {
  for (int fd : fds)
    if (fd >= 0)
      ::close(fd);
}

// Drains both pipes together so a child filling one of them cannot block
// while we wait on the other.
static void read_both(int out_fd, int err_fd, std::string &out,
                      std::string &err) {
  std::array<char, 4096> buf{};
  struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
  std::string *dst[2] = {&out, &err};
  int open_count = 2;
  while (open_count > 0) {
    int rc = ::poll(fds, 2, -1);
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0)
        continue;
      ssize_t n = ::read(fds[i].fd, buf.data(), buf.size());
      if (n > 0) {
        dst[i]->append(buf.data(), static_cast<std::size_t>(n));
      } else if (n < 0 && errno == EINTR) {
        continue;
      } else {
        fds[i].fd = -1;
        --open_count;
      }
    }
  }
}

std::string join_argv(const std::vector<std::string> &argv) {
  std::string s;
  for (std::size_t i = 0; i < argv.size(); ++i) {
    if (i)
      s += ' ';
    s += argv[i];
  }
  return s;
}

CmdResult SystemCommandRunner::run(const std::vector<std::string> &args) {
  CmdResult res{};
  if (args.empty()) {
    res.exit_code = -1;
    res.err = "empty argv";
    return res;
  }

  int out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, exec_pipe[2] = {-1, -1};
  if (safe_pipe(out_pipe) != 0 || safe_pipe(err_pipe) != 0 ||
      safe_pipe(exec_pipe) != 0) {
    res.exit_code = -1;
    res.err = std::string("pipe failed: ") + std::strerror(errno);
    close_all({out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
               exec_pipe[0], exec_pipe[1]});
    return res;
  }

  std::vector<char *> argv_c;
  argv_c.reserve(args.size() + 1);
  for (auto &s : args)
    argv_c.push_back(const_cast<char *>(s.c_str()));
  argv_c.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid == -1) {
    res.exit_code = -1;
    res.err = std::string("fork failed: ") + std::strerror(errno);
    close_all({out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1],
               exec_pipe[0], exec_pipe[1]});
    return res;
  }

  if (pid == 0) {
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);

    ::execvp(argv_c[0], argv_c.data());

    int e = errno;
    (void)!::write(exec_pipe[1], &e, sizeof(e));
    _exit(127);
  }

  close_all({out_pipe[1], err_pipe[1], exec_pipe[1]});

  // closed by exec (O_CLOEXEC) on success, carries errno otherwise
  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(exec_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(child_errno)))
    res.exec_errno = child_errno;

  read_both(out_pipe[0], err_pipe[0], res.out, res.err);
  close_all({out_pipe[0], err_pipe[0]});

  int status = 0;
  pid_t r;
  do {
    r = ::waitpid(pid, &status, 0);
  } while (r == -1 && errno == EINTR);
  if (r == -1) {
    res.exit_code = -1;
    if (res.err.empty())
      res.err = std::string("waitpid failed: ") + std::strerror(errno);
    return res;
  }
  if (WIFEXITED(status))
    res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.exit_code = 128 + WTERMSIG(status);
  else
    res.exit_code = -1;

  if (res.exec_errno != 0 && res.err.empty())
    res.err = std::strerror(res.exec_errno);

  return res;
}

} // namespace uidinit
