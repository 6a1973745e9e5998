#include "util/daemon.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>

#include <kj/debug.h>

#include "util/file.hpp"

namespace util {

void daemonize(const std::string& scope, std::string pidfile) {
  if (pidfile.empty()) {
    const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR");
    std::string base = runtime_dir != nullptr ? runtime_dir : "/tmp";
    pidfile = File::JoinPath(base, "codebox-" + scope + ".pid");
  }

  pid_t pid = fork();
  KJ_ASSERT(pid != -1, "fork", strerror(errno));
  if (pid > 0) _Exit(0);

  KJ_ASSERT(setsid() != -1, "setsid", strerror(errno));
  signal(SIGHUP, SIG_IGN);

  // Fork again so that the daemon can never reacquire a terminal.
  pid = fork();
  KJ_ASSERT(pid != -1, "fork", strerror(errno));
  if (pid > 0) _Exit(0);

  umask(0022);
  int null_fd = open("/dev/null", O_RDWR | O_CLOEXEC);
  KJ_ASSERT(null_fd != -1, "open /dev/null", strerror(errno));
  KJ_SYSCALL(dup2(null_fd, STDIN_FILENO));
  KJ_SYSCALL(dup2(null_fd, STDOUT_FILENO));
  KJ_SYSCALL(dup2(null_fd, STDERR_FILENO));
  close(null_fd);

  File::WriteString(pidfile, std::to_string(getpid()) + "\n");
}

}  // namespace util
