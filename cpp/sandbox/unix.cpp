#include "sandbox/unix.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>
#include <vector>

#include <kj/debug.h>

namespace sandbox {

namespace {
const constexpr int64_t kPollSliceMillis = 20;
const constexpr size_t kReadBufSize = 4096;

// Steps of the child before exec; reported back to the parent on failure.
enum ChildStage : int32_t { kSetsid = 1, kDevNull, kRedirect, kExec };

const char* StageName(int32_t stage) {
  switch (stage) {
    case kSetsid:
      return "setsid";
    case kDevNull:
      return "open /dev/null";
    case kRedirect:
      return "dup2";
    case kExec:
      return "exec";
    default:
      return "child";
  }
}

ExecutionResult LaunchFailure(const std::string& what, int err) {
  ExecutionResult result;
  result.launch_failed = true;
  result.output = "System Error: " + what + ": " + strerror(err);
  KJ_LOG(ERROR, "Command could not be run", result.output);
  return result;
}

// Largest position not after cut that does not split an UTF-8 sequence.
size_t Utf8Cut(const std::string& text, size_t cut) {
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
    cut--;
  }
  return cut;
}

using Clock = std::chrono::steady_clock;

// One running command. Not copyable: it owns the child and the pipe.
class Process {
 public:
  Process(const Shell& shell, const std::string& command)
      : shell_(shell), command_(command) {}
  ~Process() {
    if (out_fd_ != -1) close(out_fd_);
    if (pid_ > 0 && !reaped_) {
      KillGroup();
      Reap();
    }
  }
  KJ_DISALLOW_COPY(Process);

  // Starts the command. Returns false and sets *result on failure.
  bool Start(ExecutionResult* result);

  // Reads output until the command exits, the deadline passes or the output
  // exceeds max_output bytes.
  void Collect(Clock::time_point deadline, size_t max_output,
               ExecutionResult* result);

  // Exit status of a reaped command, 128 + signal for killed ones.
  int ExitCode() const {
    if (WIFSIGNALED(status_)) return 128 + WTERMSIG(status_);
    return WEXITSTATUS(status_);
  }

 private:
  [[noreturn]] void Child(int out_fd, int err_fd);

  // Reads everything currently available. Returns false on EOF.
  bool Drain(size_t max_output, ExecutionResult* result);

  bool WaitUntil(Clock::time_point deadline);
  void KillGroup() { kill(-pid_, SIGKILL); }
  void Reap();

  const Shell& shell_;
  const std::string& command_;
  pid_t pid_ = -1;
  int out_fd_ = -1;
  int status_ = 0;
  bool reaped_ = false;
};

bool Process::Start(ExecutionResult* result) {
  int out_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) == -1) {  // NOLINT
    *result = LaunchFailure("pipe", errno);
    return false;
  }
  int err_pipe[2];
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {  // NOLINT
    int err = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    *result = LaunchFailure("pipe", err);
    return false;
  }

  int fork_result = fork();
  if (fork_result == -1) {
    int err = errno;
    for (int fd : {out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      close(fd);
    }
    *result = LaunchFailure("fork", err);
    return false;
  }
  if (fork_result == 0) {
    close(out_pipe[0]);
    close(err_pipe[0]);
    Child(out_pipe[1], err_pipe[1]);
  }
  pid_ = fork_result;
  close(out_pipe[1]);
  close(err_pipe[1]);
  out_fd_ = out_pipe[0];

  // The error pipe is closed by a successful exec, so an empty read means
  // that the command is running.
  int32_t failure[2] = {0, 0};
  ssize_t num_read;
  while ((num_read = read(err_pipe[0], failure, sizeof(failure))) == -1 &&
         errno == EINTR) {
  }
  close(err_pipe[0]);
  if (num_read == sizeof(failure)) {
    Reap();
    *result = LaunchFailure(StageName(failure[0]), failure[1]);
    return false;
  }
  if (fcntl(out_fd_, F_SETFL, O_NONBLOCK) == -1) {
    *result = LaunchFailure("fcntl", errno);
    return false;
  }
  return true;
}

void Process::Child(int out_fd, int err_fd) {
  // Only async-signal-safe calls from here on.
  auto die = [err_fd](int32_t stage) {
    int32_t failure[2] = {stage, errno};
    ssize_t ignored = write(err_fd, failure, sizeof(failure));
    (void)ignored;
    _Exit(127);
  };

  // New session, so that the whole process tree can be killed at once and
  // does not receive signals from our terminal.
  if (setsid() == -1) die(kSetsid);

  // The server blocks the signals it waits for; do not pass that on.
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);

  int null_fd = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (null_fd == -1) die(kDevNull);
  if (dup2(null_fd, STDIN_FILENO) == -1) die(kRedirect);
  if (dup2(out_fd, STDOUT_FILENO) == -1) die(kRedirect);
  if (dup2(out_fd, STDERR_FILENO) == -1) die(kRedirect);

  const char* args[] = {shell_.program.c_str(), shell_.flag.c_str(),
                        command_.c_str(), nullptr};
  execv(args[0], const_cast<char* const*>(args));  // NOLINT
  die(kExec);
  _Exit(127);
}

bool Process::Drain(size_t max_output, ExecutionResult* result) {
  char buf[kReadBufSize];
  while (true) {
    ssize_t amount = read(out_fd_, buf, sizeof(buf));
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    if (amount == -1) {
      *result = LaunchFailure("read", errno);
      return false;
    }
    if (amount == 0) return false;
    result->output.append(buf, amount);
    if (result->output.size() > max_output) {
      result->output.resize(Utf8Cut(result->output, max_output));
      result->output += kTruncationMarker;
      result->truncated = true;
      return false;
    }
  }
}

bool Process::WaitUntil(Clock::time_point deadline) {
  while (!reaped_) {
    int ret = waitpid(pid_, &status_, WNOHANG);
    if (ret == -1 && errno != EINTR) {
      KJ_LOG(ERROR, "waitpid", strerror(errno));
      reaped_ = true;
      status_ = 0;
      return true;
    }
    if (ret == pid_) {
      reaped_ = true;
      return true;
    }
    if (Clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return true;
}

void Process::Reap() {
  while (!reaped_) {
    int ret = waitpid(pid_, &status_, 0);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1) KJ_LOG(ERROR, "waitpid", strerror(errno));
    reaped_ = true;
  }
}

void Process::Collect(Clock::time_point deadline, size_t max_output,
                      ExecutionResult* result) {
  struct pollfd pfd {};
  pfd.fd = out_fd_;
  pfd.events = POLLIN;
  bool open = true;
  while (open) {
    open = Drain(max_output, result);
    if (!open) break;
    // Background processes may keep the pipe open after the command itself
    // has exited: stop reading once the shell is gone.
    if (!reaped_ && WaitUntil(Clock::now())) {
      Drain(max_output, result);
      break;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                         deadline - Clock::now())
                         .count();
    if (remaining <= 0) {
      result->timed_out = true;
      break;
    }
    int slice =
        static_cast<int>(std::min<int64_t>(remaining, kPollSliceMillis));
    if (poll(&pfd, 1, slice) == -1 &&
        errno != EINTR) {
      *result = LaunchFailure("poll", errno);
      break;
    }
  }
  if (!result->timed_out && !result->truncated && !result->launch_failed &&
      !WaitUntil(deadline)) {
    result->timed_out = true;
  }
  KillGroup();
  Reap();
}

}  // namespace

ExecutionResult UnixRunner::Run(const std::string& command,
                                int64_t timeout_millis) {
  auto deadline = Clock::now() + std::chrono::milliseconds(timeout_millis);
  ExecutionResult result;
  Process process(shell_, command);
  if (!process.Start(&result)) return result;
  process.Collect(deadline, max_output_, &result);

  if (result.launch_failed) return result;
  if (result.timed_out) {
    KJ_LOG(WARNING, "Command timed out", command, timeout_millis);
    ExecutionResult timeout;
    timeout.timed_out = true;
    timeout.output = "TIMEOUT: execution exceeded the time limit (" +
                     std::to_string(timeout_millis) + " ms)";
    return timeout;
  }
  result.exit_code = process.ExitCode();
  result.success = result.exit_code == 0;
  return result;
}

}  // namespace sandbox
