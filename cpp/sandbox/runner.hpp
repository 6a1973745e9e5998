#ifndef SANDBOX_RUNNER_HPP
#define SANDBOX_RUNNER_HPP

#include <cstdint>
#include <string>

namespace sandbox {

// Maximum number of output bytes kept from a single command. A cut never
// splits an UTF-8 sequence, so up to 3 fewer bytes may be kept.
static const constexpr size_t kMaxOutputChars = 10000;

// Appended to the output of a command that exceeded kMaxOutputChars. The
// marker is not counted in the cap.
static const constexpr char* kTruncationMarker = "\n... (output truncated) ...";

// Outcome of a command. Both stdout and stderr end up in output.
struct ExecutionResult {
  // True iff the command exited normally with status 0.
  bool success = false;
  std::string output;
  // Exit status; 128 + signal number if the command was killed by a signal,
  // -1 on timeouts and launch failures.
  int32_t exit_code = -1;
  bool timed_out = false;
  bool truncated = false;
  // The command could not be started or its output could not be read.
  bool launch_failed = false;
};

// The shell used to interpret commands. Chosen once, at startup.
struct Shell {
  std::string program;
  std::string flag;

  // Uses preferred if not empty (looked up on PATH if it is not a path),
  // otherwise /bin/sh, otherwise the first sh on PATH.
  static Shell Detect(const std::string& preferred = "");
};

// Runs shell commands with a timeout and a bound on the captured output.
// Implementations must be safe to call from multiple threads at once.
class Runner {
 public:
  // Runs command to completion, killing it if it runs for more than
  // timeout_millis milliseconds or writes more than the output cap. No
  // process started by the call is left running when it returns. Never
  // throws: failures to start the command are reported in the result.
  virtual ExecutionResult Run(const std::string& command,
                              int64_t timeout_millis) = 0;

  virtual ~Runner() = default;
  Runner() = default;
  Runner(const Runner&) = delete;
  Runner(Runner&&) = delete;
  Runner& operator=(const Runner&) = delete;
  Runner& operator=(Runner&&) = delete;
};

}  // namespace sandbox

#endif
