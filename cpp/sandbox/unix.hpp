#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP

#include "sandbox/runner.hpp"

namespace sandbox {

// Runner that starts `<shell> -c <command>` in a new session, with stderr
// merged into stdout, and kills the whole process group on timeouts, on
// output overflow and before returning.
class UnixRunner : public Runner {
 public:
  explicit UnixRunner(Shell shell, size_t max_output = kMaxOutputChars)
      : shell_(std::move(shell)), max_output_(max_output) {}

  ExecutionResult Run(const std::string& command,
                      int64_t timeout_millis) override;

 private:
  Shell shell_;
  size_t max_output_;
};

}  // namespace sandbox

#endif
