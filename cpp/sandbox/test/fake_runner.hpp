#ifndef SANDBOX_TEST_FAKE_RUNNER_HPP
#define SANDBOX_TEST_FAKE_RUNNER_HPP

#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "sandbox/runner.hpp"

namespace sandbox {

// Runner that answers with a scripted handler and records every command.
// Commands the handler does not care about succeed with no output.
class FakeRunner : public Runner {
 public:
  using Handler = std::function<ExecutionResult(const std::string&)>;

  FakeRunner() : handler_([](const std::string&) { return Ok(); }) {}

  void SetHandler(Handler handler) {
    std::lock_guard<std::mutex> lck(mutex_);
    handler_ = std::move(handler);
  }

  ExecutionResult Run(const std::string& command,
                      int64_t timeout_millis) override {
    Handler handler;
    {
      std::lock_guard<std::mutex> lck(mutex_);
      commands_.push_back(command);
      timeouts_.push_back(timeout_millis);
      handler = handler_;
    }
    return handler(command);
  }

  std::vector<std::string> Commands() const {
    std::lock_guard<std::mutex> lck(mutex_);
    return commands_;
  }

  std::vector<int64_t> Timeouts() const {
    std::lock_guard<std::mutex> lck(mutex_);
    return timeouts_;
  }

  // Number of recorded commands containing needle.
  size_t Count(const std::string& needle) const {
    std::lock_guard<std::mutex> lck(mutex_);
    size_t count = 0;
    for (const std::string& command : commands_) {
      if (command.find(needle) != std::string::npos) count++;
    }
    return count;
  }

  void Clear() {
    std::lock_guard<std::mutex> lck(mutex_);
    commands_.clear();
    timeouts_.clear();
  }

  static ExecutionResult Ok(const std::string& output = "") {
    ExecutionResult result;
    result.success = true;
    result.exit_code = 0;
    result.output = output;
    return result;
  }

  static ExecutionResult Exit(int32_t exit_code, const std::string& output) {
    ExecutionResult result;
    result.success = exit_code == 0;
    result.exit_code = exit_code;
    result.output = output;
    return result;
  }

  static ExecutionResult Timeout(int64_t timeout_millis) {
    ExecutionResult result;
    result.timed_out = true;
    result.output = "TIMEOUT: execution exceeded the time limit (" +
                    std::to_string(timeout_millis) + " ms)";
    return result;
  }

 private:
  Handler handler_;
  std::vector<std::string> commands_;
  std::vector<int64_t> timeouts_;
  mutable std::mutex mutex_;
};

// True if command contains needle.
inline bool Contains(const std::string& command, const std::string& needle) {
  return command.find(needle) != std::string::npos;
}

}  // namespace sandbox

#endif
