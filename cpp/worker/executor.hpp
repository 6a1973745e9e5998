#ifndef WORKER_EXECUTOR_HPP
#define WORKER_EXECUTOR_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <kj/common.h>

#include "core/job.hpp"
#include "sandbox/pool.hpp"
#include "sandbox/runner.hpp"
#include "worker/workspace.hpp"

namespace worker {

// How sources are compiled and started inside the containers.
struct Toolchain {
  std::string extension = ".java";
  std::vector<std::string> compiler = {"javac", "-encoding", "UTF-8"};
  std::vector<std::string> launcher = {"java", "-Dfile.encoding=UTF-8"};

  std::string FileName(const std::string& unit) const {
    return unit + extension;
  }
  std::vector<std::string> CompileArgs(const std::string& unit) const;
  std::vector<std::string> RunArgs(const std::string& unit) const;
};

struct ExecutorOptions {
  // Host directory mounted in the containers; job directories go here.
  std::string workspace_root = "/tmp/compiler";
  int64_t compile_timeout_millis = 10000;
  int64_t run_timeout_millis = 5000;
  int64_t probe_timeout_millis = 5000;
  // Attempts after the first one, each on a freshly reset slot.
  uint32_t max_retries = 1;
  Toolchain toolchain;
};

// Runs the pipeline of a job on a pool slot: validation, entry unit
// resolution, workspace preparation, compilation and run. Jobs on different
// slots may run concurrently; the caller guarantees that a slot runs one job
// at a time.
class Executor {
 public:
  Executor(sandbox::Pool* pool, sandbox::Runner* runner, core::JobStore* store,
           core::ResultNotifier* notifier, ExecutorOptions options)
      : pool_(pool),
        runner_(runner),
        store_(store),
        notifier_(notifier),
        options_(std::move(options)) {}
  KJ_DISALLOW_COPY(Executor);

  // Runs the job on the given slot and finalizes it in the store and the
  // notifier. Never throws: every outcome becomes a final result. Sources
  // longer than kMaxCodeLength characters are rejected before parsing.
  core::JobResult Execute(const std::string& job_id, const std::string& source,
                          size_t slot);

 private:
  struct Outcome {
    bool success;
    std::string output;
  };

  Outcome RunPipeline(const std::string& job_id, const std::string& source,
                      size_t slot);

  // One attempt on the slot. Infrastructure failures are thrown.
  Outcome Attempt(Workspace* workspace, const std::string& unit,
                  const std::string& source, size_t slot);

  // Runs a command in the container of the slot, turning launch failures
  // into exceptions. Exit codes of the container runtime are exceptions too,
  // unless user_exit_codes is set: the command is the user program and its
  // exit status is passed through.
  sandbox::ExecutionResult Exec(size_t slot, const std::string& job_dir,
                                const std::vector<std::string>& argv,
                                int64_t timeout_millis, bool user_exit_codes);

  void Finalize(const core::JobResult& result);

  sandbox::Pool* pool_;
  sandbox::Runner* runner_;
  core::JobStore* store_;
  core::ResultNotifier* notifier_;
  ExecutorOptions options_;
};

}  // namespace worker

#endif
