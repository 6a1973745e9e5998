#include "worker/executor.hpp"

#include <kj/debug.h>

#include "worker/entry_unit.hpp"
#include "worker/validator.hpp"

namespace worker {

std::vector<std::string> Toolchain::CompileArgs(const std::string& unit) const {
  std::vector<std::string> args = compiler;
  args.push_back(FileName(unit));
  return args;
}

std::vector<std::string> Toolchain::RunArgs(const std::string& unit) const {
  std::vector<std::string> args = launcher;
  args.push_back(unit);
  return args;
}

core::JobResult Executor::Execute(const std::string& job_id,
                                  const std::string& source, size_t slot) {
  KJ_LOG(INFO, "Executing job", job_id, slot);
  try {
    store_->MarkRunning(job_id);
  } catch (const std::exception& e) {
    KJ_LOG(WARNING, "Could not mark job as running", job_id, e.what());
  }
  Outcome outcome = RunPipeline(job_id, source, slot);
  core::JobResult result;
  result.job_id = job_id;
  result.success = outcome.success;
  result.output = std::move(outcome.output);
  Finalize(result);
  return result;
}

Executor::Outcome Executor::RunPipeline(const std::string& job_id,
                                        const std::string& source,
                                        size_t slot) {
  std::string unit;
  {
    // A rejected job does not touch the container but still counts as an
    // attempt on the slot.
    Outcome rejected{false, ""};
    if (Utf8Length(source) > kMaxCodeLength) {
      rejected.output = "Security Error: Code exceeds the maximum length of " +
                        std::to_string(kMaxCodeLength) + " characters";
    } else {
      try {
        ValidateCode(source);
        unit = ResolveEntryUnit(source);
      } catch (const SecurityViolation& e) {
        rejected.output = std::string("Security Error: ") + e.what();
      } catch (const ResolutionError& e) {
        rejected.output = std::string("Compile Error: ") + e.what();
      }
    }
    if (!rejected.output.empty()) {
      try {
        pool_->RecordUsage(slot);
      } catch (const std::exception& e) {
        KJ_LOG(ERROR, "Could not record usage", slot, e.what());
      }
      return rejected;
    }
  }

  uint32_t attempts = options_.max_retries + 1;
  try {
    Workspace workspace(options_.workspace_root, job_id);
    for (uint32_t attempt = 1; attempt <= attempts; attempt++) {
      try {
        return Attempt(&workspace, unit, source, slot);
      } catch (const std::exception& e) {
        KJ_LOG(WARNING, "Attempt failed", job_id, slot, attempt, e.what());
      }
      if (attempt == attempts) break;
      try {
        pool_->Reset(slot);
      } catch (const std::exception& e) {
        KJ_LOG(ERROR, "Could not reset slot", slot, e.what());
      }
    }
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Could not set up the workspace", job_id, e.what());
  }
  return {false, "System Error: execution failed after " +
                     std::to_string(attempts) + " attempts"};
}

Executor::Outcome Executor::Attempt(Workspace* workspace,
                                    const std::string& unit,
                                    const std::string& source, size_t slot) {
  if (pool_->NeedsReset(slot)) pool_->Reset(slot);
  KJ_DEFER(pool_->RecordUsage(slot));

  workspace->Prepare(options_.toolchain.FileName(unit), source);

  const std::string& name = pool_->ContainerName(slot);
  sandbox::ExecutionResult probe = runner_->Run(
      pool_->Commands().Probe(name), options_.probe_timeout_millis);
  KJ_REQUIRE(probe.success &&
                 sandbox::ContainerCommands::ParseProbe(probe.output),
             "Container is not running", name, probe.output);

  sandbox::ExecutionResult compile =
      Exec(slot, workspace->JobDir(), options_.toolchain.CompileArgs(unit),
           options_.compile_timeout_millis, /*user_exit_codes=*/false);
  if (!compile.success) return {false, compile.output};

  // Any exit status of the program is its own result.
  sandbox::ExecutionResult run =
      Exec(slot, workspace->JobDir(), options_.toolchain.RunArgs(unit),
           options_.run_timeout_millis, /*user_exit_codes=*/true);
  return {run.success, run.output};
}

sandbox::ExecutionResult Executor::Exec(size_t slot, const std::string& job_dir,
                                        const std::vector<std::string>& argv,
                                        int64_t timeout_millis,
                                        bool user_exit_codes) {
  const std::string& name = pool_->ContainerName(slot);
  sandbox::ExecutionResult result = runner_->Run(
      pool_->Commands().Exec(name, job_dir, argv), timeout_millis);
  KJ_REQUIRE(!result.launch_failed, "Could not run command", argv[0],
             result.output);
  if (result.timed_out) {
    // The process may still be running inside the container.
    pool_->MarkUnsafe(slot);
    return result;
  }
  KJ_REQUIRE(user_exit_codes ||
                 !sandbox::ContainerCommands::IsRuntimeError(result.exit_code),
             "Container runtime error", name, result.exit_code,
             result.output);
  return result;
}

void Executor::Finalize(const core::JobResult& result) {
  try {
    store_->Complete(result.job_id, result.success, result.output);
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Could not store job result", result.job_id, e.what());
  }
  try {
    notifier_->Notify(result);
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Could not deliver job result", result.job_id, e.what());
  }
}

}  // namespace worker
