#include <stdexcept>
#include "core/job_store.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/test/fake_runner.hpp"
#include "util/file.hpp"
#include "worker/executor.hpp"
#include "worker/validator.hpp"

namespace {

const char* test_tmpdir = "/tmp/codebox_testdir";

const char* kHello =
    "public class Hi{public static void main(String[] a){"
    "System.out.println(\"hi\");}}";

using ::testing::HasSubstr;
using ::testing::StartsWith;

using core::Job;
using core::JobResult;
using core::JobStatus;
using sandbox::Contains;
using sandbox::ExecutionResult;
using sandbox::FakeRunner;
using util::File;

class RecordingNotifier : public core::ResultNotifier {
 public:
  void Notify(const JobResult& result) override {
    results.push_back(result);
    if (fail) throw std::runtime_error("delivery failed");
  }
  std::vector<JobResult> results;
  bool fail = false;
};

class ExecutorTest : public ::testing::Test {
 protected:
  ExecutorTest()
      : tmp_(test_tmpdir),
        pool_(&runner_, sandbox::ContainerCommands(sandbox::ContainerConfig()),
              PoolOptions()),
        executor_(&pool_, &runner_, &store_, &notifier_, Options()) {
    runner_.SetHandler(
        [this](const std::string& command) { return Handle(command); });
  }

  static sandbox::PoolOptions PoolOptions() {
    sandbox::PoolOptions options;
    options.num_slots = 2;
    options.max_usage = 3;
    return options;
  }

  worker::ExecutorOptions Options() {
    worker::ExecutorOptions options;
    options.workspace_root = tmp_.Path();
    return options;
  }

  // Default behavior of a healthy container running a program that prints
  // "hi". Tests override the single steps.
  ExecutionResult Handle(const std::string& command) {
    if (Contains(command, "'inspect'")) return probe_(command);
    if (Contains(command, "'javac'")) return compile_(command);
    if (Contains(command, "'java'")) return run_(command);
    return create_(command);
  }

  JobResult Execute(const std::string& source, size_t slot = 0) {
    std::string id = store_.Create(source);
    return executor_.Execute(id, source, slot);
  }

  Job Stored(const std::string& id) {
    Job job;
    EXPECT_TRUE(store_.Get(id, &job));
    return job;
  }

  std::string JobDir(const std::string& id) {
    return File::JoinPath(tmp_.Path(), id);
  }

  FakeRunner::Handler probe_ = [](const std::string&) {
    return FakeRunner::Ok("true\n");
  };
  FakeRunner::Handler compile_ = [](const std::string&) {
    return FakeRunner::Ok();
  };
  FakeRunner::Handler run_ = [](const std::string&) {
    return FakeRunner::Ok("hi\n");
  };
  FakeRunner::Handler create_ = [](const std::string&) {
    return FakeRunner::Ok();
  };

  util::TempDir tmp_;
  FakeRunner runner_;
  core::MemoryJobStore store_;
  RecordingNotifier notifier_;
  sandbox::Pool pool_;
  worker::Executor executor_;
};

// NOLINTNEXTLINE
TEST_F(ExecutorTest, Success) {
  std::string source_seen;
  std::string id = store_.Create(kHello);
  compile_ = [&](const std::string&) {
    source_seen = File::ReadString(File::JoinPath(JobDir(id), "Hi.java"));
    return FakeRunner::Ok();
  };
  JobResult result = executor_.Execute(id, kHello, 1);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "hi\n");
  EXPECT_EQ(result.job_id, id);
  EXPECT_EQ(source_seen, kHello);

  std::vector<std::string> commands = runner_.Commands();
  ASSERT_EQ(commands.size(), 3);
  EXPECT_EQ(commands[0],
            "'docker' 'inspect' '-f' '{{.State.Running}}' "
            "'compile-executor-1'");
  EXPECT_EQ(commands[1], "'docker' 'exec' '-w' '/app/" + id +
                             "' 'compile-executor-1' 'javac' '-encoding' "
                             "'UTF-8' 'Hi.java'");
  EXPECT_EQ(commands[2], "'docker' 'exec' '-w' '/app/" + id +
                             "' 'compile-executor-1' 'java' "
                             "'-Dfile.encoding=UTF-8' 'Hi'");
  EXPECT_EQ(runner_.Timeouts()[1], 10000);
  EXPECT_EQ(runner_.Timeouts()[2], 5000);

  Job job = Stored(id);
  EXPECT_EQ(job.status, JobStatus::COMPLETED);
  EXPECT_TRUE(job.success);
  EXPECT_EQ(job.output, "hi\n");
  ASSERT_EQ(notifier_.results.size(), 1);
  EXPECT_EQ(notifier_.results[0].job_id, id);
  EXPECT_FALSE(File::Exists(JobDir(id)));
  EXPECT_EQ(pool_.Usage(1), 1);
  EXPECT_EQ(pool_.Usage(0), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, SecurityViolation) {
  JobResult result = Execute(
      "public class A{public static void main(String[] a){"
      "Runtime.getRuntime().exec(\"ls\");}}");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output,
            "Security Error: Forbidden keyword detected: Runtime.getRuntime");
  EXPECT_TRUE(runner_.Commands().empty());
  EXPECT_EQ(Stored(result.job_id).status, JobStatus::COMPLETED);
  EXPECT_EQ(notifier_.results.size(), 1);
  EXPECT_EQ(pool_.Usage(0), 1);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, RejectedJobsCountTowardCapacity) {
  EXPECT_TRUE(Execute(kHello).success);
  EXPECT_EQ(pool_.Usage(0), 1);
  EXPECT_FALSE(Execute("class A { Thread t; }").success);
  EXPECT_EQ(pool_.Usage(0), 2);
  EXPECT_FALSE(Execute("class A {}").success);
  EXPECT_EQ(pool_.Usage(0), 3);
  EXPECT_EQ(runner_.Count("'rm'"), 0);

  // The slot reached max_usage: the next job starts with a reset.
  EXPECT_TRUE(Execute(kHello).success);
  EXPECT_EQ(runner_.Count("'rm' '-f' 'compile-executor-0'"), 1);
  EXPECT_EQ(pool_.Epoch(0), 1);
  EXPECT_EQ(pool_.Usage(0), 1);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, SourceTooLong) {
  // A long whitespace run must not reach the entry unit patterns.
  std::string source = "public class Hi{public" + std::string(40000, ' ') +
                       "static void main(String[] a){}}";
  JobResult result = Execute(source);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output,
            "Security Error: Code exceeds the maximum length of 10000 "
            "characters");
  EXPECT_TRUE(runner_.Commands().empty());
  EXPECT_EQ(Stored(result.job_id).status, JobStatus::COMPLETED);
  EXPECT_EQ(pool_.Usage(0), 1);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, SourceAtMaximumLength) {
  std::string source(kHello);
  source += std::string(worker::kMaxCodeLength - source.size(), ' ');
  EXPECT_TRUE(Execute(source).success);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, AmbiguousEntryPoint) {
  JobResult result =
      Execute("class A { public static void main(String[] a) {} }\n"
              "class B { public static void main(String[] a) {} }");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output, "Compile Error: only one main method is allowed");
  EXPECT_TRUE(runner_.Commands().empty());
  EXPECT_EQ(notifier_.results.size(), 1);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, NoEntryPoint) {
  JobResult result = Execute("class A {}");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output, "Compile Error: no main method found");
  EXPECT_EQ(runner_.Count("'javac'"), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, CompileError) {
  compile_ = [](const std::string&) {
    return FakeRunner::Exit(1, "Hi.java:1: error: ';' expected\n");
  };
  JobResult result = Execute(kHello);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output, "Hi.java:1: error: ';' expected\n");
  EXPECT_EQ(runner_.Count("'java' "), 0);
  EXPECT_EQ(runner_.Count("'rm'"), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, RuntimeFailureIsNotRetried) {
  run_ = [](const std::string&) {
    return FakeRunner::Exit(1, "Exception in thread \"main\"\n");
  };
  JobResult result = Execute(kHello);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output, "Exception in thread \"main\"\n");
  EXPECT_EQ(runner_.Count("'javac'"), 1);
  EXPECT_EQ(runner_.Count("'rm'"), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, RunExitCodesArePassedThrough) {
  // The same exit codes mean a runtime error when compiling.
  for (int code : {125, 126, 127}) {
    runner_.Clear();
    run_ = [code](const std::string&) {
      return FakeRunner::Exit(code, "user output\n");
    };
    JobResult result = Execute(
        "public class Hi{public static void main(String[] a){"
        "System. exit(" + std::to_string(code) + ");}}");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.output, "user output\n");
    EXPECT_EQ(runner_.Count("'javac'"), 1);
    EXPECT_EQ(runner_.Count("'rm'"), 0);
    EXPECT_EQ(pool_.Epoch(0), 0);
  }
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, RunTimeout) {
  run_ = [](const std::string&) { return FakeRunner::Timeout(5000); };
  JobResult result = Execute(
      "public class Loop{public static void main(String[] a){while(true){}}}");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output,
            "TIMEOUT: execution exceeded the time limit (5000 ms)");
  EXPECT_EQ(runner_.Count("'rm'"), 0);
  EXPECT_TRUE(pool_.NeedsReset(0));

  // The next job on the slot starts on a fresh container.
  run_ = [](const std::string&) { return FakeRunner::Ok("hi\n"); };
  runner_.Clear();
  EXPECT_TRUE(Execute(kHello).success);
  EXPECT_EQ(runner_.Count("'rm' '-f' 'compile-executor-0'"), 1);
  EXPECT_EQ(pool_.Epoch(0), 1);
  EXPECT_FALSE(pool_.NeedsReset(0));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, CompileTimeout) {
  compile_ = [](const std::string&) { return FakeRunner::Timeout(10000); };
  JobResult result = Execute(kHello);
  EXPECT_FALSE(result.success);
  EXPECT_THAT(result.output, StartsWith("TIMEOUT:"));
  EXPECT_EQ(runner_.Count("'java' "), 0);
  EXPECT_TRUE(pool_.Get(0).unsafe);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, CapacityReset) {
  for (int i = 0; i < 3; i++) pool_.RecordUsage(0);
  uint32_t usage_at_compile = 99;
  compile_ = [&](const std::string&) {
    usage_at_compile = pool_.Usage(0);
    return FakeRunner::Ok();
  };
  EXPECT_TRUE(Execute(kHello).success);
  EXPECT_EQ(usage_at_compile, 0);
  EXPECT_EQ(pool_.Usage(0), 1);
  EXPECT_EQ(pool_.Epoch(0), 1);
  std::vector<std::string> commands = runner_.Commands();
  ASSERT_GE(commands.size(), 2);
  EXPECT_EQ(commands[0], "'docker' 'rm' '-f' 'compile-executor-0'");
  EXPECT_THAT(commands[1], HasSubstr("'run' '-d'"));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, InfrastructureFailureIsRetriedOnce) {
  int calls = 0;
  compile_ = [&](const std::string&) {
    if (calls++ == 0) return FakeRunner::Exit(125, "Error from daemon");
    return FakeRunner::Ok();
  };
  JobResult result = Execute(kHello);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.output, "hi\n");
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(runner_.Count("'rm'"), 1);
  EXPECT_EQ(pool_.Epoch(0), 1);
  EXPECT_EQ(notifier_.results.size(), 1);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, RetriesExhausted) {
  compile_ = [](const std::string&) {
    return FakeRunner::Exit(127, "executable file not found");
  };
  JobResult result = Execute(kHello);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output, "System Error: execution failed after 2 attempts");
  EXPECT_EQ(runner_.Count("'javac'"), 2);
  EXPECT_EQ(runner_.Count("'rm'"), 1);
  EXPECT_EQ(runner_.Count("'java' "), 0);
  Job job = Stored(result.job_id);
  EXPECT_EQ(job.status, JobStatus::COMPLETED);
  EXPECT_FALSE(job.success);
  EXPECT_EQ(notifier_.results.size(), 1);
  EXPECT_FALSE(File::Exists(JobDir(result.job_id)));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, DeadContainer) {
  probe_ = [](const std::string&) { return FakeRunner::Ok("false\n"); };
  JobResult result = Execute(kHello);
  EXPECT_FALSE(result.success);
  EXPECT_THAT(result.output, StartsWith("System Error:"));
  EXPECT_EQ(runner_.Count("'inspect'"), 2);
  EXPECT_EQ(runner_.Count("'javac'"), 0);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, LaunchFailureIsInfrastructure) {
  int calls = 0;
  run_ = [&](const std::string&) {
    if (calls++ == 0) {
      ExecutionResult failed;
      failed.launch_failed = true;
      failed.output = "System Error: fork: Resource temporarily unavailable";
      return failed;
    }
    return FakeRunner::Ok("hi\n");
  };
  EXPECT_TRUE(Execute(kHello).success);
  EXPECT_EQ(calls, 2);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, ResetFailureDuringRetry) {
  compile_ = [](const std::string&) { return FakeRunner::Exit(125, "down"); };
  create_ = [](const std::string& command) {
    if (Contains(command, "'run'")) return FakeRunner::Exit(125, "no image");
    return FakeRunner::Ok();
  };
  JobResult result = Execute(kHello);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.output, "System Error: execution failed after 2 attempts");
  EXPECT_EQ(runner_.Count("'javac'"), 2);
  EXPECT_FALSE(File::Exists(JobDir(result.job_id)));
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, NotifierFailure) {
  notifier_.fail = true;
  JobResult result = Execute(kHello);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(notifier_.results.size(), 1);
  EXPECT_EQ(Stored(result.job_id).status, JobStatus::COMPLETED);
}

// NOLINTNEXTLINE
TEST_F(ExecutorTest, UnknownJob) {
  JobResult result = executor_.Execute("not-stored", kHello, 0);
  EXPECT_TRUE(result.success);
  EXPECT_EQ(notifier_.results.size(), 1);
}

// NOLINTNEXTLINE
TEST(ToolchainTest, Args) {
  worker::Toolchain toolchain;
  EXPECT_EQ(toolchain.FileName("Main"), "Main.java");
  EXPECT_EQ(toolchain.CompileArgs("Main"),
            (std::vector<std::string>{"javac", "-encoding", "UTF-8",
                                      "Main.java"}));
  EXPECT_EQ(toolchain.RunArgs("Main"),
            (std::vector<std::string>{"java", "-Dfile.encoding=UTF-8",
                                      "Main"}));
}

}  // namespace
