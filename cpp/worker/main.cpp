#include "worker/main.hpp"

#include <iostream>

#include "core/job_store.hpp"
#include "core/notifier.hpp"
#include "sandbox/unix.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace worker {

sandbox::ContainerConfig ContainerConfigFromFlags() {
  sandbox::ContainerConfig config;
  config.runtime = Flags::runtime;
  config.image = Flags::image;
  config.name_prefix = Flags::container_prefix;
  config.host_root = Flags::workspace_root;
  config.mount_point = Flags::mount_point;
  config.pids_limit = Flags::pids_limit;
  config.memory = Flags::memory_limit;
  config.cpus = Flags::cpu_limit;
  return config;
}

sandbox::PoolOptions PoolOptionsFromFlags() {
  sandbox::PoolOptions options;
  options.num_slots = Flags::num_slots;
  options.max_usage = Flags::max_usage;
  return options;
}

ExecutorOptions ExecutorOptionsFromFlags() {
  ExecutorOptions options;
  options.workspace_root = Flags::workspace_root;
  options.compile_timeout_millis = Flags::compile_timeout_millis;
  options.run_timeout_millis = Flags::run_timeout_millis;
  return options;
}

kj::MainBuilder& AddSandboxOptions(kj::MainBuilder& builder) {  // NOLINT
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOptionWithArg({"shell"}, util::setString(&Flags::shell), "<SHELL>",
                        "Shell used to run commands")
      .addOptionWithArg({"max-usage"}, util::setUint(&Flags::max_usage), "<N>",
                        "Number of jobs after which a container is recreated")
      .addOptionWithArg({"runtime"}, util::setString(&Flags::runtime),
                        "<PROGRAM>", "Container runtime")
      .addOptionWithArg({"image"}, util::setString(&Flags::image), "<IMAGE>",
                        "Container image with the compiler and the runtime")
      .addOptionWithArg({"prefix"}, util::setString(&Flags::container_prefix),
                        "<PREFIX>", "Prefix of the container names")
      .addOptionWithArg({'w', "workspace"},
                        util::setString(&Flags::workspace_root), "<DIR>",
                        "Host directory where the jobs are prepared")
      .addOptionWithArg({"mount"}, util::setString(&Flags::mount_point),
                        "<DIR>", "Where the workspace is mounted in containers")
      .addOptionWithArg({"memory"}, util::setString(&Flags::memory_limit),
                        "<SIZE>", "Memory limit of each container")
      .addOptionWithArg({"cpus"}, util::setString(&Flags::cpu_limit), "<N>",
                        "CPU limit of each container")
      .addOptionWithArg({"pids-limit"}, util::setInt(&Flags::pids_limit),
                        "<N>", "Maximum number of processes per container")
      .addOptionWithArg({"compile-timeout"},
                        util::setInt(&Flags::compile_timeout_millis), "<MS>",
                        "Time limit of the compilation, in milliseconds")
      .addOptionWithArg({"run-timeout"},
                        util::setInt(&Flags::run_timeout_millis), "<MS>",
                        "Time limit of the execution, in milliseconds");
}

kj::MainBuilder::Validity Main::SetFile(kj::StringPtr file) {
  if (!util::File::IsRegular(file.cStr())) return "No such file";
  file_ = file.cStr();
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(&context);
  std::string source = util::File::ReadString(file_);

  sandbox::UnixRunner runner(sandbox::Shell::Detect(Flags::shell));
  sandbox::PoolOptions pool_options = PoolOptionsFromFlags();
  pool_options.num_slots = 1;
  util::File::MakeDirs(Flags::workspace_root);
  sandbox::Pool pool(&runner,
                     sandbox::ContainerCommands(ContainerConfigFromFlags()),
                     pool_options);
  KJ_DEFER(pool.Teardown());
  try {
    pool.Initialize();
  } catch (const std::exception& e) {
    return kj::str("Could not start the container: ", e.what());
  }

  core::MemoryJobStore store;
  core::LogNotifier notifier;
  Executor executor(&pool, &runner, &store, &notifier,
                    ExecutorOptionsFromFlags());
  core::JobResult result = executor.Execute(store.Create(source), source, 0);
  std::cout << result.output << std::flush;
  if (!result.success) return "Execution failed";
  return true;
}

kj::MainFunc Main::getMain() {
  title_ = "CodeBox Runner (" + util::version + ")";
  kj::MainBuilder builder(context, title_,
                          "Compiles and runs a single source file");
  return AddSandboxOptions(builder)
      .expectArg("<FILE>", KJ_BIND_METHOD(*this, SetFile))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace worker
