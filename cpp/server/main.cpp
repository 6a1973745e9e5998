#include "server/main.hpp"

#include <signal.h>
#include <cstring>

#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>

#include "core/job_store.hpp"
#include "core/notifier.hpp"
#include "sandbox/pool.hpp"
#include "sandbox/unix.hpp"
#include "server/dispatcher.hpp"
#include "server/server.hpp"
#include "util/daemon.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"
#include "worker/executor.hpp"
#include "worker/main.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  if (Flags::num_slots <= 0) return "The number of slots must be positive";
  if (Flags::daemon) {
    util::daemonize("server", Flags::pidfile);
  }
  util::LogManager log_manager(&context);

  // Must happen before any thread is started, so that every thread blocks
  // them.
  kj::UnixEventPort::captureSignal(SIGINT);
  kj::UnixEventPort::captureSignal(SIGTERM);

  sandbox::UnixRunner runner(sandbox::Shell::Detect(Flags::shell));
  util::File::MakeDirs(Flags::workspace_root);
  sandbox::ContainerCommands commands(worker::ContainerConfigFromFlags());
  sandbox::Pool pool(&runner, commands, worker::PoolOptionsFromFlags());
  KJ_DEFER(pool.Teardown());
  try {
    pool.Initialize();
  } catch (const std::exception& e) {
    return kj::str("Could not start the containers: ", e.what());
  }

  core::MemoryJobStore store(Flags::max_finished_jobs);
  core::LogNotifier notifier;
  worker::Executor executor(&pool, &runner, &store, &notifier,
                            worker::ExecutorOptionsFromFlags());
  Dispatcher dispatcher(&executor, &store, pool.Size());
  dispatcher.Start();
  KJ_DEFER(dispatcher.Stop());

  auto io = kj::setupAsyncIo();
  capnp::TwoPartyServer server(kj::heap<Server>(&store, &dispatcher));
  auto address = io.provider->getNetwork()
                     .parseAddress(Flags::listen_address.c_str(), Flags::port)
                     .wait(io.waitScope);
  auto listener = address->listen();
  KJ_LOG(INFO, "Listening", Flags::listen_address, listener->getPort());

  auto on_signal = [](siginfo_t info) {
    KJ_LOG(INFO, "Shutting down", strsignal(info.si_signo));
  };
  server.listen(*listener)
      .exclusiveJoin(io.unixEventPort.onSignal(SIGINT).then(on_signal))
      .exclusiveJoin(io.unixEventPort.onSignal(SIGTERM).then(on_signal))
      .wait(io.waitScope);
  return true;
}

kj::MainFunc Main::getMain() {
  title_ = "CodeBox Server (" + util::version + ")";
  kj::MainBuilder builder(context, title_,
                          "Compiles and runs submitted sources in a pool of "
                          "persistent containers");
  return worker::AddSandboxOptions(builder)
      .addOption({'d', "daemon"}, util::setBool(&Flags::daemon),
                 "Become a daemon")
      .addOptionWithArg({'P', "pidfile"}, util::setString(&Flags::pidfile),
                        "<PIDFILE>", "Path where the pidfile should be stored")
      .addOptionWithArg({'l', "address"},
                        util::setString(&Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({'n', "slots"}, util::setInt(&Flags::num_slots), "<N>",
                        "Number of containers, and of concurrent jobs")
      .addOptionWithArg({"max-finished"},
                        util::setUint(&Flags::max_finished_jobs), "<N>",
                        "Number of finished jobs whose result is kept")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
