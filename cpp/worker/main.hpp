#ifndef WORKER_MAIN_HPP
#define WORKER_MAIN_HPP
#include <kj/main.h>

#include "sandbox/container.hpp"
#include "sandbox/pool.hpp"
#include "worker/executor.hpp"

namespace worker {

// Option structs filled in from the command line flags.
sandbox::ContainerConfig ContainerConfigFromFlags();
sandbox::PoolOptions PoolOptionsFromFlags();
ExecutorOptions ExecutorOptionsFromFlags();

// Adds the options that configure the containers and the executor.
kj::MainBuilder& AddSandboxOptions(kj::MainBuilder& builder);  // NOLINT

// Runs a single source file on a one-slot pool.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity SetFile(kj::StringPtr file);
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  std::string title_;
  std::string file_;
};
}  // namespace worker
#endif
