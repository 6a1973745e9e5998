#ifndef SANDBOX_POOL_HPP
#define SANDBOX_POOL_HPP

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <kj/common.h>

#include "sandbox/container.hpp"
#include "sandbox/runner.hpp"

namespace sandbox {

struct PoolOptions {
  size_t num_slots = 2;
  // Number of jobs a container runs before it is recreated.
  uint32_t max_usage = 100;
  int64_t create_timeout_millis = 10000;
  int64_t remove_timeout_millis = 5000;
};

// A persistent container, reused by many jobs.
struct Slot {
  size_t index = 0;
  std::string name;
  uint32_t usage = 0;
  // Number of completed resets.
  uint64_t epoch = 0;
  // The container may still host a runaway process.
  bool unsafe = false;
};

// Fixed-size pool of containers, addressed by index. The pool does not
// schedule jobs: callers must make sure that a slot is used by at most one
// job at a time. Bookkeeping is thread safe.
class Pool {
 public:
  Pool(Runner* runner, ContainerCommands commands, PoolOptions options);
  KJ_DISALLOW_COPY(Pool);

  // Removes every leftover container carrying our prefix, then creates one
  // container per slot. Throws if some container cannot be created.
  void Initialize();

  // Replaces the container of the slot with a fresh one. Clears usage and the
  // unsafe mark and bumps the epoch. Throws if the new container cannot be
  // created.
  void Reset(size_t index);

  // Removes all the containers. Never throws.
  void Teardown();

  size_t Size() const { return slots_.size(); }
  uint32_t MaxUsage() const { return options_.max_usage; }

  Slot Get(size_t index) const;
  uint32_t Usage(size_t index) const;
  uint64_t Epoch(size_t index) const;
  const std::string& ContainerName(size_t index) const;

  void RecordUsage(size_t index);
  void MarkUnsafe(size_t index);
  bool NeedsReset(size_t index) const;

  const ContainerCommands& Commands() const { return commands_; }

 private:
  // Returns an error message, or an empty string on success.
  std::string CreateContainer(const std::string& name);
  void RemoveContainer(const std::string& name);

  Runner* runner_;
  ContainerCommands commands_;
  PoolOptions options_;
  std::vector<Slot> slots_;
  mutable std::mutex mutex_;
};

}  // namespace sandbox

#endif
