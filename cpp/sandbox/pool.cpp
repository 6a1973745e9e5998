#include "sandbox/pool.hpp"

#include <kj/debug.h>

#include "util/misc.hpp"

namespace sandbox {

Pool::Pool(Runner* runner, ContainerCommands commands, PoolOptions options)
    : runner_(runner),
      commands_(std::move(commands)),
      options_(options),
      slots_(options.num_slots) {
  KJ_REQUIRE(options_.num_slots > 0, "A pool needs at least one slot");
  KJ_REQUIRE(options_.max_usage > 0, "max_usage must be positive");
  for (size_t i = 0; i < slots_.size(); i++) {
    slots_[i].index = i;
    slots_[i].name = commands_.Name(i);
  }
}

std::string Pool::CreateContainer(const std::string& name) {
  ExecutionResult result =
      runner_->Run(commands_.Create(name), options_.create_timeout_millis);
  if (result.success) return "";
  return util::trim(result.output);
}

void Pool::RemoveContainer(const std::string& name) {
  ExecutionResult result =
      runner_->Run(commands_.Remove(name), options_.remove_timeout_millis);
  if (!result.success) {
    // Removing a container that does not exist fails too.
    KJ_LOG(INFO, "Could not remove container", name, result.output);
  }
}

void Pool::Initialize() {
  ExecutionResult list =
      runner_->Run(commands_.List(), options_.remove_timeout_millis);
  if (list.success) {
    for (const std::string& name : commands_.ParseList(list.output)) {
      KJ_LOG(INFO, "Removing leftover container", name);
      RemoveContainer(name);
    }
  } else {
    KJ_LOG(WARNING, "Could not list containers", list.output);
  }
  for (Slot& slot : slots_) {
    // Stale containers that the listing missed would make the creation fail.
    RemoveContainer(slot.name);
    std::string error = CreateContainer(slot.name);
    if (!error.empty()) {
      KJ_FAIL_REQUIRE("Could not create container", slot.name, error);
    }
    KJ_LOG(INFO, "Container ready", slot.name);
  }
}

void Pool::Reset(size_t index) {
  KJ_REQUIRE(index < slots_.size(), "Invalid slot", index);
  const std::string& name = slots_[index].name;
  KJ_LOG(INFO, "Resetting container", name, Usage(index));
  RemoveContainer(name);
  std::string error = CreateContainer(name);
  if (!error.empty()) {
    KJ_FAIL_REQUIRE("Could not recreate container", name, error);
  }
  std::lock_guard<std::mutex> lck(mutex_);
  slots_[index].usage = 0;
  slots_[index].unsafe = false;
  slots_[index].epoch++;
}

void Pool::Teardown() {
  for (const Slot& slot : slots_) {
    ExecutionResult result = runner_->Run(commands_.Remove(slot.name),
                                          options_.remove_timeout_millis);
    if (!result.success) {
      KJ_LOG(WARNING, "Could not remove container", slot.name, result.output);
    }
  }
}

Slot Pool::Get(size_t index) const {
  KJ_REQUIRE(index < slots_.size(), "Invalid slot", index);
  std::lock_guard<std::mutex> lck(mutex_);
  return slots_[index];
}

uint32_t Pool::Usage(size_t index) const { return Get(index).usage; }

uint64_t Pool::Epoch(size_t index) const { return Get(index).epoch; }

const std::string& Pool::ContainerName(size_t index) const {
  KJ_REQUIRE(index < slots_.size(), "Invalid slot", index);
  return slots_[index].name;
}

void Pool::RecordUsage(size_t index) {
  KJ_REQUIRE(index < slots_.size(), "Invalid slot", index);
  std::lock_guard<std::mutex> lck(mutex_);
  slots_[index].usage++;
}

void Pool::MarkUnsafe(size_t index) {
  KJ_REQUIRE(index < slots_.size(), "Invalid slot", index);
  std::lock_guard<std::mutex> lck(mutex_);
  slots_[index].unsafe = true;
}

bool Pool::NeedsReset(size_t index) const {
  Slot slot = Get(index);
  return slot.unsafe || slot.usage >= options_.max_usage;
}

}  // namespace sandbox
