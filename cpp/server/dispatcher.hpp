#ifndef SERVER_DISPATCHER_HPP
#define SERVER_DISPATCHER_HPP

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <kj/common.h>

#include "core/job_store.hpp"
#include "worker/executor.hpp"

namespace server {

// Binds queued jobs to pool slots. There is one thread per slot, and a thread
// takes the next job only after the previous one is finalized, so no slot ever
// runs two jobs at once. Jobs are started in submission order.
class Dispatcher {
 public:
  Dispatcher(worker::Executor* executor, core::MemoryJobStore* store,
             size_t num_slots)
      : executor_(executor), store_(store), num_slots_(num_slots) {}
  ~Dispatcher() { Stop(); }
  KJ_DISALLOW_COPY(Dispatcher);

  void Start();

  // Queues a job that is already in the store.
  void Enqueue(const std::string& job_id);

  // Waits for the running jobs to finish and fails the queued ones.
  void Stop();

  size_t QueueSize() const;

 private:
  void Work(size_t slot);

  worker::Executor* executor_;
  core::MemoryJobStore* store_;
  size_t num_slots_;

  std::vector<std::thread> threads_;
  std::deque<std::string> queue_;
  bool stopping_ = false;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace server

#endif
