#include "server/dispatcher.hpp"

#include <kj/debug.h>

#include "util/log_manager.hpp"

namespace server {

void Dispatcher::Start() {
  std::lock_guard<std::mutex> lck(mutex_);
  KJ_REQUIRE(threads_.empty() && !stopping_, "Dispatcher already started");
  for (size_t slot = 0; slot < num_slots_; slot++) {
    threads_.emplace_back(&Dispatcher::Work, this, slot);
  }
}

void Dispatcher::Enqueue(const std::string& job_id) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    KJ_REQUIRE(!stopping_, "Server shutting down");
    queue_.push_back(job_id);
  }
  cv_.notify_one();
}

size_t Dispatcher::QueueSize() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return queue_.size();
}

void Dispatcher::Work(size_t slot) {
  util::LogManager log_manager;
  while (true) {
    std::string job_id;
    {
      std::unique_lock<std::mutex> lck(mutex_);
      cv_.wait(lck, [this] { return stopping_ || !queue_.empty(); });
      if (stopping_) return;
      job_id = std::move(queue_.front());
      queue_.pop_front();
    }
    core::Job job;
    if (!store_->Get(job_id, &job)) {
      KJ_LOG(WARNING, "Dropping unknown job", job_id);
      continue;
    }
    executor_->Execute(job_id, job.source, slot);
  }
}

void Dispatcher::Stop() {
  std::deque<std::string> pending;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (stopping_) return;
    stopping_ = true;
    pending.swap(queue_);
  }
  cv_.notify_all();
  for (std::thread& t : threads_) t.join();
  threads_.clear();
  for (const std::string& job_id : pending) {
    try {
      store_->Fail(job_id, "server shutting down");
    } catch (const std::exception& e) {
      KJ_LOG(WARNING, "Could not fail job", job_id, e.what());
    }
  }
  if (!pending.empty()) {
    KJ_LOG(INFO, "Dropped queued jobs", pending.size());
  }
}

}  // namespace server
