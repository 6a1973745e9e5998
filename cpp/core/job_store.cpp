#include "core/job_store.hpp"

#include <cstdio>
#include <random>

#include <kj/debug.h>

namespace core {

bool MemoryJobStore::ValidId(const std::string& id) {
  if (id.empty() || id.size() > kMaxIdLength) return false;
  for (char c : id) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '_' || c == '-';
    if (!ok) return false;
  }
  return true;
}

std::string MemoryJobStore::RandomId() {
  char buf[33];
  snprintf(buf, sizeof(buf), "%016llx%016llx",
           static_cast<unsigned long long>(gen_()),  // NOLINT
           static_cast<unsigned long long>(gen_()));  // NOLINT
  return buf;
}

std::string MemoryJobStore::Create(const std::string& source,
                                   const std::string& requested_id) {
  std::lock_guard<std::mutex> lck(mutex_);
  std::string id = requested_id;
  if (id.empty()) {
    do {
      id = RandomId();
    } while (jobs_.count(id));
  } else {
    KJ_REQUIRE(ValidId(id), "Invalid job id", id);
    KJ_REQUIRE(!jobs_.count(id), "Job id already in use", id);
  }
  Job& job = jobs_[id];
  job.id = id;
  job.source = source;
  job.created = std::chrono::system_clock::now();
  return id;
}

Job& MemoryJobStore::Find(const std::string& id) {
  auto it = jobs_.find(id);
  KJ_REQUIRE(it != jobs_.end(), "Unknown job", id);
  return it->second;
}

void MemoryJobStore::Finish(Job* job) {
  // The source is not needed anymore.
  job->source.clear();
  finished_.push_back(job->id);
  while (finished_.size() > max_finished_) {
    jobs_.erase(finished_.front());
    finished_.pop_front();
  }
}

void MemoryJobStore::MarkRunning(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  Job& job = Find(id);
  KJ_REQUIRE(job.status == JobStatus::PENDING, "Job is not pending", id);
  job.status = JobStatus::RUNNING;
}

void MemoryJobStore::Complete(const std::string& id, bool success,
                              const std::string& output) {
  std::lock_guard<std::mutex> lck(mutex_);
  Job& job = Find(id);
  KJ_REQUIRE(!job.Finished(), "Job already finished", id);
  job.status = JobStatus::COMPLETED;
  job.success = success;
  job.output = output;
  Finish(&job);
}

void MemoryJobStore::Fail(const std::string& id, const std::string& reason) {
  std::lock_guard<std::mutex> lck(mutex_);
  Job& job = Find(id);
  KJ_REQUIRE(!job.Finished(), "Job already finished", id);
  job.status = JobStatus::FAILED;
  job.success = false;
  job.output = reason;
  Finish(&job);
}

bool MemoryJobStore::Get(const std::string& id, Job* job) const {
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return false;
  *job = it->second;
  return true;
}

size_t MemoryJobStore::Size() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return jobs_.size();
}

}  // namespace core
