#ifndef CORE_JOB_STORE_HPP
#define CORE_JOB_STORE_HPP

#include <deque>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

#include <kj/common.h>

#include "core/job.hpp"

namespace core {

// In-memory job store. Finished jobs are kept up to max_finished, oldest
// evicted first; pending and running jobs are never evicted.
class MemoryJobStore : public JobStore {
 public:
  static const constexpr size_t kMaxIdLength = 64;

  explicit MemoryJobStore(size_t max_finished = 1000)
      : max_finished_(max_finished), gen_(std::random_device()()) {}
  KJ_DISALLOW_COPY(MemoryJobStore);

  // Registers a new pending job and returns its id. If requested_id is empty
  // a random one is generated, otherwise it must be a valid and unused id.
  std::string Create(const std::string& source,
                     const std::string& requested_id = "");

  void MarkRunning(const std::string& id) override;
  void Complete(const std::string& id, bool success,
                const std::string& output) override;
  void Fail(const std::string& id, const std::string& reason) override;
  bool Get(const std::string& id, Job* job) const override;

  size_t Size() const;

  // Ids are used as directory names: 1-64 characters among [A-Za-z0-9_-].
  static bool ValidId(const std::string& id);

 private:
  std::string RandomId();
  Job& Find(const std::string& id);
  void Finish(Job* job);

  size_t max_finished_;
  std::mt19937_64 gen_;
  std::unordered_map<std::string, Job> jobs_;
  // Finished jobs, in order of completion.
  std::deque<std::string> finished_;
  mutable std::mutex mutex_;
};

}  // namespace core

#endif
