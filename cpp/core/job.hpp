#ifndef CORE_JOB_HPP
#define CORE_JOB_HPP

#include <chrono>
#include <string>

namespace core {

enum class JobStatus { PENDING, RUNNING, COMPLETED, FAILED };

const char* StatusName(JobStatus status);

struct Job {
  std::string id;
  std::string source;
  JobStatus status = JobStatus::PENDING;
  bool success = false;
  std::string output;
  std::chrono::system_clock::time_point created;

  bool Finished() const {
    return status == JobStatus::COMPLETED || status == JobStatus::FAILED;
  }
};

// Final outcome of a job, as delivered to the notifier.
struct JobResult {
  std::string job_id;
  bool success = false;
  std::string output;
};

// Persistent record of the jobs. Implementations must be thread safe.
class JobStore {
 public:
  virtual void MarkRunning(const std::string& id) = 0;
  // The pipeline produced a final outcome.
  virtual void Complete(const std::string& id, bool success,
                        const std::string& output) = 0;
  // The job could not be handed to the pipeline at all.
  virtual void Fail(const std::string& id, const std::string& reason) = 0;
  // Returns false if no job with the given id is known.
  virtual bool Get(const std::string& id, Job* job) const = 0;

  virtual ~JobStore() = default;
};

// Receives each finalized job exactly once.
class ResultNotifier {
 public:
  virtual void Notify(const JobResult& result) = 0;
  virtual ~ResultNotifier() = default;
};

}  // namespace core

#endif
