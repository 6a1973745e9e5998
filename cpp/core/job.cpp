#include "core/job.hpp"

namespace core {

const char* StatusName(JobStatus status) {
  switch (status) {
    case JobStatus::PENDING:
      return "pending";
    case JobStatus::RUNNING:
      return "running";
    case JobStatus::COMPLETED:
      return "completed";
    case JobStatus::FAILED:
      return "failed";
  }
  return "unknown";
}

}  // namespace core
