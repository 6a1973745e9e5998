#include "core/notifier.hpp"

#include <kj/debug.h>

namespace core {

void LogNotifier::Notify(const JobResult& result) {
  KJ_LOG(INFO, "Job finished", result.job_id, result.success,
         result.output.size());
}

}  // namespace core
