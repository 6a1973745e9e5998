#ifndef CORE_NOTIFIER_HPP
#define CORE_NOTIFIER_HPP

#include "core/job.hpp"

namespace core {

// Notifier that writes one log line per finalized job.
class LogNotifier : public ResultNotifier {
 public:
  void Notify(const JobResult& result) override;
};

}  // namespace core

#endif
