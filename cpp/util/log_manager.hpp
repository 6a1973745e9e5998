#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>
#include "backward.hpp"

namespace util {

// Routes kj log records and exceptions of the current thread to the log
// stream chosen by Flags::log_file. kj exception callbacks are per-thread, so
// every thread that logs needs its own instance.
class LogManager : public kj::ExceptionCallback {
 public:
  // Exits through context if the log file cannot be opened.
  explicit LogManager(kj::ProcessContext* context);
  LogManager();
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
};

// Installs backward's signal handlers, printing a stack trace on crashes. Must
// be called once, from the main thread.
void InstallCrashHandler();
}  // namespace util

#endif
