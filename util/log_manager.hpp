#ifndef UTIL_LOG_MANAGER_HPP
#define UTIL_LOG_MANAGER_HPP
#include <kj/exception.h>
#include <kj/main.h>
#include <ostream>
#include "backward.hpp"

namespace util {

// Formats kj log records and exceptions for the codebox subcommands. While an
// instance is alive it is the active kj::ExceptionCallback of its thread.
class LogManager : public kj::ExceptionCallback {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit LogManager(kj::ProcessContext& context);
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;
  void onRecoverableException(kj::Exception&& exception) override;
  void onFatalException(kj::Exception&& exception) override;
  StackTraceMode stackTraceMode() override { return StackTraceMode::NONE; }

 private:
  void PrintStackTrace();

  std::ostream& out;
  backward::SignalHandling sh;  // Override kj's signal handling.
};

// kj exception callbacks are per thread. Threads started by a subcommand
// create one of these so that their records reach the log of the LogManager.
class ThreadLogger : public kj::ExceptionCallback {
 public:
  ThreadLogger();
  void logMessage(kj::LogSeverity severity, const char* file, int line,
                  int contextDepth, kj::String&& text) override;

 private:
  std::ostream& out;
};
}  // namespace util

#endif
