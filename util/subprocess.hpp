#ifndef UTIL_SUBPROCESS_HPP
#define UTIL_SUBPROCESS_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <kj/io.h>

#include "util/line_channel.hpp"

namespace util {

// Outcome of a process run to completion.
struct ProcessResult {
  int32_t exit_code = 0;
  int32_t signal = 0;
  bool timed_out = false;
  std::string stdout_data;
  std::string stderr_data;

  bool Success() const { return !timed_out && signal == 0 && exit_code == 0; }
};

// Runs argv (argv[0] is looked up in PATH), writes stdin_data to its standard
// input and collects its output. If the process is still running when timeout
// expires, its whole process group is killed and timed_out is set. Throws
// std::system_error if the process cannot be started.
ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const std::string& stdin_data,
                         std::chrono::milliseconds timeout);

// A child process whose standard streams are connected to pipes. The child is
// killed and reaped on destruction.
class ChildProcess : public LineChannel {
 public:
  // Starts argv in a new process group. Throws std::system_error on failure.
  static std::unique_ptr<ChildProcess> Spawn(
      const std::vector<std::string>& argv);

  void WriteLine(const std::string& line) override;
  ReadStatus ReadLine(std::string* line,
                      std::chrono::milliseconds timeout) override;
  std::string ErrorOutput() override;
  void Close() override;

  int Pid() const { return pid_; }

  ~ChildProcess() override;

 private:
  ChildProcess() = default;

  // Reads whatever is available on the output pipes, waiting at most timeout.
  // Returns false if stdout is closed.
  bool Pump(std::chrono::milliseconds timeout);

  int pid_ = -1;
  bool reaped_ = false;
  kj::AutoCloseFd stdin_;
  kj::AutoCloseFd stdout_;
  kj::AutoCloseFd stderr_;
  std::string stdout_buffer_;
  std::string stderr_buffer_;
};

}  // namespace util

#endif
