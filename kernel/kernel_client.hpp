#ifndef KERNEL_KERNEL_CLIENT_HPP
#define KERNEL_KERNEL_CLIENT_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "kernel/message.hpp"
#include "util/line_channel.hpp"

namespace kernel {

// A rich display payload, by mime type.
struct DisplayData {
  std::map<std::string, std::string> data;
};

// Everything one execution produced.
struct ExecutionOutput {
  std::string stdout_text;
  std::string stderr_text;
  // text/plain representation of the value of the last expression.
  bool has_display_value = false;
  std::string display_value;
  std::vector<DisplayData> displays;
  // Set when the code raised an exception.
  bool failed = false;
  std::string error_name;
  std::string error_value;
  std::vector<std::string> traceback;
  int64_t execution_count = 0;
};

// Talks to a long-lived interpreter over its control channel. Interpreter
// state persists across Execute calls.
class KernelClient {
 public:
  KernelClient(std::unique_ptr<util::LineChannel> channel, std::string key)
      : channel_(std::move(channel)), key_(std::move(key)) {}
  ~KernelClient();

  // Waits for the kernel to answer a kernel_info_request. Throws
  // core::container_start_failure.
  void Handshake(std::chrono::milliseconds timeout);

  // Runs code and collects its output until the kernel is idle again. Throws
  // core::execution_timeout if that does not happen within timeout, and
  // core::container_start_failure if the interpreter exits.
  ExecutionOutput Execute(const std::string& code,
                          std::chrono::milliseconds timeout);

  // Heartbeat. A kernel that is executing code counts as alive.
  bool Ping(std::chrono::milliseconds timeout);

  // Terminates the interpreter.
  void Close();

  KernelClient(const KernelClient&) = delete;
  KernelClient& operator=(const KernelClient&) = delete;

 private:
  void Send(const Message& msg);
  // Waits for the next message of this connection. Returns false at the
  // deadline.
  bool Receive(Message* msg, std::chrono::steady_clock::time_point deadline);

  std::unique_ptr<util::LineChannel> channel_;
  std::string key_;
  // One request at a time on the channel.
  std::mutex mutex_;
};

}  // namespace kernel

#endif
