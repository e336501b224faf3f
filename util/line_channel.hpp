#ifndef UTIL_LINE_CHANNEL_HPP
#define UTIL_LINE_CHANNEL_HPP

#include <chrono>
#include <string>

namespace util {

// A bidirectional, newline-delimited text stream to a long-lived peer, usually
// the standard streams of a child process.
class LineChannel {
 public:
  enum class ReadStatus { LINE, TIMEOUT, CLOSED };

  // Sends a line; the newline is appended. Throws std::system_error if the
  // peer is gone.
  virtual void WriteLine(const std::string& line) = 0;

  // Waits at most timeout for a complete line and stores it, without the
  // newline, in line.
  virtual ReadStatus ReadLine(std::string* line,
                              std::chrono::milliseconds timeout) = 0;

  // Diagnostic output the peer produced so far (stderr of a process).
  virtual std::string ErrorOutput() = 0;

  // Terminates the peer. Calling Close more than once is harmless.
  virtual void Close() = 0;

  LineChannel() = default;
  virtual ~LineChannel() = default;
  LineChannel(const LineChannel&) = delete;
  LineChannel& operator=(const LineChannel&) = delete;
  LineChannel(LineChannel&&) = delete;
  LineChannel& operator=(LineChannel&&) = delete;
};

}  // namespace util

#endif
