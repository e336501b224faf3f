#ifndef BACKEND_HOST_HPP
#define BACKEND_HOST_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "util/line_channel.hpp"
#include "util/subprocess.hpp"

namespace backend {

// The command-execution surface of an isolation substrate: the local machine,
// or a VM reached through its management tool. Everything the backend does to
// containers and workspaces goes through a Host.
class Host {
 public:
  // Runs argv to completion, feeding it stdin_data. Processes still running
  // at the deadline are killed and reported with timed_out set. Throws
  // std::system_error if argv[0] cannot be started.
  virtual util::ProcessResult Run(const std::vector<std::string>& argv,
                                  const std::string& stdin_data,
                                  std::chrono::milliseconds timeout) = 0;

  // Starts a long-lived process and returns a line channel to its standard
  // streams.
  virtual std::unique_ptr<util::LineChannel> Spawn(
      const std::vector<std::string>& argv) = 0;

  // Human readable name, used in logs and capability reports.
  virtual std::string Describe() const = 0;

  Host() = default;
  virtual ~Host() = default;
  Host(const Host&) = delete;
  Host& operator=(const Host&) = delete;
};

// Runs commands directly on this machine.
class NativeHost : public Host {
 public:
  util::ProcessResult Run(const std::vector<std::string>& argv,
                          const std::string& stdin_data,
                          std::chrono::milliseconds timeout) override;
  std::unique_ptr<util::LineChannel> Spawn(
      const std::vector<std::string>& argv) override;
  std::string Describe() const override { return "native"; }
};

// Formats a command line for logging.
std::string FormatCommand(const std::vector<std::string>& argv);

}  // namespace backend

#endif
