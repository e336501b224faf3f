#ifndef FAKE_FAKE_HOST_HPP
#define FAKE_FAKE_HOST_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "backend/host.hpp"
#include "kernel/message.hpp"

namespace fake {

// Plays the kernel agent for a tiny statement language, one statement per
// line:
//   x = <expr>            integer assignment (+ - * // % and parentheses)
//   print(<expr>)         print('text') prints a literal
//   <expr>                the last one becomes the display value
//   sleep(<seconds>)      delays the rest of the output in real time
//   show_png()            emits an image/png display
//   save('name', <expr>)  writes outputs/name in the workspace
//   crash()               the interpreter exits
//   spoof_reply()         writes replies with mistyped fields to the channel
// Unknown names raise NameError, division by zero ZeroDivisionError.
class FakeKernel : public util::LineChannel {
 public:
  // The connection key is read from the workspace. A dead container closes
  // the channel.
  FakeKernel(std::string workspace, std::shared_ptr<std::atomic<bool>> alive);

  void WriteLine(const std::string& line) override;
  ReadStatus ReadLine(std::string* line,
                      std::chrono::milliseconds timeout) override;
  std::string ErrorOutput() override { return error_output_; }
  void Close() override;

 private:
  struct Pending {
    std::string line;
    std::chrono::steady_clock::time_point ready_at;
  };

  void Emit(const std::string& channel, const std::string& msg_type,
            nlohmann::json content, const std::string& parent,
            std::chrono::steady_clock::time_point ready_at);
  void Execute(const kernel::Message& request);

  std::string workspace_;
  std::shared_ptr<std::atomic<bool>> alive_;
  std::string key_;
  std::string error_output_;
  std::mutex mutex_;
  std::deque<Pending> pending_;
  bool closed_ = false;
  bool crashed_ = false;
  std::map<std::string, int64_t> vars_;
  int64_t execution_count_ = 0;
};

// A Host that emulates docker and limactl, recording every command line.
// The engine reached through a limactl shell is always installed and
// responsive.
// Other commands run for real on this machine; commands executed in an
// emulated container run here too, with /workspace mapped to its workspace
// directory.
class FakeHost : public backend::Host {
 public:
  util::ProcessResult Run(const std::vector<std::string>& argv,
                          const std::string& stdin_data,
                          std::chrono::milliseconds timeout) override;
  std::unique_ptr<util::LineChannel> Spawn(
      const std::vector<std::string>& argv) override;
  std::string Describe() const override { return "fake"; }

  // Tools that are "installed". Running any other emulated tool fails as if
  // it was not in PATH.
  void SetInstalled(const std::set<std::string>& tools);
  void SetEngineResponsive(bool responsive);
  void SetFailPull(bool fail);
  void SetFailRun(bool fail);
  // pip install of these packages fails.
  void SetFailingPackages(const std::set<std::string>& packages);
  // pip install takes this long.
  void SetInstallDelay(std::chrono::milliseconds delay);
  // State reported by limactl list: "", "Stopped" or "Running".
  void SetVmStatus(const std::string& status);
  // The next n limactl start commands fail.
  void SetVmStartFailures(int32_t n);
  // A container left behind by a previous run.
  void AddOrphan(const std::string& name);

  std::vector<std::vector<std::string>> Commands();
  // Number of recorded command lines "tool subcommand ...".
  size_t Count(const std::string& tool, const std::string& subcommand);
  std::set<std::string> Containers();
  std::string WorkspaceOf(const std::string& container);
  std::string VmStatus();

 private:
  struct Container {
    std::string workspace;
    std::shared_ptr<std::atomic<bool>> alive;
  };

  // Commands run through the VM see an engine that is always there.
  util::ProcessResult Dispatch(const std::vector<std::string>& argv,
                               const std::string& stdin_data,
                               std::chrono::milliseconds timeout, bool in_vm);
  util::ProcessResult Docker(const std::vector<std::string>& args,
                             const std::string& stdin_data,
                             std::chrono::milliseconds timeout, bool in_vm);
  util::ProcessResult Lima(const std::vector<std::string>& args,
                           const std::string& stdin_data,
                           std::chrono::milliseconds timeout);
  void Record(const std::vector<std::string>& argv);

  std::mutex mutex_;
  std::vector<std::vector<std::string>> commands_;
  std::set<std::string> installed_ = {"docker"};
  bool engine_responsive_ = true;
  bool fail_pull_ = false;
  bool fail_run_ = false;
  std::set<std::string> failing_packages_;
  std::chrono::milliseconds install_delay_{0};
  std::string vm_status_;
  int32_t vm_start_failures_ = 0;
  std::set<std::string> images_;
  std::map<std::string, Container> containers_;
  backend::NativeHost real_;
};

}  // namespace fake

#endif
