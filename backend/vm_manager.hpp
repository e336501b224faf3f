#ifndef BACKEND_VM_MANAGER_HPP
#define BACKEND_VM_MANAGER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "backend/host.hpp"

namespace backend {

enum class VmKind { NONE, WSL2, LIMA };
enum class VmState { ABSENT, STARTING, READY, FAILED };

const char* VmKindName(VmKind kind);
const char* VmStateName(VmState state);

struct VmOptions {
  std::string name = "codebox";
  int32_t memory_gib = 4;
  int32_t cpus = 2;
  // Bound of a single setup attempt, from creation to the first successful
  // command.
  std::chrono::milliseconds setup_timeout = std::chrono::seconds(300);
  int32_t setup_retries = 3;
  // Wait after the first failed attempt; doubled after each further failure.
  std::chrono::milliseconds setup_backoff = std::chrono::seconds(2);
  std::chrono::milliseconds poll_interval = std::chrono::seconds(1);
  std::chrono::milliseconds command_timeout = std::chrono::seconds(120);
  // Command run inside the VM to decide that it accepts commands.
  std::vector<std::string> readiness_probe = {"docker", "info"};
};

struct VmInstance {
  std::string name;
  VmKind kind = VmKind::NONE;
  VmState state = VmState::ABSENT;
};

// The commands of one VM management tool.
class VmDriver {
 public:
  enum class Status { MISSING, STOPPED, RUNNING };

  virtual VmKind Kind() const = 0;
  // The management tool, as found in PATH.
  virtual std::string Tool() const = 0;
  virtual std::vector<std::string> StatusCommand(
      const VmOptions& options) const = 0;
  virtual Status ParseStatus(const util::ProcessResult& result,
                             const VmOptions& options) const = 0;
  // Commands creating and provisioning a missing instance, run in order.
  virtual std::vector<std::vector<std::string>> CreateCommands(
      const VmOptions& options) const = 0;
  virtual std::vector<std::string> StartCommand(
      const VmOptions& options) const = 0;
  virtual std::vector<std::string> StopCommand(
      const VmOptions& options) const = 0;
  // Prepended to a command line to run it inside the instance.
  virtual std::vector<std::string> ShellPrefix(
      const VmOptions& options) const = 0;

  virtual ~VmDriver() = default;
};

// Lima, the VM layer used on macOS (and usable on Linux).
class LimaDriver : public VmDriver {
 public:
  VmKind Kind() const override { return VmKind::LIMA; }
  std::string Tool() const override { return "limactl"; }
  std::vector<std::string> StatusCommand(
      const VmOptions& options) const override;
  Status ParseStatus(const util::ProcessResult& result,
                     const VmOptions& options) const override;
  std::vector<std::vector<std::string>> CreateCommands(
      const VmOptions& options) const override;
  std::vector<std::string> StartCommand(
      const VmOptions& options) const override;
  std::vector<std::string> StopCommand(
      const VmOptions& options) const override;
  std::vector<std::string> ShellPrefix(
      const VmOptions& options) const override;
};

// WSL2, the VM layer used on Windows hosts.
class WslDriver : public VmDriver {
 public:
  VmKind Kind() const override { return VmKind::WSL2; }
  std::string Tool() const override { return "wsl"; }
  std::vector<std::string> StatusCommand(
      const VmOptions& options) const override;
  Status ParseStatus(const util::ProcessResult& result,
                     const VmOptions& options) const override;
  std::vector<std::vector<std::string>> CreateCommands(
      const VmOptions& options) const override;
  std::vector<std::string> StartCommand(
      const VmOptions& options) const override;
  std::vector<std::string> StopCommand(
      const VmOptions& options) const override;
  std::vector<std::string> ShellPrefix(
      const VmOptions& options) const override;
};

std::unique_ptr<VmDriver> MakeVmDriver(VmKind kind);

// Guarantees a reachable Linux command-execution surface inside a VM, and is
// the only way the rest of the backend reaches it. At most one instance, with
// the reserved name, is created and then shared by every session.
class VmManager : public Host {
 public:
  // Commands for the management tool itself are run on local.
  VmManager(std::unique_ptr<VmDriver> driver, Host* local, VmOptions options);

  // Reuses a running instance, or creates and starts it, and waits until it
  // accepts commands. Failed attempts are retried with exponential backoff.
  // Throws core::vm_setup_error when every attempt failed.
  VmInstance EnsureReady();

  VmInstance Instance() const;

  // Runs argv inside the VM, setting it up first if needed. Once the VM is
  // ready, calls run concurrently.
  util::ProcessResult Run(const std::vector<std::string>& argv,
                          const std::string& stdin_data,
                          std::chrono::milliseconds timeout) override;
  std::unique_ptr<util::LineChannel> Spawn(
      const std::vector<std::string>& argv) override;
  std::string Describe() const override;

  // Stops the instance. It is set up again on the next use.
  void Teardown();

 private:
  // One setup attempt. Throws core::vm_setup_error.
  void SetUp();
  // Runs an administrative command with the tool, throwing
  // core::vm_setup_error on failure.
  util::ProcessResult RunAdmin(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout);
  std::vector<std::string> InVm(const std::vector<std::string>& argv) const;
  void SetState(VmState state);

  std::unique_ptr<VmDriver> driver_;
  Host* local_;
  VmOptions options_;
  // Serializes administrative commands: creation, start and stop.
  std::mutex setup_mutex_;
  mutable std::mutex state_mutex_;
  VmInstance instance_;
};

}  // namespace backend

#endif
