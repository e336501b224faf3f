#include "backend/vm_manager.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/misc.hpp"

namespace backend {

namespace {

using std::chrono::steady_clock;

std::string Seconds(std::chrono::milliseconds d) {
  return std::to_string(
      std::chrono::duration_cast<std::chrono::seconds>(d).count());
}

}  // namespace

const char* VmKindName(VmKind kind) {
  switch (kind) {
    case VmKind::NONE:
      return "none";
    case VmKind::WSL2:
      return "wsl2";
    case VmKind::LIMA:
      return "lima";
  }
  return "unknown";
}

const char* VmStateName(VmState state) {
  switch (state) {
    case VmState::ABSENT:
      return "absent";
    case VmState::STARTING:
      return "starting";
    case VmState::READY:
      return "ready";
    case VmState::FAILED:
      return "failed";
  }
  return "unknown";
}

/*
 * Lima
 */

std::vector<std::string> LimaDriver::StatusCommand(
    const VmOptions& options) const {
  return {"limactl", "list", "--format", "{{.Status}}", options.name};
}

VmDriver::Status LimaDriver::ParseStatus(const util::ProcessResult& result,
                                         const VmOptions& options) const {
  if (!result.Success()) return Status::MISSING;
  std::string status = util::trim(result.stdout_data);
  if (status.empty()) return Status::MISSING;
  return status == "Running" ? Status::RUNNING : Status::STOPPED;
}

std::vector<std::vector<std::string>> LimaDriver::CreateCommands(
    const VmOptions& options) const {
  return {{"limactl", "create", "--name=" + options.name,
           "--cpus=" + std::to_string(options.cpus),
           "--memory=" + std::to_string(options.memory_gib), "--tty=false",
           "template://docker"}};
}

std::vector<std::string> LimaDriver::StartCommand(
    const VmOptions& options) const {
  return {"limactl", "start", "--tty=false", options.name};
}

std::vector<std::string> LimaDriver::StopCommand(
    const VmOptions& options) const {
  return {"limactl", "stop", options.name};
}

std::vector<std::string> LimaDriver::ShellPrefix(
    const VmOptions& options) const {
  return {"limactl", "shell", options.name};
}

/*
 * WSL2
 */

std::vector<std::string> WslDriver::StatusCommand(
    const VmOptions& options) const {
  return {"wsl", "--list", "--verbose"};
}

VmDriver::Status WslDriver::ParseStatus(const util::ProcessResult& result,
                                        const VmOptions& options) const {
  if (!result.Success()) return Status::MISSING;
  // wsl.exe writes UTF-16; the names we look for are ASCII.
  std::string text;
  for (char c : result.stdout_data) {
    if (c != '\0' && c != '\r') text += c;
  }
  for (const std::string& line : util::split(text, '\n')) {
    std::vector<std::string> fields = util::split(util::trim(line), ' ');
    if (!fields.empty() && fields[0] == "*") fields.erase(fields.begin());
    if (fields.size() >= 2 && fields[0] == options.name) {
      return fields[1] == "Running" ? Status::RUNNING : Status::STOPPED;
    }
  }
  return Status::MISSING;
}

std::vector<std::vector<std::string>> WslDriver::CreateCommands(
    const VmOptions& options) const {
  // Memory and CPUs of WSL2 are global settings (.wslconfig) and are not
  // managed here.
  return {{"wsl", "--install", "--distribution", "Ubuntu", "--name",
           options.name, "--no-launch"},
          {"wsl", "-d", options.name, "-u", "root", "--", "sh", "-c",
           "apt-get update && apt-get install -y docker.io"}};
}

std::vector<std::string> WslDriver::StartCommand(
    const VmOptions& options) const {
  return {"wsl", "-d", options.name, "-u", "root", "--",
          "service", "docker", "start"};
}

std::vector<std::string> WslDriver::StopCommand(
    const VmOptions& options) const {
  return {"wsl", "--terminate", options.name};
}

std::vector<std::string> WslDriver::ShellPrefix(
    const VmOptions& options) const {
  return {"wsl", "-d", options.name, "-u", "root", "--"};
}

std::unique_ptr<VmDriver> MakeVmDriver(VmKind kind) {
  switch (kind) {
    case VmKind::LIMA:
      return std::unique_ptr<VmDriver>(new LimaDriver());
    case VmKind::WSL2:
      return std::unique_ptr<VmDriver>(new WslDriver());
    case VmKind::NONE:
      break;
  }
  KJ_FAIL_REQUIRE("No VM driver for this platform kind", VmKindName(kind));
}

/*
 * VmManager
 */

VmManager::VmManager(std::unique_ptr<VmDriver> driver, Host* local,
                     VmOptions options)
    : driver_(std::move(driver)), local_(local), options_(std::move(options)) {
  instance_.name = options_.name;
  instance_.kind = driver_->Kind();
}

VmInstance VmManager::Instance() const {
  std::lock_guard<std::mutex> lck(state_mutex_);
  return instance_;
}

void VmManager::SetState(VmState state) {
  std::lock_guard<std::mutex> lck(state_mutex_);
  if (instance_.state != state) {
    KJ_LOG(INFO, "VM " + instance_.name, VmStateName(instance_.state), "->",
           VmStateName(state));
  }
  instance_.state = state;
}

std::string VmManager::Describe() const {
  return std::string(VmKindName(driver_->Kind())) + " VM " + options_.name;
}

std::vector<std::string> VmManager::InVm(
    const std::vector<std::string>& argv) const {
  std::vector<std::string> ret = driver_->ShellPrefix(options_);
  ret.insert(ret.end(), argv.begin(), argv.end());
  return ret;
}

util::ProcessResult VmManager::RunAdmin(const std::vector<std::string>& argv,
                                        std::chrono::milliseconds timeout) {
  KJ_LOG(INFO, "VM command", FormatCommand(argv));
  util::ProcessResult result;
  try {
    result = local_->Run(argv, "", timeout);
  } catch (const std::system_error& e) {
    throw core::vm_setup_error(FormatCommand(argv) + ": " + e.what());
  }
  if (result.timed_out) {
    throw core::vm_setup_error(FormatCommand(argv) + " timed out after " +
                               Seconds(timeout) + "s");
  }
  if (!result.Success()) {
    throw core::vm_setup_error(FormatCommand(argv) + " failed with exit code " +
                               std::to_string(result.exit_code) + ": " +
                               util::trim(result.stderr_data));
  }
  return result;
}

void VmManager::SetUp() {
  auto deadline = steady_clock::now() + options_.setup_timeout;
  auto remaining = [this, deadline]() {
    auto now = steady_clock::now();
    if (now >= deadline) {
      throw core::vm_setup_error("VM " + options_.name +
                                 " was not ready within " +
                                 Seconds(options_.setup_timeout) + "s");
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                  now);
  };

  util::ProcessResult status_result;
  try {
    status_result =
        local_->Run(driver_->StatusCommand(options_), "", remaining());
  } catch (const std::system_error& e) {
    throw core::vm_setup_error(driver_->Tool() + ": " + e.what());
  }
  VmDriver::Status status = driver_->ParseStatus(status_result, options_);
  if (status == VmDriver::Status::MISSING) {
    KJ_LOG(INFO, "Creating VM " + options_.name);
    for (const auto& command : driver_->CreateCommands(options_)) {
      RunAdmin(command, remaining());
    }
  }
  if (status != VmDriver::Status::RUNNING) {
    RunAdmin(driver_->StartCommand(options_), remaining());
  }

  while (true) {
    auto timeout = std::min(options_.command_timeout, remaining());
    util::ProcessResult probe = local_->Run(InVm(options_.readiness_probe), "",
                                            timeout);
    if (probe.Success()) return;
    if (steady_clock::now() + options_.poll_interval >= deadline) {
      throw core::vm_setup_error("VM " + options_.name +
                                 " did not accept commands within " +
                                 Seconds(options_.setup_timeout) +
                                 "s: " + util::trim(probe.stderr_data));
    }
    std::this_thread::sleep_for(options_.poll_interval);
  }
}

VmInstance VmManager::EnsureReady() {
  std::lock_guard<std::mutex> setup_lock(setup_mutex_);
  if (Instance().state == VmState::READY) return Instance();
  SetState(VmState::STARTING);

  int32_t attempts = std::max(options_.setup_retries, 1);
  std::chrono::milliseconds backoff = options_.setup_backoff;
  std::string last_error;
  for (int32_t attempt = 1; attempt <= attempts; attempt++) {
    KJ_LOG(INFO, "Setting up " + Describe(), "attempt", attempt, "of",
           attempts);
    try {
      SetUp();
      SetState(VmState::READY);
      return Instance();
    } catch (const core::vm_setup_error& e) {
      last_error = e.what();
      KJ_LOG(WARNING, "VM setup attempt failed", attempt, last_error);
    } catch (const std::system_error& e) {
      last_error = e.what();
      KJ_LOG(WARNING, "VM setup attempt failed", attempt, last_error);
    }
    if (attempt < attempts) {
      KJ_LOG(INFO, "Retrying VM setup in", backoff.count(), "ms");
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }
  SetState(VmState::FAILED);
  throw core::vm_setup_error("VM " + options_.name +
                             " could not be set up after " +
                             std::to_string(attempts) +
                             " attempts: " + last_error);
}

util::ProcessResult VmManager::Run(const std::vector<std::string>& argv,
                                   const std::string& stdin_data,
                                   std::chrono::milliseconds timeout) {
  if (Instance().state != VmState::READY) EnsureReady();
  return local_->Run(InVm(argv), stdin_data, timeout);
}

std::unique_ptr<util::LineChannel> VmManager::Spawn(
    const std::vector<std::string>& argv) {
  if (Instance().state != VmState::READY) EnsureReady();
  return local_->Spawn(InVm(argv));
}

void VmManager::Teardown() {
  std::lock_guard<std::mutex> setup_lock(setup_mutex_);
  if (Instance().state == VmState::ABSENT) return;
  try {
    RunAdmin(driver_->StopCommand(options_), options_.command_timeout);
  } catch (const core::vm_setup_error& e) {
    KJ_LOG(WARNING, "Stopping the VM failed", e.what());
  }
  SetState(VmState::ABSENT);
}

}  // namespace backend
