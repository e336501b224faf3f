#include "backend/container_engine.hpp"

#include <algorithm>
#include <system_error>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/misc.hpp"

namespace backend {

namespace {

// Exit status of timeout(1) when the command was killed.
const constexpr int32_t kTimeoutExitCode = 124;
// Grace period given to the engine client on top of the in-container bound.
const constexpr auto kExecSlack = std::chrono::seconds(5);

std::string Describe(const util::ProcessResult& result) {
  if (result.timed_out) return "timed out";
  std::string stderr_text = util::trim(result.stderr_data);
  return "exit code " + std::to_string(result.exit_code) +
         (stderr_text.empty() ? "" : ": " + stderr_text);
}

}  // namespace

util::ProcessResult ContainerEngine::Command(
    const std::vector<std::string>& args, std::chrono::milliseconds timeout,
    const std::string& stdin_data) {
  std::vector<std::string> argv = {options_.binary};
  argv.insert(argv.end(), args.begin(), args.end());
  util::ProcessResult result;
  try {
    result = host_->Run(argv, stdin_data, timeout);
  } catch (const std::system_error& e) {
    throw core::container_start_failure(FormatCommand(argv) + ": " + e.what());
  }
  KJ_LOG(INFO, FormatCommand(argv), result.exit_code, result.timed_out);
  return result;
}

void ContainerEngine::Pull(const std::string& image) {
  if (Command({"image", "inspect", image}, options_.command_timeout)
          .Success()) {
    return;
  }
  KJ_LOG(INFO, "Pulling image " + image);
  util::ProcessResult result =
      Command({"pull", image}, options_.pull_timeout);
  if (!result.Success()) {
    throw core::container_start_failure("Could not pull image " + image +
                                        ": " + Describe(result));
  }
}

std::string ContainerEngine::CreateAndStart(const ContainerSpec& spec) {
  std::vector<std::string> args = {
      "run",     "-d",
      "--rm",    "--name",
      spec.name, "--label",
      "codebox.managed=true", "-v",
      spec.workspace + ":" + kContainerWorkspace, "-w",
      kContainerWorkspace};
  for (const std::string& flag : ToEngineFlags(spec.limits)) {
    args.push_back(flag);
  }
  args.insert(args.end(), {"--security-opt", "no-new-privileges:true",
                           "--cap-drop", "ALL"});
  for (const auto& var : spec.env) {
    args.push_back("-e");
    args.push_back(var.first + "=" + var.second);
  }
  for (const Mount& mount : spec.mounts) {
    args.push_back("-v");
    args.push_back(mount.host_path + ":" + mount.container_path +
                   (mount.read_only ? ":ro" : ""));
  }
  args.insert(args.end(), {spec.image, "sleep", "infinity"});

  util::ProcessResult result = Command(args, options_.command_timeout);
  if (!result.Success()) {
    throw core::container_start_failure("Could not start container " +
                                        spec.name + ": " + Describe(result));
  }
  return spec.name;
}

util::ProcessResult ContainerEngine::Exec(
    const std::string& container, const std::vector<std::string>& argv,
    std::chrono::milliseconds timeout, const std::string& stdin_data) {
  int64_t seconds =
      std::max<int64_t>(1, std::chrono::duration_cast<std::chrono::seconds>(
                               timeout + std::chrono::milliseconds(999))
                               .count());
  std::vector<std::string> args = {"exec"};
  if (!stdin_data.empty()) args.push_back("-i");
  // timeout(1) kills the command inside the container even when the engine
  // client is killed on our side.
  args.insert(args.end(),
              {container, "timeout", "-k", "2", std::to_string(seconds)});
  args.insert(args.end(), argv.begin(), argv.end());
  util::ProcessResult result = Command(args, timeout + kExecSlack, stdin_data);
  if (result.exit_code == kTimeoutExitCode) result.timed_out = true;
  return result;
}

std::unique_ptr<util::LineChannel> ContainerEngine::Attach(
    const std::string& container, const std::vector<std::string>& argv) {
  std::vector<std::string> full = {options_.binary, "exec", "-i", container};
  full.insert(full.end(), argv.begin(), argv.end());
  KJ_LOG(INFO, "Attaching " + FormatCommand(full));
  try {
    return host_->Spawn(full);
  } catch (const std::system_error& e) {
    throw core::container_start_failure(FormatCommand(full) + ": " + e.what());
  }
}

void ContainerEngine::StopAndRemove(const std::string& container) {
  util::ProcessResult result =
      Command({"rm", "-f", container}, options_.command_timeout);
  if (result.Success()) return;
  if (result.stderr_data.find("No such container") != std::string::npos) {
    KJ_LOG(INFO, "Container already gone", container);
    return;
  }
  throw core::container_start_failure("Could not remove container " +
                                      container + ": " + Describe(result));
}

std::vector<std::string> ContainerEngine::ListManaged() {
  util::ProcessResult result =
      Command({"ps", "-a", "--filter", std::string("name=^") + kContainerPrefix,
               "--format", "{{.Names}}"},
              options_.command_timeout);
  if (!result.Success()) {
    throw core::container_start_failure("Could not list containers: " +
                                        Describe(result));
  }
  std::vector<std::string> names;
  for (const std::string& line : util::split(result.stdout_data, '\n')) {
    std::string name = util::trim(line);
    if (util::startsWith(name, kContainerPrefix)) names.push_back(name);
  }
  return names;
}

}  // namespace backend
