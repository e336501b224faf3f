#include "backend/backend_factory.hpp"

#include <stdexcept>
#include <system_error>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/misc.hpp"

namespace backend {

VmKind ParsePlatform(const std::string& platform) {
  if (platform == "auto" || platform == "lima") return VmKind::LIMA;
  if (platform == "wsl2") return VmKind::WSL2;
  if (platform == "none") return VmKind::NONE;
  throw std::invalid_argument("Unknown platform " + platform +
                              ", expected auto, none, lima or wsl2");
}

BackendFactory::BackendFactory(Host* local, BackendOptions options)
    : local_(local), options_(std::move(options)) {
  ParsePlatform(options_.platform);
}

std::vector<BackendFactory::Candidate> BackendFactory::Candidates() {
  std::vector<Candidate> candidates;
  candidates.push_back({"native " + options_.engine.binary,
                        [this]() { return ProbeNative(); },
                        [this]() { return BuildNative(); }});
  VmKind kind = ParsePlatform(options_.platform);
  if (kind != VmKind::NONE) {
    candidates.push_back(
        {std::string(VmKindName(kind)) + " VM",
         [this, kind]() { return ProbeVm(kind); },
         [this, kind]() { return BuildVirtualized(kind); }});
  }
  return candidates;
}

ProbeOutcome BackendFactory::ProbeNative() {
  ProbeOutcome outcome;
  outcome.candidate = "native " + options_.engine.binary;
  util::ProcessResult result;
  try {
    result = local_->Run({options_.engine.binary, "info"}, "",
                         options_.probe_timeout);
  } catch (const std::system_error& e) {
    outcome.detail = options_.engine.binary + " is not installed";
    return outcome;
  }
  if (result.Success()) {
    outcome.usable = true;
    outcome.detail = options_.engine.binary + " is responsive";
  } else if (result.timed_out) {
    outcome.detail = options_.engine.binary + " info timed out";
  } else {
    outcome.detail = options_.engine.binary + " is not responsive: " +
                     util::trim(result.stderr_data);
  }
  return outcome;
}

ProbeOutcome BackendFactory::ProbeVm(VmKind kind) {
  std::unique_ptr<VmDriver> driver = MakeVmDriver(kind);
  ProbeOutcome outcome;
  outcome.candidate = std::string(VmKindName(kind)) + " VM";
  util::ProcessResult result;
  try {
    result = local_->Run({driver->Tool(), "--version"}, "",
                         options_.probe_timeout);
  } catch (const std::system_error& e) {
    outcome.detail = driver->Tool() + " is not installed";
    return outcome;
  }
  if (result.Success()) {
    outcome.usable = true;
    outcome.detail = util::trim(result.stdout_data);
    if (outcome.detail.empty()) outcome.detail = driver->Tool() + " found";
  } else {
    outcome.detail = driver->Tool() + " --version failed: " +
                     util::trim(result.stderr_data);
  }
  return outcome;
}

std::unique_ptr<Backend> BackendFactory::BuildNative() {
  std::unique_ptr<Backend> backend(new Backend());
  backend->kind = BackendKind::NATIVE;
  backend->description = "native " + options_.engine.binary;
  backend->host = local_;
  backend->engine.reset(new ContainerEngine(local_, options_.engine));
  backend->files.reset(new MountedFileExchange(options_.workspace_directory,
                                               options_.keep_workspaces));
  return backend;
}

std::unique_ptr<Backend> BackendFactory::BuildVirtualized(VmKind kind) {
  std::unique_ptr<Backend> backend(new Backend());
  backend->kind = BackendKind::VIRTUALIZED;
  backend->vm.reset(new VmManager(MakeVmDriver(kind), local_, options_.vm));
  backend->description =
      options_.engine.binary + " in " + backend->vm->Describe();
  backend->host = backend->vm.get();
  backend->engine.reset(new ContainerEngine(backend->host, options_.engine));
  backend->files.reset(new VmFileExchange(backend->host,
                                          options_.vm_workspace_directory,
                                          options_.engine.command_timeout));
  return backend;
}

std::vector<ProbeOutcome> BackendFactory::Probe() {
  std::vector<ProbeOutcome> outcomes;
  for (const Candidate& candidate : Candidates()) {
    outcomes.push_back(candidate.probe());
  }
  return outcomes;
}

std::unique_ptr<Backend> BackendFactory::Select() {
  std::vector<ProbeOutcome> outcomes;
  for (const Candidate& candidate : Candidates()) {
    ProbeOutcome outcome = candidate.probe();
    KJ_LOG(INFO, "Probe " + outcome.candidate,
           outcome.usable ? "usable" : "unusable", outcome.detail);
    outcomes.push_back(outcome);
    if (outcome.usable) {
      std::unique_ptr<Backend> backend = candidate.build();
      KJ_LOG(INFO, "Selected backend " + backend->description);
      return backend;
    }
  }
  throw core::backend_unavailable("No usable isolation backend. " +
                                  FormatReport(outcomes));
}

Backend& BackendFactory::Get() {
  std::lock_guard<std::mutex> lck(mutex_);
  if (selected_) return *selected_;
  if (!failure_.empty()) throw core::backend_unavailable(failure_);
  try {
    selected_ = Select();
  } catch (const core::backend_unavailable& e) {
    failure_ = e.what();
    throw;
  }
  return *selected_;
}

std::string BackendFactory::FormatReport(
    const std::vector<ProbeOutcome>& outcomes) {
  std::vector<std::string> lines;
  for (const ProbeOutcome& outcome : outcomes) {
    lines.push_back(outcome.candidate + ": " +
                    (outcome.usable ? "usable" : "unusable") + " (" +
                    outcome.detail + ")");
  }
  return util::join(lines, "; ");
}

}  // namespace backend
