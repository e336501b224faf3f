#ifndef BACKEND_BACKEND_FACTORY_HPP
#define BACKEND_BACKEND_FACTORY_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <kj/common.h>

#include "backend/container_engine.hpp"
#include "backend/file_exchange.hpp"
#include "backend/host.hpp"
#include "backend/vm_manager.hpp"

namespace backend {

enum class BackendKind { NATIVE, VIRTUALIZED };

// The isolation substrate every session uses. Selected once, then shared.
struct Backend {
  BackendKind kind = BackendKind::NATIVE;
  std::string description;
  // Null for the native backend.
  std::unique_ptr<VmManager> vm;
  // Where the container engine runs: the local machine or the VM.
  Host* host = nullptr;
  std::unique_ptr<ContainerEngine> engine;
  std::unique_ptr<FileExchange> files;
};

struct BackendOptions {
  // auto, none, lima or wsl2: the VM layer to fall back to when no native
  // engine answers. none disables the fallback, auto picks lima.
  std::string platform = "auto";
  EngineOptions engine;
  // Parent of the host-side workspaces of the native backend.
  std::string workspace_directory = "temp";
  // Parent of the workspaces inside a VM.
  std::string vm_workspace_directory = "/tmp/codebox";
  bool keep_workspaces = false;
  VmOptions vm;
  std::chrono::milliseconds probe_timeout = std::chrono::seconds(30);
};

// What probing found out about one candidate.
struct ProbeOutcome {
  std::string candidate;
  bool usable = false;
  std::string detail;
};

// Probes the available isolation substrates in priority order and builds the
// first usable one. It never falls back to unisolated execution.
class BackendFactory {
 public:
  // Probe commands run on local, which must outlive the factory.
  BackendFactory(Host* local, BackendOptions options);

  // Probes every candidate, without selecting any.
  std::vector<ProbeOutcome> Probe();

  // Builds the first usable candidate. Throws core::backend_unavailable, with
  // the outcome of every probe, if there is none.
  std::unique_ptr<Backend> Select();

  // The process-wide backend: selected on the first call, then reused. A
  // failed selection is not retried.
  Backend& Get();

  static std::string FormatReport(const std::vector<ProbeOutcome>& outcomes);

  KJ_DISALLOW_COPY(BackendFactory);

 private:
  struct Candidate {
    std::string name;
    std::function<ProbeOutcome()> probe;
    std::function<std::unique_ptr<Backend>()> build;
  };

  std::vector<Candidate> Candidates();
  ProbeOutcome ProbeNative();
  ProbeOutcome ProbeVm(VmKind kind);
  std::unique_ptr<Backend> BuildNative();
  std::unique_ptr<Backend> BuildVirtualized(VmKind kind);

  Host* local_;
  BackendOptions options_;
  std::mutex mutex_;
  std::unique_ptr<Backend> selected_;
  std::string failure_;
};

// Parses a platform name. Throws std::invalid_argument.
VmKind ParsePlatform(const std::string& platform);

}  // namespace backend

#endif
