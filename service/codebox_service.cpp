#include "service/codebox_service.hpp"

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"

namespace service {

ServiceOptions ServiceOptions::FromFlags() {
  using std::chrono::seconds;
  ServiceOptions options;

  options.backend.platform = Flags::platform;
  options.backend.engine.binary = Flags::container_engine;
  options.backend.engine.command_timeout = seconds(Flags::command_timeout);
  options.backend.workspace_directory = Flags::temp_directory;
  options.backend.keep_workspaces = Flags::keep_workspaces;
  options.backend.vm.name = Flags::vm_name;
  options.backend.vm.memory_gib = Flags::vm_memory_gib;
  options.backend.vm.cpus = Flags::vm_cpus;
  options.backend.vm.setup_timeout = seconds(Flags::vm_setup_timeout);
  options.backend.vm.setup_retries = Flags::vm_setup_retries;
  options.backend.vm.setup_backoff =
      std::chrono::milliseconds(Flags::vm_setup_backoff_millis);
  options.backend.vm.command_timeout = seconds(Flags::command_timeout);

  options.session.image = Flags::image;
  options.session.kernel_script = Flags::kernel_script;
  options.session.command_timeout = seconds(Flags::command_timeout);
  options.session.handshake_timeout = seconds(Flags::handshake_timeout);
  options.session.idle_timeout = seconds(Flags::idle_timeout);

  options.tracker.num_workers = Flags::num_workers;
  options.tracker.default_timeout = seconds(Flags::execution_timeout);
  options.tracker.queue_timeout = seconds(Flags::queue_timeout);
  options.tracker.retention =
      std::chrono::hours(Flags::artifact_retention_hours);

  options.policy = security::Policy::Load(Flags::policy_file);
  options.store_directory = Flags::store_directory;
  options.sweep_interval = seconds(Flags::sweep_interval);
  return options;
}

CodeboxService::CodeboxService(backend::Host* host, ServiceOptions options)
    : options_(std::move(options)),
      validator_(options_.policy),
      backends_(host, options_.backend),
      sessions_(&backends_, &validator_, options_.session),
      store_(options_.store_directory),
      tracker_(&sessions_, &validator_, &store_, options_.tracker) {}

CodeboxService::~CodeboxService() { Stop(); }

void CodeboxService::Start() {
  backend::Backend& selected = backends_.Get();
  KJ_LOG(INFO, "Using " + selected.description);
  if (options_.reconcile_on_start) {
    size_t orphans = sessions_.Reconcile();
    if (orphans) KJ_LOG(WARNING, "Removed orphaned containers", orphans);
  }
  tracker_.Start();
  {
    std::lock_guard<std::mutex> lck(sweeper_mutex_);
    stopping_ = false;
  }
  sweeper_ = std::thread(&CodeboxService::SweeperBody, this);
}

void CodeboxService::Stop() {
  {
    std::lock_guard<std::mutex> lck(sweeper_mutex_);
    stopping_ = true;
  }
  sweeper_cv_.notify_all();
  if (sweeper_.joinable()) sweeper_.join();
  tracker_.Stop();
  sessions_.TerminateAll();
}

void CodeboxService::SweeperBody() {
  util::ThreadLogger logger;
  std::unique_lock<std::mutex> lck(sweeper_mutex_);
  while (!stopping_) {
    sweeper_cv_.wait_for(lck, options_.sweep_interval);
    if (stopping_) break;
    lck.unlock();
    Sweep();
    lck.lock();
  }
}

void CodeboxService::Sweep() {
  size_t evicted = sessions_.Sweep(std::chrono::steady_clock::now());
  size_t forgotten = tracker_.Sweep(std::chrono::steady_clock::now());
  store_.Sweep(std::chrono::system_clock::now() - options_.tracker.retention);
  if (evicted || forgotten) {
    KJ_LOG(INFO, "Sweep", evicted, forgotten);
  }
}

std::string CodeboxService::CreateSession(
    const std::vector<std::string>& dependencies,
    const session::EnvironmentOptions& options) {
  return sessions_.CreateSession(dependencies, options);
}

std::vector<security::Dependency> CodeboxService::InstallDependencies(
    const std::string& session_id,
    const std::vector<std::string>& dependencies) {
  return sessions_.InstallDependencies(session_id, dependencies);
}

void CodeboxService::DeleteSession(const std::string& session_id) {
  sessions_.Terminate(session_id);
}

std::string CodeboxService::SubmitExecution(
    const std::string& session_id, const std::string& code,
    std::chrono::milliseconds timeout) {
  return tracker_.Submit(session_id, code, timeout);
}

std::string CodeboxService::SubmitToNewSession(
    const std::vector<std::string>& dependencies, const std::string& code,
    std::chrono::milliseconds timeout, std::string* session_id) {
  validator_.ValidateCode(code);
  std::string created =
      sessions_.CreateSession(dependencies, session::EnvironmentOptions());
  KJ_LOG(INFO, "Session " + created + " created for a submission");
  try {
    std::string request_id = tracker_.Submit(created, code, timeout);
    *session_id = created;
    return request_id;
  } catch (const core::codebox_error&) {
    sessions_.Terminate(created);
    throw;
  }
}

tracker::RequestInfo CodeboxService::GetExecutionStatus(
    const std::string& request_id) {
  return tracker_.Status(request_id);
}

tracker::RequestResult CodeboxService::GetExecutionResult(
    const std::string& request_id) {
  return tracker_.Result(request_id);
}

tracker::RequestStatus CodeboxService::WaitExecution(
    const std::string& request_id, std::chrono::milliseconds timeout) {
  return tracker_.Wait(request_id, timeout);
}

std::vector<std::string> CodeboxService::ListFiles(
    const std::string& request_id) {
  return tracker_.ListFiles(request_id);
}

std::string CodeboxService::FetchFile(const std::string& request_id,
                                      const std::string& name) {
  return tracker_.FetchFile(request_id, name);
}

std::vector<backend::ProbeOutcome> CodeboxService::Probe() {
  return backends_.Probe();
}

size_t CodeboxService::Reconcile() { return sessions_.Reconcile(); }

}  // namespace service
