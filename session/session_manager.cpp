#include "session/session_manager.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace session {

namespace {

using std::chrono::steady_clock;

const constexpr char* kAgentDirectory = ".codebox";
const constexpr char* kAgentScript = ".codebox/kernel.py";
const constexpr char* kConnectionFile = ".codebox/connection.json";
// Bytes of installer output kept in error messages.
const constexpr size_t kMaxErrorTail = 2000;

std::string Tail(const std::string& text) {
  std::string trimmed = util::trim(text);
  if (trimmed.size() <= kMaxErrorTail) return trimmed;
  return "..." + trimmed.substr(trimmed.size() - kMaxErrorTail);
}

bool IsEnvName(const std::string& name) {
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
  });
}

bool IsMountPath(const std::string& path) {
  return !path.empty() && path[0] == '/' &&
         path.find_first_of(":,") == std::string::npos &&
         path.find('\0') == std::string::npos;
}

void CheckEnvironment(const EnvironmentOptions& options) {
  std::vector<std::string> problems;
  for (const auto& var : options.env) {
    if (!IsEnvName(var.first)) {
      problems.push_back("invalid environment variable name '" + var.first +
                         "'");
    }
  }
  const std::string workspace = backend::kContainerWorkspace;
  for (const backend::Mount& mount : options.mounts) {
    if (!IsMountPath(mount.host_path) || !IsMountPath(mount.container_path)) {
      problems.push_back("invalid mount " + mount.host_path + " -> " +
                         mount.container_path);
    } else if (mount.container_path == workspace ||
               util::startsWith(mount.container_path, workspace + "/")) {
      problems.push_back("mount " + mount.container_path +
                         " overlaps the workspace");
    }
  }
  if (!problems.empty()) {
    throw core::validation_error("Invalid environment: " +
                                 util::join(problems, "; "));
  }
}

// File name of a rich display payload, or empty if it is not saved.
std::string DisplayFileName(const kernel::DisplayData& display, size_t n,
                            std::string* content) {
  auto png = display.data.find("image/png");
  if (png != display.data.end()) {
    *content = util::base64Decode(png->second);
    return "display-" + std::to_string(n) + ".png";
  }
  auto svg = display.data.find("image/svg+xml");
  if (svg != display.data.end()) {
    *content = svg->second;
    return "display-" + std::to_string(n) + ".svg";
  }
  return "";
}

}  // namespace

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::PROVISIONING:
      return "provisioning";
    case SessionState::READY:
      return "ready";
    case SessionState::BUSY:
      return "busy";
    case SessionState::ERROR:
      return "error";
    case SessionState::TERMINATED:
      return "terminated";
  }
  return "unknown";
}

// Every field but kernel is guarded by the manager's mutex. The kernel is
// used only by whoever moved the session out of READY.
struct SessionManager::Session {
  SessionInfo info;
  backend::Backend* backend = nullptr;
  std::unique_ptr<kernel::KernelClient> kernel;
  bool container_removed = false;
  steady_clock::time_point terminated_at;
};

SessionManager::SessionManager(backend::BackendFactory* backends,
                               const security::Validator* validator,
                               SessionOptions options)
    : backends_(backends), validator_(validator), options_(std::move(options)) {
  KJ_REQUIRE(!options_.kernel_script.empty(), "No kernel script configured");
}

SessionManager::~SessionManager() { TerminateAll(); }

void SessionManager::SetState(Session* session, SessionState state) {
  if (session->info.state == state) return;
  KJ_LOG(INFO, "Session " + session->info.id,
         SessionStateName(session->info.state), SessionStateName(state));
  session->info.state = state;
  if (state == SessionState::TERMINATED) {
    session->terminated_at = steady_clock::now();
  }
}

std::shared_ptr<SessionManager::Session> SessionManager::Find(
    const std::string& id) {
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    throw core::session_not_found("Unknown session " + id);
  }
  return it->second;
}

std::shared_ptr<SessionManager::Session> SessionManager::Acquire(
    const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  std::shared_ptr<Session> session = Find(id);
  switch (session->info.state) {
    case SessionState::READY:
      break;
    case SessionState::TERMINATED:
      throw core::session_not_found("Session " + id + " was terminated");
    case SessionState::ERROR:
      throw core::session_busy("Session " + id +
                               " failed and must be recreated: " +
                               session->info.error);
    case SessionState::BUSY:
      throw core::session_busy("Session " + id + " is executing code");
    case SessionState::PROVISIONING:
      throw core::session_busy("Session " + id + " is being provisioned");
  }
  SetState(session.get(), SessionState::BUSY);
  session->info.last_activity = steady_clock::now();
  return session;
}

void SessionManager::Finish(Session* session) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (session->info.state != SessionState::TERMINATED) {
      SetState(session, SessionState::READY);
      session->info.last_activity = steady_clock::now();
      return;
    }
  }
  Release(session);
}

void SessionManager::Poison(Session* session, const std::string& reason) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (session->info.state != SessionState::TERMINATED) {
      session->info.error = reason;
      SetState(session, SessionState::ERROR);
    }
  }
  KJ_LOG(WARNING, "Session " + session->info.id + " failed", reason);
  Release(session);
}

/*
 * Provisioning
 */

std::string SessionManager::CreateSession(
    const std::vector<std::string>& dependencies,
    const EnvironmentOptions& options) {
  std::vector<security::Dependency> approved =
      validator_->ValidateDependencies(dependencies);
  EnvironmentOptions environment = options;
  environment.limits =
      backend::ApplyDefaults(options.limits, options_.default_limits);
  backend::CheckLimits(environment.limits);
  CheckEnvironment(environment);
  backend::Backend& selected = backends_->Get();

  auto session = std::make_shared<Session>();
  session->info.id = util::randomId();
  session->info.created = std::chrono::system_clock::now();
  session->info.last_activity = steady_clock::now();
  session->info.handle.limits = environment.limits;
  session->info.handle.vm =
      selected.vm ? selected.vm->Instance().name : "native";
  session->backend = &selected;
  const std::string id = session->info.id;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    sessions_.emplace(id, session);
  }
  KJ_LOG(INFO, "Provisioning session " + id, selected.description);

  try {
    Provision(session.get(), &selected, approved, environment);
  } catch (const std::exception& e) {
    KJ_LOG(WARNING, "Could not provision session " + id, e.what());
    Release(session.get());
    {
      std::lock_guard<std::mutex> lck(mutex_);
      if (session->info.state == SessionState::TERMINATED) {
        session->info.error = e.what();
      } else {
        sessions_.erase(id);
      }
    }
    throw;
  }

  {
    std::lock_guard<std::mutex> lck(mutex_);
    session->info.dependencies = approved;
    if (session->info.state != SessionState::TERMINATED) {
      SetState(session.get(), SessionState::READY);
      session->info.last_activity = steady_clock::now();
      return id;
    }
  }
  // Terminated while it was being provisioned.
  Release(session.get());
  return id;
}

void SessionManager::Provision(
    Session* session, backend::Backend* backend,
    const std::vector<security::Dependency>& dependencies,
    const EnvironmentOptions& options) {
  const std::string& id = session->info.id;
  if (backend->vm) backend->vm->EnsureReady();
  backend->engine->Pull(options_.image);

  std::string workspace = backend->files->CreateWorkspace(id);
  {
    std::lock_guard<std::mutex> lck(mutex_);
    session->info.handle.workspace = workspace;
  }
  std::string script;
  try {
    script = util::File::ReadAll(options_.kernel_script);
  } catch (const std::system_error& e) {
    throw core::transfer_error("Cannot read the kernel agent " +
                               options_.kernel_script + ": " + e.what());
  }
  kernel::ConnectionInfo connection;
  connection.key = util::randomId();
  backend->files->Push(workspace, script, kAgentScript);
  backend->files->Push(workspace, connection.ToJson().dump(),
                       kConnectionFile);

  backend::ContainerSpec spec;
  spec.name = backend::ContainerEngine::ContainerName(id);
  spec.image = options_.image;
  spec.workspace = workspace;
  spec.limits = options.limits;
  spec.env = options.env;
  spec.mounts = options.mounts;
  std::string container = backend->engine->CreateAndStart(spec);
  {
    std::lock_guard<std::mutex> lck(mutex_);
    session->info.handle.container = container;
  }

  if (!dependencies.empty()) Install(session, dependencies);

  const std::string agent_dir =
      std::string(backend::kContainerWorkspace) + "/" + kAgentDirectory;
  session->kernel.reset(new kernel::KernelClient(
      backend->engine->Attach(container,
                              {options_.python, agent_dir + "/kernel.py",
                               agent_dir + "/connection.json"}),
      connection.key));
  session->kernel->Handshake(options_.handshake_timeout);
}

void SessionManager::Install(
    Session* session, const std::vector<security::Dependency>& dependencies) {
  std::vector<std::string> argv = {options_.python, "-m", "pip", "install",
                                   "--no-cache-dir",
                                   "--disable-pip-version-check"};
  std::vector<std::string> names;
  for (const security::Dependency& dep : dependencies) {
    argv.push_back(dep.Requirement());
    names.push_back(dep.Requirement());
  }
  std::string container;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    container = session->info.handle.container;
  }
  KJ_LOG(INFO, "Installing in session " + session->info.id,
         util::join(names, " "));
  util::ProcessResult result = session->backend->engine->Exec(
      container, argv, options_.install_timeout);
  if (result.timed_out) {
    throw core::dependency_install_error("Installing " +
                                         util::join(names, " ") +
                                         " timed out");
  }
  if (!result.Success()) {
    throw core::dependency_install_error(
        "Could not install " + util::join(names, " ") + ": " +
        Tail(result.stderr_data + "\n" + result.stdout_data));
  }
}

std::vector<security::Dependency> SessionManager::InstallDependencies(
    const std::string& id, const std::vector<std::string>& dependencies) {
  std::vector<security::Dependency> approved =
      validator_->ValidateDependencies(dependencies);
  std::shared_ptr<Session> session = Acquire(id);
  try {
    if (!approved.empty()) Install(session.get(), approved);
  } catch (const core::dependency_install_error&) {
    Finish(session.get());
    throw;
  } catch (const core::codebox_error& e) {
    Poison(session.get(), e.what());
    throw;
  } catch (const std::exception& e) {
    Poison(session.get(), e.what());
    throw core::container_start_failure(
        std::string("Session " + id + " failed: ") + e.what());
  }
  {
    std::lock_guard<std::mutex> lck(mutex_);
    auto& installed = session->info.dependencies;
    for (const security::Dependency& dep : approved) {
      auto same = [&dep](const security::Dependency& other) {
        return other.name == dep.name;
      };
      installed.erase(std::remove_if(installed.begin(), installed.end(), same),
                      installed.end());
      installed.push_back(dep);
    }
  }
  Finish(session.get());
  return approved;
}

/*
 * Execution
 */

ExecutionResult SessionManager::Submit(const std::string& id,
                                       const std::string& code,
                                       std::chrono::milliseconds timeout,
                                       const std::string& artifact_dir,
                                       const std::function<void()>& on_start) {
  std::shared_ptr<Session> session = Acquire(id);
  ExecutionResult result;
  try {
    if (on_start) on_start();
    result.output = session->kernel->Execute(code, timeout);
    result.files =
        CollectArtifacts(session.get(), result.output, artifact_dir);
  } catch (const core::codebox_error& e) {
    Poison(session.get(), e.what());
    throw;
  } catch (const std::exception& e) {
    Poison(session.get(), e.what());
    throw core::container_start_failure(
        std::string("Session " + id + " failed: ") + e.what());
  }
  Finish(session.get());
  return result;
}

std::vector<std::string> SessionManager::CollectArtifacts(
    Session* session, const kernel::ExecutionOutput& output,
    const std::string& artifact_dir) {
  std::string workspace, container;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    workspace = session->info.handle.workspace;
    container = session->info.handle.container;
  }
  backend::Backend* backend = session->backend;
  std::vector<std::string> files =
      backend->files->PullTree(workspace, kOutputsDirectory, artifact_dir);
  if (!files.empty()) {
    // outputs/ is an outbox: what was collected is not reported again.
    util::ProcessResult cleared = backend->engine->Exec(
        container,
        {"find",
         std::string(backend::kContainerWorkspace) + "/" + kOutputsDirectory,
         "-mindepth", "1", "-delete"},
        options_.command_timeout);
    if (!cleared.Success()) {
      KJ_LOG(WARNING, "Could not clear the outputs of session " +
                          session->info.id,
             cleared.stderr_data);
    }
  }

  size_t n = 0;
  for (const kernel::DisplayData& display : output.displays) {
    std::string content;
    std::string name;
    try {
      name = DisplayFileName(display, n + 1, &content);
    } catch (const std::invalid_argument& e) {
      KJ_LOG(WARNING, "Malformed display payload", e.what());
      continue;
    }
    if (name.empty()) continue;
    n++;
    try {
      util::File::WriteAll(util::File::JoinPath(artifact_dir, name), content);
    } catch (const std::system_error& e) {
      throw core::transfer_error("Cannot store " + name + ": " + e.what());
    }
    files.push_back(name);
  }
  return files;
}

/*
 * Teardown
 */

void SessionManager::StopContainer(Session* session) {
  std::string container;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    if (session->container_removed || session->info.handle.container.empty()) {
      return;
    }
    session->container_removed = true;
    container = session->info.handle.container;
  }
  backend::ContainerEngine* engine = session->backend->engine.get();
  try {
    // Files created by the container must stay removable from outside.
    util::ProcessResult chmod = engine->Exec(
        container, {"chmod", "-R", "a+rwX", backend::kContainerWorkspace},
        options_.command_timeout);
    if (!chmod.Success()) {
      KJ_LOG(INFO, "Could not release workspace permissions", container,
             chmod.stderr_data);
    }
    engine->StopAndRemove(container);
  } catch (const core::codebox_error& e) {
    KJ_LOG(ERROR, "Could not remove container " + container, e.what());
  }
}

void SessionManager::Release(Session* session) {
  if (session->kernel) session->kernel->Close();
  StopContainer(session);
  std::string workspace;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    workspace = session->info.handle.workspace;
  }
  if (workspace.empty()) return;
  try {
    session->backend->files->RemoveWorkspace(workspace);
  } catch (const core::codebox_error& e) {
    KJ_LOG(ERROR, "Could not remove workspace " + workspace, e.what());
  }
}

void SessionManager::Terminate(const std::string& id) {
  std::shared_ptr<Session> session;
  bool owned;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    session = Find(id);
    SessionState state = session->info.state;
    if (state == SessionState::TERMINATED) return;
    // Busy and provisioning sessions are released by whoever is using them.
    owned = state == SessionState::READY || state == SessionState::ERROR;
    SetState(session.get(), SessionState::TERMINATED);
  }
  if (owned) {
    Release(session.get());
  } else {
    StopContainer(session.get());
  }
}

void SessionManager::TerminateAll() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    for (const auto& session : sessions_) {
      if (session.second->info.state != SessionState::TERMINATED) {
        ids.push_back(session.first);
      }
    }
  }
  for (const std::string& id : ids) Terminate(id);
}

SessionInfo SessionManager::Info(const std::string& id) {
  std::lock_guard<std::mutex> lck(mutex_);
  return Find(id)->info;
}

std::vector<SessionInfo> SessionManager::List() {
  std::lock_guard<std::mutex> lck(mutex_);
  std::vector<SessionInfo> ret;
  for (const auto& session : sessions_) ret.push_back(session.second->info);
  return ret;
}

size_t SessionManager::Sweep(steady_clock::time_point now) {
  std::vector<std::string> idle;
  std::vector<std::shared_ptr<Session>> ready;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      Session* session = it->second.get();
      SessionState state = session->info.state;
      if (state == SessionState::TERMINATED) {
        if (now - session->terminated_at > options_.tombstone_ttl) {
          it = sessions_.erase(it);
          continue;
        }
      } else if ((state == SessionState::READY ||
                  state == SessionState::ERROR) &&
                 now - session->info.last_activity > options_.idle_timeout) {
        idle.push_back(it->first);
      } else if (state == SessionState::READY) {
        ready.push_back(it->second);
      }
      ++it;
    }
  }
  for (const std::string& id : idle) {
    KJ_LOG(INFO, "Evicting idle session " + id);
    Terminate(id);
  }
  for (const auto& session : ready) {
    if (!session->kernel || session->kernel->Ping(options_.ping_timeout)) {
      continue;
    }
    {
      std::lock_guard<std::mutex> lck(mutex_);
      // Someone started using it meanwhile, and will notice.
      if (session->info.state != SessionState::READY) continue;
      session->info.error = "The interpreter stopped answering heartbeats";
      SetState(session.get(), SessionState::ERROR);
    }
    KJ_LOG(WARNING, "Session " + session->info.id + " is unresponsive");
    Release(session.get());
  }
  return idle.size();
}

size_t SessionManager::Reconcile() {
  backend::Backend& selected = backends_->Get();
  std::vector<std::string> known;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    for (const auto& session : sessions_) {
      if (!session.second->container_removed) {
        known.push_back(
            backend::ContainerEngine::ContainerName(session.first));
      }
    }
  }
  size_t removed = 0;
  for (const std::string& name : selected.engine->ListManaged()) {
    if (std::find(known.begin(), known.end(), name) != known.end()) continue;
    KJ_LOG(INFO, "Removing orphaned container " + name);
    try {
      selected.engine->StopAndRemove(name);
      removed++;
    } catch (const core::codebox_error& e) {
      KJ_LOG(ERROR, "Could not remove orphaned container " + name, e.what());
    }
  }
  return removed;
}

}  // namespace session
