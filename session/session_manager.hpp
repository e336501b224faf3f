#ifndef SESSION_SESSION_MANAGER_HPP
#define SESSION_SESSION_MANAGER_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <kj/common.h>

#include "backend/backend_factory.hpp"
#include "backend/container_engine.hpp"
#include "backend/resource_limits.hpp"
#include "kernel/kernel_client.hpp"
#include "security/validator.hpp"

namespace session {

enum class SessionState { PROVISIONING, READY, BUSY, ERROR, TERMINATED };

const char* SessionStateName(SessionState state);

// What a caller may ask of the environment of a new session.
struct EnvironmentOptions {
  backend::ResourceLimits limits;
  std::map<std::string, std::string> env;
  std::vector<backend::Mount> mounts;
};

struct SessionOptions {
  std::string image = "python:3.11-slim";
  // Local path of the kernel agent pushed into every workspace.
  std::string kernel_script;
  // Interpreter inside the image.
  std::string python = "python";
  backend::ResourceLimits default_limits = backend::DefaultLimits();
  std::chrono::milliseconds command_timeout = std::chrono::seconds(120);
  std::chrono::milliseconds install_timeout = std::chrono::minutes(10);
  std::chrono::milliseconds handshake_timeout = std::chrono::seconds(30);
  std::chrono::milliseconds ping_timeout = std::chrono::seconds(5);
  // Ready or failed sessions unused for longer are terminated by Sweep.
  std::chrono::milliseconds idle_timeout = std::chrono::hours(1);
  // How long terminated sessions are remembered, so that deleting them again
  // succeeds.
  std::chrono::milliseconds tombstone_ttl = std::chrono::hours(1);
};

// The isolated environment of one session.
struct EnvironmentHandle {
  // Name of the VM the container runs in, or "native".
  std::string vm;
  std::string container;
  // Workspace path on the surface the engine runs on.
  std::string workspace;
  backend::ResourceLimits limits;
};

struct SessionInfo {
  std::string id;
  SessionState state = SessionState::PROVISIONING;
  std::chrono::system_clock::time_point created;
  std::chrono::steady_clock::time_point last_activity;
  std::vector<security::Dependency> dependencies;
  EnvironmentHandle handle;
  // Why the session is in the ERROR state.
  std::string error;
};

struct ExecutionResult {
  kernel::ExecutionOutput output;
  // Files written to the artifact directory: what the code left in the
  // workspace's outputs/ directory, then rich displays (display-<n>.png).
  std::vector<std::string> files;
};

// Owns every session: its isolated environment and the interpreter running
// in it. All the operations are thread-safe. A session runs at most one
// execution at a time; callers wanting to queue must do it themselves.
class SessionManager {
 public:
  // Directory of produced files inside the workspace.
  static const constexpr char* kOutputsDirectory = "outputs";

  SessionManager(backend::BackendFactory* backends,
                 const security::Validator* validator, SessionOptions options);
  ~SessionManager();

  // Validates the dependencies, provisions an environment and starts its
  // interpreter. Nothing is allocated when validation or backend selection
  // fail. On any later failure everything allocated so far is released.
  // Throws core::validation_error, core::backend_unavailable,
  // core::vm_setup_error, core::container_start_failure,
  // core::transfer_error, core::dependency_install_error.
  std::string CreateSession(const std::vector<std::string>& dependencies,
                            const EnvironmentOptions& options);

  // Runs code in the interpreter of a ready session and copies the produced
  // files to artifact_dir. A failure other than an exception raised by the
  // code (a timeout, the interpreter dying, a failed transfer) moves the
  // session to ERROR and releases its environment.
  // Throws core::session_not_found, core::session_busy,
  // core::execution_timeout, core::container_start_failure,
  // core::transfer_error. on_start runs once the session is held, before the
  // code is sent.
  ExecutionResult Submit(const std::string& id, const std::string& code,
                         std::chrono::milliseconds timeout,
                         const std::string& artifact_dir,
                         const std::function<void()>& on_start = nullptr);

  // Installs more packages into a ready session. Returns the approved set.
  // The session stays usable when installation fails.
  std::vector<security::Dependency> InstallDependencies(
      const std::string& id, const std::vector<std::string>& dependencies);

  // Stops the container, releases the workspace and marks the session
  // terminated. Terminating a terminated session does nothing. A busy
  // session is interrupted; its execution fails.
  // Throws core::session_not_found for ids that never existed.
  void Terminate(const std::string& id);

  // Terminates every session, for shutdown.
  void TerminateAll();

  // Throws core::session_not_found.
  SessionInfo Info(const std::string& id);
  std::vector<SessionInfo> List();

  // Terminates sessions idle for longer than the idle timeout, forgets old
  // terminated sessions and moves ready sessions whose interpreter does not
  // answer heartbeats to ERROR. Returns the number of terminated sessions.
  size_t Sweep(std::chrono::steady_clock::time_point now);

  // Removes the containers of sessions this process does not know, left
  // behind by a previous run. Returns how many were removed.
  size_t Reconcile();

  KJ_DISALLOW_COPY(SessionManager);

 private:
  struct Session;

  // Live or terminated session. Throws core::session_not_found.
  std::shared_ptr<Session> Find(const std::string& id);
  // Moves a READY session to BUSY. Throws core::session_not_found and
  // core::session_busy.
  std::shared_ptr<Session> Acquire(const std::string& id);
  // Ends a BUSY period: back to READY, or releases the environment when the
  // session was terminated meanwhile.
  void Finish(Session* session);
  // Moves a session to ERROR after a failure and releases its environment.
  void Poison(Session* session, const std::string& reason);

  void Provision(Session* session, backend::Backend* backend,
                 const std::vector<security::Dependency>& dependencies,
                 const EnvironmentOptions& options);
  void Install(Session* session,
               const std::vector<security::Dependency>& dependencies);
  std::vector<std::string> CollectArtifacts(
      Session* session, const kernel::ExecutionOutput& output,
      const std::string& artifact_dir);

  // Releases everything a session holds. Failures are logged.
  void Release(Session* session);
  void StopContainer(Session* session);
  void SetState(Session* session, SessionState state);

  backend::BackendFactory* backends_;
  const security::Validator* validator_;
  SessionOptions options_;

  std::mutex mutex_;
  std::map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace session

#endif
