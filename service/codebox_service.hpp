#ifndef SERVICE_CODEBOX_SERVICE_HPP
#define SERVICE_CODEBOX_SERVICE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <kj/common.h>

#include "backend/backend_factory.hpp"
#include "security/validator.hpp"
#include "session/session_manager.hpp"
#include "tracker/artifact_store.hpp"
#include "tracker/execution_tracker.hpp"

namespace service {

struct ServiceOptions {
  backend::BackendOptions backend;
  session::SessionOptions session;
  tracker::TrackerOptions tracker;
  security::Policy policy = security::Policy::Default();
  std::string store_directory = "files";
  std::chrono::milliseconds sweep_interval = std::chrono::seconds(60);
  // Off for one-shot commands, which must not touch the containers of a
  // running server.
  bool reconcile_on_start = true;

  // Built from the command line flags. Throws std::invalid_argument when the
  // policy file is malformed.
  static ServiceOptions FromFlags();
};

// Everything a front end needs: sessions, asynchronous executions and their
// files, on top of the isolation backend.
class CodeboxService {
 public:
  // External commands are run on host, which must outlive the service.
  CodeboxService(backend::Host* host, ServiceOptions options);
  ~CodeboxService();

  // Selects the backend, removes orphaned containers if so configured, then
  // starts the workers and the sweeper. Throws core::backend_unavailable.
  void Start();
  // Stops the workers and the sweeper, and terminates every session.
  void Stop();

  std::string CreateSession(const std::vector<std::string>& dependencies,
                            const session::EnvironmentOptions& options);
  std::vector<security::Dependency> InstallDependencies(
      const std::string& session_id,
      const std::vector<std::string>& dependencies);
  void DeleteSession(const std::string& session_id);

  std::string SubmitExecution(const std::string& session_id,
                              const std::string& code,
                              std::chrono::milliseconds timeout =
                                  std::chrono::milliseconds::zero());
  // Like SubmitExecution, on a new session with the given dependencies and
  // the default environment. The code is validated before provisioning.
  // Returns the request id and sets *session_id.
  std::string SubmitToNewSession(const std::vector<std::string>& dependencies,
                                 const std::string& code,
                                 std::chrono::milliseconds timeout,
                                 std::string* session_id);
  tracker::RequestInfo GetExecutionStatus(const std::string& request_id);
  tracker::RequestResult GetExecutionResult(const std::string& request_id);
  tracker::RequestStatus WaitExecution(const std::string& request_id,
                                       std::chrono::milliseconds timeout);
  std::vector<std::string> ListFiles(const std::string& request_id);
  std::string FetchFile(const std::string& request_id,
                        const std::string& name);

  std::vector<backend::ProbeOutcome> Probe();
  size_t Reconcile();
  // One pass of the sweeper.
  void Sweep();

  KJ_DISALLOW_COPY(CodeboxService);

 private:
  void SweeperBody();

  ServiceOptions options_;
  security::Validator validator_;
  backend::BackendFactory backends_;
  session::SessionManager sessions_;
  tracker::ArtifactStore store_;
  tracker::ExecutionTracker tracker_;

  std::mutex sweeper_mutex_;
  std::condition_variable sweeper_cv_;
  bool stopping_ = false;
  std::thread sweeper_;
};

}  // namespace service

#endif
