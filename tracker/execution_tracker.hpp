#ifndef TRACKER_EXECUTION_TRACKER_HPP
#define TRACKER_EXECUTION_TRACKER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <kj/common.h>

#include "security/validator.hpp"
#include "session/session_manager.hpp"
#include "tracker/artifact_store.hpp"
#include "util/blocking_queue.hpp"

namespace tracker {

enum class RequestStatus { QUEUED, RUNNING, COMPLETED, FAILED, TIMED_OUT };

const char* RequestStatusName(RequestStatus status);
bool IsTerminal(RequestStatus status);

struct RequestInfo {
  std::string id;
  std::string session_id;
  RequestStatus status = RequestStatus::QUEUED;
  std::chrono::system_clock::time_point created;
  std::chrono::system_clock::time_point started;
  std::chrono::system_clock::time_point completed;
};

struct RequestResult {
  std::string stdout_text;
  std::string stderr_text;
  bool has_display_value = false;
  std::string display_value;
  // Stored in the ArtifactStore under the request id.
  std::vector<std::string> files;
  // Empty on success. The exception name for errors raised by the code,
  // otherwise the kind of the codebox error.
  std::string error_kind;
  std::string error_message;
  std::vector<std::string> traceback;
};

struct TrackerOptions {
  // Zero means one per hardware thread.
  size_t num_workers = 0;
  std::chrono::milliseconds default_timeout = std::chrono::seconds(300);
  std::chrono::milliseconds max_timeout = std::chrono::seconds(600);
  // How long a request may wait for its session before failing.
  std::chrono::milliseconds queue_timeout = std::chrono::seconds(600);
  // How long finished requests, and their files, are kept.
  std::chrono::milliseconds retention = std::chrono::hours(24);
  std::chrono::milliseconds busy_retry_interval =
      std::chrono::milliseconds(100);
};

// Runs code submissions on a pool of workers and keeps their outcome for
// polling. Requests for the same session run one at a time, in the order
// they were submitted; requests for different sessions run in parallel.
class ExecutionTracker {
 public:
  ExecutionTracker(session::SessionManager* sessions,
                   const security::Validator* validator, ArtifactStore* store,
                   TrackerOptions options);
  ~ExecutionTracker();

  void Start();
  // Waits for the running requests. Queued ones fail.
  void Stop();

  // Registers a request and schedules it, returning its id. A zero timeout
  // means the default one. The code is validated before returning: a
  // rejected request is registered as failed and core::validation_error is
  // thrown. Unknown sessions throw core::session_not_found.
  std::string Submit(const std::string& session_id, const std::string& code,
                     std::chrono::milliseconds timeout =
                         std::chrono::milliseconds::zero());

  // Throws core::request_not_found.
  RequestInfo Status(const std::string& request_id);

  // Throws core::request_not_found and core::result_not_ready.
  RequestResult Result(const std::string& request_id);

  // Blocks until the request is finished or timeout expires, returning its
  // status. Throws core::request_not_found.
  RequestStatus Wait(const std::string& request_id,
                     std::chrono::milliseconds timeout);

  // Files of a finished request. Throws like Result.
  std::vector<std::string> ListFiles(const std::string& request_id);
  // Throws like Result, and like ArtifactStore::Fetch.
  std::string FetchFile(const std::string& request_id,
                        const std::string& name);

  // Forgets the finished requests older than the retention, with their
  // files. Returns how many were forgotten.
  size_t Sweep(std::chrono::steady_clock::time_point now);

  KJ_DISALLOW_COPY(ExecutionTracker);

 private:
  struct Request {
    RequestInfo info;
    std::string code;
    std::chrono::milliseconds timeout;
    std::chrono::steady_clock::time_point registered;
    std::chrono::steady_clock::time_point finished;
    RequestResult result;
    // Passed validation.
    bool accepted = false;
    // Handed to the workers.
    bool dispatched = false;
  };

  void ThreadBody();
  void Process(const std::shared_ptr<Request>& request);
  // Retries while another operation holds the session. The request stays
  // QUEUED until its code is sent.
  session::ExecutionResult Execute(const std::shared_ptr<Request>& request,
                                   const std::string& artifact_dir);
  void Started(Request* request);
  void Finish(Request* request, RequestStatus status, RequestResult result);
  // Retires a finished request from the lane of its session and schedules
  // the next one.
  void Advance(const std::shared_ptr<Request>& request);
  // Front of the lane of a session, if it is accepted and not yet handed to
  // the workers. Requires mutex_.
  std::shared_ptr<Request> NextInLane(const std::string& session_id);
  // Throws core::request_not_found.
  std::shared_ptr<Request> Find(const std::string& request_id);
  // Finished request. Throws core::result_not_ready.
  std::shared_ptr<Request> FindFinished(const std::string& request_id);

  session::SessionManager* sessions_;
  const security::Validator* validator_;
  ArtifactStore* store_;
  TrackerOptions options_;

  std::mutex mutex_;
  std::condition_variable finished_cv_;
  std::map<std::string, std::shared_ptr<Request>> requests_;
  // Unfinished requests per session, in registration order. Only the front
  // one may be handed to the workers.
  std::map<std::string, std::deque<std::shared_ptr<Request>>> lanes_;

  util::BlockingQueue<std::shared_ptr<Request>> queue_;
  std::vector<std::thread> threads_;
  std::atomic<bool> stopping_{false};
};

}  // namespace tracker

#endif
