#include "tracker/execution_tracker.hpp"

#include <algorithm>

#include <kj/debug.h>
#include <kj/exception.h>

#include "core/errors.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"

namespace tracker {

namespace {

using std::chrono::steady_clock;
using std::chrono::system_clock;

int64_t Seconds(std::chrono::milliseconds d) {
  return std::chrono::duration_cast<std::chrono::seconds>(d).count();
}

}  // namespace

const char* RequestStatusName(RequestStatus status) {
  switch (status) {
    case RequestStatus::QUEUED:
      return "queued";
    case RequestStatus::RUNNING:
      return "running";
    case RequestStatus::COMPLETED:
      return "completed";
    case RequestStatus::FAILED:
      return "failed";
    case RequestStatus::TIMED_OUT:
      return "timed_out";
  }
  return "unknown";
}

bool IsTerminal(RequestStatus status) {
  return status == RequestStatus::COMPLETED ||
         status == RequestStatus::FAILED ||
         status == RequestStatus::TIMED_OUT;
}

ExecutionTracker::ExecutionTracker(session::SessionManager* sessions,
                                   const security::Validator* validator,
                                   ArtifactStore* store,
                                   TrackerOptions options)
    : sessions_(sessions),
      validator_(validator),
      store_(store),
      options_(std::move(options)) {
  if (options_.num_workers == 0) {
    options_.num_workers = std::max(1u, std::thread::hardware_concurrency());
  }
}

ExecutionTracker::~ExecutionTracker() { Stop(); }

void ExecutionTracker::Start() {
  KJ_REQUIRE(threads_.empty(), "Tracker already started");
  KJ_LOG(INFO, "Starting workers", options_.num_workers);
  for (size_t i = 0; i < options_.num_workers; i++) {
    threads_.emplace_back(&ExecutionTracker::ThreadBody, this);
  }
}

void ExecutionTracker::Stop() {
  stopping_ = true;
  queue_.Stop();
  for (std::thread& thread : threads_) thread.join();
  threads_.clear();
}

void ExecutionTracker::ThreadBody() {
  util::ThreadLogger logger;
  std::shared_ptr<Request> request;
  while (queue_.Dequeue(&request)) {
    Process(request);
    request.reset();
  }
}

/*
 * Submission
 */

std::string ExecutionTracker::Submit(const std::string& session_id,
                                     const std::string& code,
                                     std::chrono::milliseconds timeout) {
  if (stopping_) {
    throw core::backend_unavailable("The service is shutting down");
  }
  auto request = std::make_shared<Request>();
  request->info.id = util::randomId();
  request->info.session_id = session_id;
  request->info.created = system_clock::now();
  request->code = code;
  request->timeout =
      timeout == std::chrono::milliseconds::zero() ? options_.default_timeout
                                                   : timeout;
  request->registered = steady_clock::now();
  const std::string id = request->info.id;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    requests_.emplace(id, request);
    lanes_[session_id].push_back(request);
  }
  KJ_LOG(INFO, "Request " + id + " registered for session " + session_id);

  try {
    if (request->timeout < std::chrono::seconds(1) ||
        request->timeout > options_.max_timeout) {
      throw core::validation_error(
          "Timeout must be between 1 and " +
          std::to_string(Seconds(options_.max_timeout)) + " seconds");
    }
    validator_->ValidateCode(code);
    if (sessions_->Info(session_id).state ==
        session::SessionState::TERMINATED) {
      throw core::session_not_found("Session " + session_id +
                                    " was terminated");
    }
  } catch (const core::codebox_error& e) {
    RequestResult result;
    result.error_kind = e.Kind();
    result.error_message = e.what();
    Finish(request.get(), RequestStatus::FAILED, std::move(result));
    Advance(request);
    throw;
  }

  std::shared_ptr<Request> next;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    request->accepted = true;
    next = NextInLane(session_id);
  }
  if (next) queue_.Enqueue(std::move(next));
  return id;
}

std::shared_ptr<ExecutionTracker::Request> ExecutionTracker::NextInLane(
    const std::string& session_id) {
  auto lane = lanes_.find(session_id);
  if (lane == lanes_.end()) return nullptr;
  if (lane->second.empty()) {
    lanes_.erase(lane);
    return nullptr;
  }
  std::shared_ptr<Request> front = lane->second.front();
  if (!front->accepted || front->dispatched) return nullptr;
  front->dispatched = true;
  return front;
}

void ExecutionTracker::Advance(const std::shared_ptr<Request>& request) {
  const std::string& session_id = request->info.session_id;
  std::shared_ptr<Request> next;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    auto lane = lanes_.find(session_id);
    if (lane != lanes_.end()) {
      auto& pending = lane->second;
      pending.erase(std::remove(pending.begin(), pending.end(), request),
                    pending.end());
    }
    next = NextInLane(session_id);
  }
  if (next) queue_.Enqueue(std::move(next));
}

/*
 * Execution
 */

void ExecutionTracker::Finish(Request* request, RequestStatus status,
                              RequestResult result) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    request->info.status = status;
    request->info.completed = system_clock::now();
    request->finished = steady_clock::now();
    request->result = std::move(result);
  }
  KJ_LOG(INFO, "Request " + request->info.id, RequestStatusName(status),
         request->result.error_kind);
  finished_cv_.notify_all();
}

void ExecutionTracker::Started(Request* request) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    request->info.status = RequestStatus::RUNNING;
    request->info.started = system_clock::now();
  }
  KJ_LOG(INFO, "Request " + request->info.id + " running on session " +
                   request->info.session_id);
}

session::ExecutionResult ExecutionTracker::Execute(
    const std::shared_ptr<Request>& request, const std::string& artifact_dir) {
  const std::string& session_id = request->info.session_id;
  auto deadline = request->registered + options_.queue_timeout;
  while (true) {
    try {
      return sessions_->Submit(
          session_id, request->code, request->timeout, artifact_dir,
          [this, &request] { Started(request.get()); });
    } catch (const core::session_busy&) {
      // Someone else, e.g. a dependency installation, holds the session.
      session::SessionState state = sessions_->Info(session_id).state;
      bool transient = state == session::SessionState::BUSY ||
                       state == session::SessionState::PROVISIONING;
      if (!transient ||
          steady_clock::now() + options_.busy_retry_interval >= deadline) {
        throw;
      }
    }
    std::this_thread::sleep_for(options_.busy_retry_interval);
  }
}

void ExecutionTracker::Process(const std::shared_ptr<Request>& request) {
  const std::string& id = request->info.id;
  const std::string& session_id = request->info.session_id;
  RequestResult result;
  if (stopping_) {
    result.error_kind = "cancelled";
    result.error_message = "The service is shutting down";
    Finish(request.get(), RequestStatus::FAILED, std::move(result));
    Advance(request);
    return;
  }
  if (steady_clock::now() - request->registered > options_.queue_timeout) {
    result.error_kind = "session_busy";
    result.error_message =
        "Session " + session_id + " was busy for more than " +
        std::to_string(Seconds(options_.queue_timeout)) + " seconds";
    Finish(request.get(), RequestStatus::FAILED, std::move(result));
    Advance(request);
    return;
  }

  RequestStatus status = RequestStatus::COMPLETED;
  try {
    session::ExecutionResult run = Execute(request, store_->Prepare(id));
    result.stdout_text = std::move(run.output.stdout_text);
    result.stderr_text = std::move(run.output.stderr_text);
    result.has_display_value = run.output.has_display_value;
    result.display_value = std::move(run.output.display_value);
    result.files = std::move(run.files);
    if (run.output.failed) {
      status = RequestStatus::FAILED;
      result.error_kind = run.output.error_name;
      result.error_message = run.output.error_value;
      result.traceback = std::move(run.output.traceback);
    }
  } catch (const core::execution_timeout& e) {
    status = RequestStatus::TIMED_OUT;
    result.error_kind = e.Kind();
    result.error_message = e.what();
  } catch (const core::codebox_error& e) {
    status = RequestStatus::FAILED;
    result.error_kind = e.Kind();
    result.error_message = e.what();
  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "Request " + id + " failed", e);
    status = RequestStatus::FAILED;
    result.error_kind = "internal_error";
    result.error_message = e.getDescription().cStr();
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Request " + id + " failed", e.what());
    status = RequestStatus::FAILED;
    result.error_kind = "internal_error";
    result.error_message = e.what();
  }
  Finish(request.get(), status, std::move(result));
  Advance(request);
}

/*
 * Queries
 */

std::shared_ptr<ExecutionTracker::Request> ExecutionTracker::Find(
    const std::string& request_id) {
  auto it = requests_.find(request_id);
  if (it == requests_.end()) {
    throw core::request_not_found("Unknown request " + request_id);
  }
  return it->second;
}

std::shared_ptr<ExecutionTracker::Request> ExecutionTracker::FindFinished(
    const std::string& request_id) {
  std::shared_ptr<Request> request = Find(request_id);
  if (!IsTerminal(request->info.status)) {
    throw core::result_not_ready("Request " + request_id + " is " +
                                 RequestStatusName(request->info.status));
  }
  return request;
}

RequestInfo ExecutionTracker::Status(const std::string& request_id) {
  std::lock_guard<std::mutex> lck(mutex_);
  return Find(request_id)->info;
}

RequestResult ExecutionTracker::Result(const std::string& request_id) {
  std::lock_guard<std::mutex> lck(mutex_);
  return FindFinished(request_id)->result;
}

RequestStatus ExecutionTracker::Wait(const std::string& request_id,
                                     std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lck(mutex_);
  std::shared_ptr<Request> request = Find(request_id);
  finished_cv_.wait_for(lck, timeout, [&request] {
    return IsTerminal(request->info.status);
  });
  return request->info.status;
}

std::vector<std::string> ExecutionTracker::ListFiles(
    const std::string& request_id) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    FindFinished(request_id);
  }
  return store_->List(request_id);
}

std::string ExecutionTracker::FetchFile(const std::string& request_id,
                                        const std::string& name) {
  {
    std::lock_guard<std::mutex> lck(mutex_);
    FindFinished(request_id);
  }
  return store_->Fetch(request_id, name);
}

size_t ExecutionTracker::Sweep(steady_clock::time_point now) {
  std::vector<std::string> expired;
  {
    std::lock_guard<std::mutex> lck(mutex_);
    for (auto it = requests_.begin(); it != requests_.end();) {
      if (IsTerminal(it->second->info.status) &&
          now - it->second->finished > options_.retention) {
        expired.push_back(it->first);
        it = requests_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const std::string& id : expired) store_->Remove(id);
  return expired.size();
}

}  // namespace tracker
