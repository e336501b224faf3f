#include "server/server.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>
#include <memory>
#include <thread>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"

namespace server {

namespace {

kj::Exception ToKj(const char* kind, const std::string& what) {
  return kj::Exception(kj::Exception::Type::FAILED, __FILE__, __LINE__,
                       kj::str(kind, ": ", what));
}

// Rethrows the current exception as a kj exception.
[[noreturn]] void RethrowAsKj(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const core::codebox_error& e) {
    if (!e.IsCallerError()) KJ_LOG(WARNING, e.Kind(), e.what());
    kj::throwFatalException(ToKj(e.Kind(), e.what()));
  } catch (const kj::Exception& e) {
    kj::throwFatalException(kj::cp(e));
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Unexpected error", e.what());
    kj::throwFatalException(ToKj("internal_error", e.what()));
  }
}

std::string Timestamp(std::chrono::system_clock::time_point t) {
  if (t == std::chrono::system_clock::time_point()) return "";
  return util::isoTime(t);
}

std::vector<std::string> ToStrings(capnp::List<capnp::Text>::Reader list) {
  std::vector<std::string> strings;
  for (auto s : list) strings.push_back(std::string(s));
  return strings;
}

void SetStrings(const std::vector<std::string>& strings,
                capnp::List<capnp::Text>::Builder list) {
  for (size_t i = 0; i < strings.size(); i++) list.set(i, strings[i]);
}

session::EnvironmentOptions ToEnvironment(
    capnproto::SessionOptions::Reader options) {
  session::EnvironmentOptions environment;
  environment.limits.memory = std::string(options.getMemory());
  environment.limits.cpus = std::string(options.getCpus());
  environment.limits.pids = options.getMaxProcesses();
  environment.limits.network_disabled = options.getNetworkDisabled();
  for (auto var : options.getEnvironment()) {
    environment.env[std::string(var.getName())] =
        std::string(var.getValue());
  }
  for (auto mount : options.getMounts()) {
    backend::Mount m;
    m.host_path = std::string(mount.getHostPath());
    m.container_path = std::string(mount.getContainerPath());
    m.read_only = mount.getReadOnly();
    environment.mounts.push_back(std::move(m));
  }
  return environment;
}

}  // namespace

kj::Promise<void> Translate(const std::function<kj::Promise<void>()>& body) {
  try {
    return body();
  } catch (const std::exception&) {
    RethrowAsKj(std::current_exception());
  }
}

capnproto::ExecutionStatus ToCapnp(tracker::RequestStatus status) {
  switch (status) {
    case tracker::RequestStatus::QUEUED:
      return capnproto::ExecutionStatus::QUEUED;
    case tracker::RequestStatus::RUNNING:
      return capnproto::ExecutionStatus::RUNNING;
    case tracker::RequestStatus::COMPLETED:
      return capnproto::ExecutionStatus::COMPLETED;
    case tracker::RequestStatus::FAILED:
      return capnproto::ExecutionStatus::FAILED;
    case tracker::RequestStatus::TIMED_OUT:
      return capnproto::ExecutionStatus::TIMED_OUT;
  }
  KJ_FAIL_ASSERT("Unknown request status");
}

Server::~Server() {
  std::map<uint64_t, std::thread> threads;
  {
    std::lock_guard<std::mutex> lck(threads_mutex_);
    threads.swap(threads_);
    finished_threads_.clear();
  }
  for (auto& thread : threads) thread.second.join();
}

void Server::ReapThreads() {
  for (uint64_t id : finished_threads_) {
    auto thread = threads_.find(id);
    if (thread == threads_.end()) continue;
    thread->second.join();
    threads_.erase(thread);
  }
  finished_threads_.clear();
}

kj::Promise<void> Server::RunBlocking(std::function<void()> work) {
  KJ_REQUIRE(io_provider_ != nullptr, "No I/O provider");
  int done_pipe[2];
  int ret = pipe(done_pipe);
  KJ_ASSERT(ret != -1, "pipe", strerror(errno));

  auto error = std::make_shared<std::exception_ptr>();
  {
    std::lock_guard<std::mutex> lck(threads_mutex_);
    ReapThreads();
    uint64_t id = next_thread_++;
    // The write end is closed when the work is done; the event loop sees
    // EOF.
    threads_.emplace(id, std::thread([this, id, work, error,
                                      fd = done_pipe[1]]() {
      util::ThreadLogger logger;
      try {
        work();
      } catch (const std::exception&) {
        *error = std::current_exception();
      }
      {
        std::lock_guard<std::mutex> lck(threads_mutex_);
        finished_threads_.push_back(id);
      }
      close(fd);
    }));
  }

  kj::Own<kj::AsyncInputStream> done = io_provider_->wrapInputFd(
      done_pipe[0], kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP);
  auto buf = kj::heapArray<kj::byte>(1);
  auto read = done->tryRead(buf.begin(), 1, 1);
  return read.attach(kj::mv(done), kj::mv(buf)).then([error](size_t) {
    if (*error) RethrowAsKj(*error);
  });
}

kj::Promise<void> Server::createSession(CreateSessionContext context) {
  auto params = context.getParams();
  auto dependencies = std::make_shared<std::vector<std::string>>(
      ToStrings(params.getDependencies()));
  auto environment = std::make_shared<session::EnvironmentOptions>(
      ToEnvironment(params.getOptions()));
  auto session_id = std::make_shared<std::string>();
  KJ_LOG(INFO, "Creating session", dependencies->size());
  return RunBlocking([this, dependencies, environment, session_id]() {
           *session_id = service_.CreateSession(*dependencies, *environment);
         })
      .then([context, session_id]() mutable {
        context.getResults().setSessionId(*session_id);
      });
}

kj::Promise<void> Server::deleteSession(DeleteSessionContext context) {
  std::string session_id = context.getParams().getSessionId();
  return RunBlocking(
      [this, session_id]() { service_.DeleteSession(session_id); });
}

kj::Promise<void> Server::installDependencies(
    InstallDependenciesContext context) {
  std::string session_id = context.getParams().getSessionId();
  auto requested = std::make_shared<std::vector<std::string>>(
      ToStrings(context.getParams().getDependencies()));
  auto installed = std::make_shared<std::vector<std::string>>();
  return RunBlocking([this, session_id, requested, installed]() {
           for (const security::Dependency& dep :
                service_.InstallDependencies(session_id, *requested)) {
             installed->push_back(dep.Requirement());
           }
         })
      .then([context, installed]() mutable {
        SetStrings(*installed,
                   context.getResults().initInstalled(installed->size()));
      });
}

kj::Promise<void> Server::submitExecution(SubmitExecutionContext context) {
  auto params = context.getParams();
  std::string session_id = params.getSessionId();
  std::string code = params.getCode();
  std::chrono::seconds timeout(params.getTimeoutSeconds());
  if (!session_id.empty()) {
    return Translate([this, &context, session_id, code, timeout]() {
      std::string request_id =
          service_.SubmitExecution(session_id, code, timeout);
      context.getResults().setRequestId(request_id);
      context.getResults().setSessionId(session_id);
      return kj::READY_NOW;
    });
  }
  // Provisioning blocks.
  auto dependencies = std::make_shared<std::vector<std::string>>(
      ToStrings(params.getDependencies()));
  auto created = std::make_shared<std::string>();
  auto request_id = std::make_shared<std::string>();
  return RunBlocking([this, dependencies, code, timeout, created,
                      request_id]() {
           *request_id = service_.SubmitToNewSession(*dependencies, code,
                                                     timeout, created.get());
         })
      .then([context, created, request_id]() mutable {
        context.getResults().setRequestId(*request_id);
        context.getResults().setSessionId(*created);
      });
}

kj::Promise<void> Server::getExecutionStatus(
    GetExecutionStatusContext context) {
  return Translate([this, &context]() {
    tracker::RequestInfo info =
        service_.GetExecutionStatus(
            std::string(context.getParams().getRequestId()));
    auto results = context.getResults();
    results.setStatus(ToCapnp(info.status));
    results.setSessionId(info.session_id);
    results.setCreatedAt(Timestamp(info.created));
    results.setStartedAt(Timestamp(info.started));
    results.setCompletedAt(Timestamp(info.completed));
    return kj::READY_NOW;
  });
}

kj::Promise<void> Server::getExecutionResult(
    GetExecutionResultContext context) {
  return Translate([this, &context]() {
    std::string request_id = context.getParams().getRequestId();
    tracker::RequestResult result = service_.GetExecutionResult(request_id);
    tracker::RequestInfo info = service_.GetExecutionStatus(request_id);
    auto results = context.getResults();
    results.setStatus(ToCapnp(info.status));
    auto out = results.initResult();
    out.setStdout(result.stdout_text);
    out.setStderr(result.stderr_text);
    if (result.has_display_value) {
      out.getDisplayValue().setText(result.display_value);
    } else {
      out.getDisplayValue().setNone();
    }
    SetStrings(result.files, out.initFiles(result.files.size()));
    if (result.error_kind.empty()) {
      out.getError().setNone();
    } else {
      auto details = out.getError().initDetails();
      details.setKind(result.error_kind);
      details.setMessage(result.error_message);
      SetStrings(result.traceback,
                 details.initTraceback(result.traceback.size()));
    }
    return kj::READY_NOW;
  });
}

kj::Promise<void> Server::listFiles(ListFilesContext context) {
  return Translate([this, &context]() {
    std::vector<std::string> names =
        service_.ListFiles(std::string(context.getParams().getRequestId()));
    SetStrings(names, context.getResults().initNames(names.size()));
    return kj::READY_NOW;
  });
}

kj::Promise<void> Server::fetchFile(FetchFileContext context) {
  return Translate([this, &context]() {
    auto params = context.getParams();
    std::string data =
        service_.FetchFile(std::string(params.getRequestId()),
                           std::string(params.getName()));
    context.getResults().setData(
        kj::arrayPtr(reinterpret_cast<const kj::byte*>(data.data()),
                     data.size()));
    return kj::READY_NOW;
  });
}

}  // namespace server
