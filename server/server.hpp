#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

#include <kj/async-io.h>

#include "capnp/codebox.capnp.h"
#include "service/codebox_service.hpp"

namespace server {

// Implementation of the Codebox interface on top of a CodeboxService.
// Operations that may block for long, like provisioning a session, run on a
// helper thread so that the event loop keeps serving other calls.
class Server : public capnproto::Codebox::Server {
 public:
  explicit Server(service::CodeboxService* service) : service_(*service) {}
  // Waits for the helper threads still running.
  ~Server();

  // Must be called before serving the first call.
  void SetIoProvider(kj::LowLevelAsyncIoProvider* io_provider) {
    io_provider_ = io_provider;
  }

  kj::Promise<void> createSession(CreateSessionContext context) override;
  kj::Promise<void> deleteSession(DeleteSessionContext context) override;
  kj::Promise<void> installDependencies(
      InstallDependenciesContext context) override;
  kj::Promise<void> submitExecution(SubmitExecutionContext context) override;
  kj::Promise<void> getExecutionStatus(
      GetExecutionStatusContext context) override;
  kj::Promise<void> getExecutionResult(
      GetExecutionResultContext context) override;
  kj::Promise<void> listFiles(ListFilesContext context) override;
  kj::Promise<void> fetchFile(FetchFileContext context) override;

 private:
  // Runs work on a new thread. The returned promise resolves on the event
  // loop when the work is done, and rejects if it threw.
  kj::Promise<void> RunBlocking(std::function<void()> work);
  // Joins the helper threads that are done. Requires threads_mutex_.
  void ReapThreads();

  service::CodeboxService& service_;
  kj::LowLevelAsyncIoProvider* io_provider_ = nullptr;

  std::mutex threads_mutex_;
  std::map<uint64_t, std::thread> threads_;
  std::vector<uint64_t> finished_threads_;
  uint64_t next_thread_ = 0;
};

// Runs body, converting the codebox errors it throws into kj exceptions
// whose description starts with the kind of the error.
kj::Promise<void> Translate(const std::function<kj::Promise<void>()>& body);

capnproto::ExecutionStatus ToCapnp(tracker::RequestStatus status);

}  // namespace server

#endif
