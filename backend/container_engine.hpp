#ifndef BACKEND_CONTAINER_ENGINE_HPP
#define BACKEND_CONTAINER_ENGINE_HPP

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "backend/host.hpp"
#include "backend/resource_limits.hpp"

namespace backend {

// Path at which the session workspace is mounted in every container.
static const constexpr char* kContainerWorkspace = "/workspace";
// Prefix of the names of the containers owned by this service.
static const constexpr char* kContainerPrefix = "session-";

struct Mount {
  std::string host_path;
  std::string container_path;
  bool read_only = false;
};

struct ContainerSpec {
  std::string name;
  std::string image;
  // Workspace directory on the surface the engine runs on.
  std::string workspace;
  ResourceLimits limits;
  std::map<std::string, std::string> env;
  std::vector<Mount> mounts;
};

struct EngineOptions {
  std::string binary = "docker";
  // Bound of every lifecycle command but pulls.
  std::chrono::milliseconds command_timeout = std::chrono::seconds(120);
  std::chrono::milliseconds pull_timeout = std::chrono::minutes(10);
};

// Drives a docker-compatible command line tool on a Host.
class ContainerEngine {
 public:
  ContainerEngine(Host* host, EngineOptions options)
      : host_(host), options_(std::move(options)) {}

  // The deterministic name of the container of a session.
  static std::string ContainerName(const std::string& session_id) {
    return kContainerPrefix + session_id;
  }

  // Makes image available, pulling it only if it is not present. Throws
  // core::container_start_failure.
  void Pull(const std::string& image);

  // Starts a detached, auto-removed container that idles until commands are
  // executed in it. Returns the container id, which is the name of spec.
  // Throws core::container_start_failure.
  std::string CreateAndStart(const ContainerSpec& spec);

  // Runs argv in the container. If it does not complete within timeout it is
  // killed and the result has timed_out set.
  util::ProcessResult Exec(const std::string& container,
                           const std::vector<std::string>& argv,
                           std::chrono::milliseconds timeout,
                           const std::string& stdin_data = "");

  // Starts a long-lived process in the container, attached to a line channel.
  std::unique_ptr<util::LineChannel> Attach(
      const std::string& container, const std::vector<std::string>& argv);

  // Stops and removes the container. Removing a container that does not
  // exist succeeds. Throws core::container_start_failure otherwise.
  void StopAndRemove(const std::string& container);

  // Names of all the containers named with kContainerPrefix, running or not.
  std::vector<std::string> ListManaged();

  const std::string& Binary() const { return options_.binary; }

 private:
  util::ProcessResult Command(const std::vector<std::string>& args,
                              std::chrono::milliseconds timeout,
                              const std::string& stdin_data = "");

  Host* host_;
  EngineOptions options_;
};

}  // namespace backend

#endif
