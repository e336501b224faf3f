#include "service/main.hpp"

#include <iostream>

#include "backend/host.hpp"
#include "core/errors.hpp"
#include "service/codebox_service.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace service {

kj::MainBuilder& AddBackendOptions(kj::MainBuilder& builder) {
  return builder
      .addOptionWithArg({'L', "logfile"}, util::setString(&Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(&Flags::verbose),
                 "Print stack traces of errors")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(&Flags::temp_directory), "<DIR>",
                        "Path where the session workspaces should be created")
      .addOption({'k', "keep-workspaces"},
                 util::setBool(&Flags::keep_workspaces),
                 "Keep the session workspaces after termination")
      .addOptionWithArg({"platform"}, util::setString(&Flags::platform),
                        "<auto|none|lima|wsl2>",
                        "Virtual machine tool to use when containers cannot "
                        "run natively")
      .addOptionWithArg({'e', "engine"},
                        util::setString(&Flags::container_engine), "<BINARY>",
                        "Container engine, docker or podman")
      .addOptionWithArg({"vm-name"}, util::setString(&Flags::vm_name),
                        "<NAME>", "Name of the virtual machine")
      .addOptionWithArg({"vm-memory"}, util::setInt(&Flags::vm_memory_gib),
                        "<GIB>", "Memory of the virtual machine")
      .addOptionWithArg({"vm-cpus"}, util::setInt(&Flags::vm_cpus), "<N>",
                        "CPUs of the virtual machine")
      .addOptionWithArg({"vm-setup-timeout"},
                        util::setInt(&Flags::vm_setup_timeout), "<SECONDS>",
                        "How long to wait for the virtual machine to start")
      .addOptionWithArg({"vm-setup-retries"},
                        util::setInt(&Flags::vm_setup_retries), "<N>",
                        "Attempts at starting the virtual machine")
      .addOptionWithArg({"vm-setup-backoff"},
                        util::setInt(&Flags::vm_setup_backoff_millis), "<MS>",
                        "Initial delay between the attempts, doubled each time")
      .addOptionWithArg({"command-timeout"},
                        util::setInt(&Flags::command_timeout), "<SECONDS>",
                        "Timeout of the container engine commands");
}

kj::MainBuilder& AddSessionOptions(kj::MainBuilder& builder) {
  return builder
      .addOptionWithArg({'i', "image"}, util::setString(&Flags::image),
                        "<IMAGE>", "Interpreter image of the sessions")
      .addOptionWithArg({'K', "kernel"}, util::setString(&Flags::kernel_script),
                        "<FILE>", "Kernel agent run inside the sessions")
      .addOptionWithArg({"policy"}, util::setString(&Flags::policy_file),
                        "<FILE>", "JSON file with the security policy")
      .addOptionWithArg({'S', "store-dir"},
                        util::setString(&Flags::store_directory), "<DIR>",
                        "Path where the produced files should be stored")
      .addOptionWithArg({"handshake-timeout"},
                        util::setInt(&Flags::handshake_timeout), "<SECONDS>",
                        "How long to wait for the interpreter to start")
      .addOptionWithArg({"queue-timeout"}, util::setInt(&Flags::queue_timeout),
                        "<SECONDS>",
                        "How long an execution may wait for its session")
      .addOptionWithArg({"idle-timeout"}, util::setInt(&Flags::idle_timeout),
                        "<SECONDS>",
                        "Idle sessions older than this are evicted")
      .addOptionWithArg({"sweep-interval"},
                        util::setInt(&Flags::sweep_interval), "<SECONDS>",
                        "Interval between the idle session sweeps")
      .addOptionWithArg({"retention"},
                        util::setInt(&Flags::artifact_retention_hours),
                        "<HOURS>", "How long produced files are kept")
      .addOptionWithArg({'n', "num-workers"}, util::setInt(&Flags::num_workers),
                        "<N>",
                        "Executions run in parallel, 0 for one per core");
}

kj::MainBuilder::Validity Main::Probe() {
  util::LogManager log_manager(context);
  backend::NativeHost host;
  std::vector<backend::ProbeOutcome> outcomes;
  try {
    backend::BackendFactory factory(&host,
                                    ServiceOptions::FromFlags().backend);
    outcomes = factory.Probe();
  } catch (const std::exception& e) {
    return kj::str(e.what());
  }
  bool usable = false;
  for (const backend::ProbeOutcome& outcome : outcomes) {
    std::cout << outcome.candidate << ": "
              << (outcome.usable ? "usable" : "unusable") << " ("
              << outcome.detail << ")" << std::endl;
    usable = usable || outcome.usable;
  }
  if (!usable) return kj::str("No usable isolation backend");
  return true;
}

kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  std::string code;
  ServiceOptions options;
  try {
    code = util::File::ReadAll(file_);
    options = ServiceOptions::FromFlags();
  } catch (const std::exception& e) {
    return kj::str(e.what());
  }
  options.reconcile_on_start = false;

  backend::NativeHost host;
  CodeboxService service(&host, options);
  std::string request_id;
  tracker::RequestStatus status = tracker::RequestStatus::QUEUED;
  tracker::RequestResult result;
  try {
    service.Start();
    std::string session_id;
    request_id = service.SubmitToNewSession(
        dependencies_, code, std::chrono::seconds(timeout_), &session_id);
    // The tracker enforces the execution timeout.
    while (!tracker::IsTerminal(status)) {
      status = service.WaitExecution(request_id, std::chrono::seconds(1));
    }
    result = service.GetExecutionResult(request_id);
    service.DeleteSession(session_id);
  } catch (const core::codebox_error& e) {
    return kj::str(e.Kind(), ": ", e.what());
  }

  std::cout << result.stdout_text << std::flush;
  std::cerr << result.stderr_text << std::flush;
  if (result.has_display_value) std::cout << result.display_value << std::endl;
  std::string files = util::File::JoinPath(Flags::store_directory, request_id);
  for (const std::string& file : result.files) {
    std::cout << "File: " << util::File::JoinPath(files, file) << std::endl;
  }
  if (status == tracker::RequestStatus::COMPLETED) return true;
  for (const std::string& line : result.traceback) std::cerr << line << "\n";
  return kj::str(tracker::RequestStatusName(status), " ",
                 result.error_kind.c_str(), ": ",
                 result.error_message.c_str());
}

kj::MainBuilder::Validity Main::Reconcile() {
  util::LogManager log_manager(context);
  backend::NativeHost host;
  try {
    CodeboxService service(&host, ServiceOptions::FromFlags());
    size_t removed = service.Reconcile();
    std::cout << "Removed " << removed << " containers" << std::endl;
  } catch (const std::exception& e) {
    return kj::str(e.what());
  }
  return true;
}

kj::MainFunc Main::getProbe() {
  kj::MainBuilder builder(context, "Codebox Probe (" + util::version + ")",
                          "Reports which isolation backends are usable");
  return AddBackendOptions(builder)
      .callAfterParsing(KJ_BIND_METHOD(*this, Probe))
      .build();
}

kj::MainFunc Main::getRun() {
  kj::MainBuilder builder(context, "Codebox Run (" + util::version + ")",
                          "Runs a Python file in a new session and prints "
                          "its output");
  AddBackendOptions(builder);
  return AddSessionOptions(builder)
      .addOptionWithArg({'d', "dependency"},
                        [this](kj::StringPtr dep) {
                          dependencies_.emplace_back(dep.cStr());
                          return true;
                        },
                        "<PACKAGE>", "Package to install in the session")
      .addOptionWithArg({'t', "timeout"}, util::setInt(&timeout_),
                        "<SECONDS>", "Execution timeout")
      .expectArg("<FILE>",
                 [this](kj::StringPtr file) {
                   file_ = file.cStr();
                   return true;
                 })
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

kj::MainFunc Main::getReconcile() {
  kj::MainBuilder builder(context, "Codebox Reconcile (" + util::version + ")",
                          "Removes the session containers left behind");
  return AddBackendOptions(builder)
      .callAfterParsing(KJ_BIND_METHOD(*this, Reconcile))
      .build();
}
}  // namespace service
