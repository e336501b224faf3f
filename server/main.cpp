#include "server/main.hpp"

#include <capnp/ez-rpc.h>
#include <kj/debug.h>

#include "backend/host.hpp"
#include "core/errors.hpp"
#include "server/server.hpp"
#include "service/codebox_service.hpp"
#include "service/main.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  service::ServiceOptions options;
  try {
    options = service::ServiceOptions::FromFlags();
  } catch (const std::exception& e) {
    return kj::str(e.what());
  }
  backend::NativeHost host;
  service::CodeboxService service(&host, options);
  try {
    service.Start();
  } catch (const core::codebox_error& e) {
    return kj::str(e.Kind(), ": ", e.what());
  }

  auto impl = kj::heap<server::Server>(&service);
  server::Server* server_impl = impl.get();
  capnp::EzRpcServer server(kj::mv(impl), Flags::listen_address,
                            Flags::port);
  server_impl->SetIoProvider(&server.getLowLevelIoProvider());
  KJ_LOG(INFO, "Listening on " + Flags::listen_address, Flags::port);
  kj::NEVER_DONE.wait(server.getWaitScope());
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context, "Codebox Server (" + util::version + ")",
                          "Runs Python code in isolated sessions");
  service::AddBackendOptions(builder);
  return service::AddSessionOptions(builder)
      .addOptionWithArg({'l', "address"},
                        util::setString(&Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(&Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({"timeout"}, util::setInt(&Flags::execution_timeout),
                        "<SECONDS>", "Default execution timeout")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
