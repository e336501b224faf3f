#include "server/main.hpp"
#include "service/main.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

class CodeboxMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit CodeboxMain(kj::ProcessContext& context)
      : context(context), sm(context), cm(context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Codebox (" + util::version + ")",
                           "Sandboxed Python execution sessions")
        .addSubCommand("serve", KJ_BIND_METHOD(sm, getMain),
                       "serve sessions over RPC")
        .addSubCommand("probe", KJ_BIND_METHOD(cm, getProbe),
                       "report the usable isolation backends")
        .addSubCommand("run", KJ_BIND_METHOD(cm, getRun),
                       "run a file in a new session")
        .addSubCommand("reconcile", KJ_BIND_METHOD(cm, getReconcile),
                       "remove the leftover session containers")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  service::Main cm;
};

KJ_MAIN(CodeboxMain);
