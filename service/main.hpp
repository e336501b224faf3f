#ifndef SERVICE_MAIN_HPP
#define SERVICE_MAIN_HPP
#include <cstdint>
#include <string>
#include <vector>

#include <kj/main.h>

namespace service {

// Adds the options shared by every subcommand that drives the backend.
kj::MainBuilder& AddBackendOptions(kj::MainBuilder& builder);
// Adds the options of sessions and executions.
kj::MainBuilder& AddSessionOptions(kj::MainBuilder& builder);

// The one-shot subcommands: probe, run and reconcile.
class Main {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit Main(kj::ProcessContext& context) : context(context) {}
  kj::MainFunc getProbe();
  kj::MainFunc getRun();
  kj::MainFunc getReconcile();

 private:
  kj::MainBuilder::Validity Probe();
  kj::MainBuilder::Validity Run();
  kj::MainBuilder::Validity Reconcile();

  kj::ProcessContext& context;
  std::string file_;
  std::vector<std::string> dependencies_;
  int32_t timeout_ = 0;
};
}  // namespace service
#endif
