#include "backend/vm_manager.hpp"
#include <atomic>
#include <thread>
#include "core/errors.hpp"
#include "fake/fake_host.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

using std::chrono::milliseconds;

backend::VmOptions FastOptions() {
  backend::VmOptions options;
  options.setup_timeout = std::chrono::seconds(10);
  options.setup_backoff = milliseconds(1);
  options.poll_interval = milliseconds(10);
  return options;
}

util::ProcessResult Output(const std::string& out) {
  util::ProcessResult result;
  result.stdout_data = out;
  return result;
}

// NOLINTNEXTLINE
TEST(LimaDriver, ParseStatus) {
  backend::LimaDriver driver;
  backend::VmOptions options;
  using Status = backend::VmDriver::Status;
  EXPECT_EQ(driver.ParseStatus(Output("Running\n"), options), Status::RUNNING);
  EXPECT_EQ(driver.ParseStatus(Output("Stopped\n"), options), Status::STOPPED);
  EXPECT_EQ(driver.ParseStatus(Output(""), options), Status::MISSING);
  util::ProcessResult failed;
  failed.exit_code = 1;
  EXPECT_EQ(driver.ParseStatus(failed, options), Status::MISSING);
}

// NOLINTNEXTLINE
TEST(LimaDriver, Commands) {
  backend::LimaDriver driver;
  backend::VmOptions options;
  EXPECT_THAT(driver.ShellPrefix(options),
              ElementsAre("limactl", "shell", "codebox"));
  auto create = driver.CreateCommands(options);
  ASSERT_EQ(create.size(), 1u);
  EXPECT_THAT(create[0], Contains("--cpus=2"));
  EXPECT_THAT(create[0], Contains("--memory=4"));
}

// NOLINTNEXTLINE
TEST(WslDriver, ParseStatusUtf16) {
  backend::WslDriver driver;
  backend::VmOptions options;
  std::string listing =
      "  NAME      STATE           VERSION\r\n"
      "* Ubuntu    Stopped         2\r\n"
      "  codebox   Running         2\r\n";
  std::string wide;
  for (char c : listing) {
    wide += c;
    wide += '\0';
  }
  using Status = backend::VmDriver::Status;
  EXPECT_EQ(driver.ParseStatus(Output(wide), options), Status::RUNNING);
  options.name = "Ubuntu";
  EXPECT_EQ(driver.ParseStatus(Output(wide), options), Status::STOPPED);
  options.name = "other";
  EXPECT_EQ(driver.ParseStatus(Output(wide), options), Status::MISSING);
}

// NOLINTNEXTLINE
TEST(VmManager, CreatesAndStartsMissingInstance) {
  fake::FakeHost host;
  host.SetInstalled({"limactl"});
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        FastOptions());
  EXPECT_EQ(vm.Instance().state, backend::VmState::ABSENT);
  auto instance = vm.EnsureReady();
  EXPECT_EQ(instance.state, backend::VmState::READY);
  EXPECT_EQ(instance.kind, backend::VmKind::LIMA);
  EXPECT_EQ(instance.name, "codebox");
  EXPECT_EQ(host.Count("limactl", "create"), 1u);
  EXPECT_EQ(host.Count("limactl", "start"), 1u);
  EXPECT_EQ(host.VmStatus(), "Running");
}

// NOLINTNEXTLINE
TEST(VmManager, ReusesRunningInstance) {
  fake::FakeHost host;
  host.SetInstalled({"limactl"});
  host.SetVmStatus("Running");
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        FastOptions());
  vm.EnsureReady();
  vm.EnsureReady();
  EXPECT_EQ(host.Count("limactl", "create"), 0u);
  EXPECT_EQ(host.Count("limactl", "start"), 0u);
  EXPECT_EQ(host.Count("limactl", "list"), 1u);
}

// NOLINTNEXTLINE
TEST(VmManager, RetriesFailedStarts) {
  fake::FakeHost host;
  host.SetInstalled({"limactl"});
  host.SetVmStatus("Stopped");
  host.SetVmStartFailures(2);
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        FastOptions());
  EXPECT_EQ(vm.EnsureReady().state, backend::VmState::READY);
  EXPECT_EQ(host.Count("limactl", "start"), 3u);
}

// NOLINTNEXTLINE
TEST(VmManager, GivesUpAfterRetries) {
  fake::FakeHost host;
  host.SetInstalled({"limactl"});
  host.SetVmStatus("Stopped");
  host.SetVmStartFailures(10);
  auto options = FastOptions();
  options.setup_retries = 2;
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        options);
  try {
    vm.EnsureReady();
    FAIL() << "EnsureReady should fail";
  } catch (const core::vm_setup_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("after 2 attempts"));
    EXPECT_THAT(e.what(), HasSubstr("failed to start"));
  }
  EXPECT_EQ(vm.Instance().state, backend::VmState::FAILED);
  EXPECT_EQ(host.Count("limactl", "start"), 2u);

  // A failed instance is set up again on the next use.
  host.SetVmStartFailures(0);
  EXPECT_EQ(vm.EnsureReady().state, backend::VmState::READY);
}

// NOLINTNEXTLINE
TEST(VmManager, ToolNotInstalled) {
  fake::FakeHost host;
  host.SetInstalled({});
  auto options = FastOptions();
  options.setup_retries = 1;
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        options);
  EXPECT_THROW(vm.EnsureReady(), core::vm_setup_error);  // NOLINT
}

// NOLINTNEXTLINE
TEST(VmManager, ReadinessTimeout) {
  fake::FakeHost host;
  host.SetInstalled({"limactl"});
  host.SetVmStatus("Running");
  auto options = FastOptions();
  options.setup_retries = 1;
  options.setup_timeout = milliseconds(300);
  options.readiness_probe = {"false"};
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        options);
  try {
    vm.EnsureReady();
    FAIL() << "EnsureReady should fail";
  } catch (const core::vm_setup_error& e) {
    EXPECT_THAT(e.what(), HasSubstr("within"));
  }
}

// NOLINTNEXTLINE
TEST(VmManager, RunForwardsIntoInstance) {
  fake::FakeHost host;
  host.SetInstalled({"limactl"});
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        FastOptions());
  auto result = vm.Run({"echo", "hello"}, "", std::chrono::seconds(10));
  EXPECT_TRUE(result.Success());
  EXPECT_EQ(result.stdout_data, "hello\n");
  EXPECT_THAT(host.Commands(),
              Contains(ElementsAre("limactl", "shell", "codebox", "echo",
                                   "hello")));
  EXPECT_EQ(vm.Instance().state, backend::VmState::READY);
}

// NOLINTNEXTLINE
TEST(VmManager, ConcurrentRunsCreateOneInstance) {
  fake::FakeHost host;
  host.SetInstalled({"limactl"});
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        FastOptions());
  std::vector<std::thread> threads;
  std::atomic<int> successes{0};
  for (int i = 0; i < 4; i++) {
    threads.emplace_back([&vm, &successes]() {
      if (vm.Run({"true"}, "", std::chrono::seconds(10)).Success()) {
        successes++;
      }
    });
  }
  for (auto& thread : threads) thread.join();
  EXPECT_EQ(successes, 4);
  EXPECT_EQ(host.Count("limactl", "create"), 1u);
  EXPECT_EQ(host.Count("limactl", "start"), 1u);
}

// NOLINTNEXTLINE
TEST(VmManager, Teardown) {
  fake::FakeHost host;
  host.SetInstalled({"limactl"});
  backend::VmManager vm(backend::MakeVmDriver(backend::VmKind::LIMA), &host,
                        FastOptions());
  vm.EnsureReady();
  vm.Teardown();
  EXPECT_EQ(vm.Instance().state, backend::VmState::ABSENT);
  EXPECT_EQ(host.VmStatus(), "Stopped");
  vm.EnsureReady();
  EXPECT_EQ(host.VmStatus(), "Running");
}

}  // namespace
