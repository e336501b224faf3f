#include "service/codebox_service.hpp"

#include <thread>

#include "core/errors.hpp"
#include "fake/fake_host.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using std::chrono::milliseconds;
using std::chrono::seconds;

const std::string test_tmpdir = "/tmp/codebox_testdir";

class CodeboxServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::WriteAll(script_, "# agent\n");
    options_.backend.workspace_directory =
        util::File::JoinPath(tmp_.Path(), "temp");
    options_.session.kernel_script = script_;
    options_.session.handshake_timeout = seconds(5);
    options_.tracker.num_workers = 2;
    options_.store_directory = util::File::JoinPath(tmp_.Path(), "files");
    options_.sweep_interval = milliseconds(50);
  }

  void StartService() {
    service_.reset(new service::CodeboxService(&host_, options_));
    service_->Start();
  }

  void TearDown() override { service_.reset(); }

  util::TempDir tmp_{test_tmpdir};
  std::string script_ = util::File::JoinPath(tmp_.Path(), "kernel.py");
  fake::FakeHost host_;
  service::ServiceOptions options_;
  std::unique_ptr<service::CodeboxService> service_;
};

// NOLINTNEXTLINE
TEST_F(CodeboxServiceTest, EndToEnd) {
  StartService();
  std::string sid = service_->CreateSession({}, session::EnvironmentOptions());
  std::string rid = service_->SubmitExecution(sid, "x = 1+1");
  ASSERT_EQ(service_->WaitExecution(rid, seconds(10)),
            tracker::RequestStatus::COMPLETED);
  auto result = service_->GetExecutionResult(rid);
  EXPECT_EQ(result.stdout_text, "");
  EXPECT_FALSE(result.has_display_value);

  rid = service_->SubmitExecution(sid, "print(x)\nsave('x.txt', x)");
  ASSERT_EQ(service_->WaitExecution(rid, seconds(10)),
            tracker::RequestStatus::COMPLETED);
  EXPECT_EQ(service_->GetExecutionResult(rid).stdout_text, "2\n");
  EXPECT_THAT(service_->ListFiles(rid), ElementsAre("x.txt"));
  EXPECT_EQ(service_->FetchFile(rid, "x.txt"), "2");

  service_->DeleteSession(sid);
  service_->DeleteSession(sid);
  EXPECT_THAT(host_.Containers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(CodeboxServiceTest, SubmitToNewSession) {
  StartService();
  std::string sid;
  std::string rid =
      service_->SubmitToNewSession({"numpy"}, "x = 6\nx * 7", seconds(5), &sid);
  ASSERT_EQ(service_->WaitExecution(rid, seconds(10)),
            tracker::RequestStatus::COMPLETED);
  EXPECT_EQ(service_->GetExecutionStatus(rid).session_id, sid);
  EXPECT_EQ(service_->GetExecutionResult(rid).display_value, "42");
  EXPECT_EQ(host_.Containers().size(), 1u);

  // The session stays for later submissions.
  rid = service_->SubmitExecution(sid, "print(x)");
  ASSERT_EQ(service_->WaitExecution(rid, seconds(10)),
            tracker::RequestStatus::COMPLETED);
  EXPECT_EQ(service_->GetExecutionResult(rid).stdout_text, "6\n");
}

// NOLINTNEXTLINE
TEST_F(CodeboxServiceTest, SubmitToNewSessionRejectsBeforeProvisioning) {
  StartService();
  std::string sid;
  EXPECT_THROW(service_->SubmitToNewSession(  // NOLINT
                   {}, "import subprocess", seconds(5), &sid),
               core::validation_error);
  EXPECT_EQ(host_.Count("docker", "run"), 0u);
  EXPECT_THROW(service_->SubmitToNewSession(  // NOLINT
                   {}, "print(1)", seconds(6000), &sid),
               core::validation_error);
  EXPECT_THAT(host_.Containers(), IsEmpty());
  EXPECT_EQ(sid, "");
}

// NOLINTNEXTLINE
TEST_F(CodeboxServiceTest, StartRemovesOrphans) {
  host_.AddOrphan("session-0123456789abcdef");
  StartService();
  EXPECT_THAT(host_.Containers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(CodeboxServiceTest, OneShotStartKeepsOtherContainers) {
  host_.AddOrphan("session-0123456789abcdef");
  options_.reconcile_on_start = false;
  StartService();
  EXPECT_THAT(host_.Containers(), ElementsAre("session-0123456789abcdef"));
  EXPECT_EQ(service_->Reconcile(), 1u);
  EXPECT_THAT(host_.Containers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(CodeboxServiceTest, NoBackend) {
  host_.SetInstalled({});
  service_.reset(new service::CodeboxService(&host_, options_));
  try {
    service_->CreateSession({}, session::EnvironmentOptions());
    FAIL() << "CreateSession should fail";
  } catch (const core::backend_unavailable& e) {
    EXPECT_THAT(e.what(), HasSubstr("No usable isolation backend"));
  }
  EXPECT_THROW(service_->Start(), core::backend_unavailable);  // NOLINT
  auto outcomes = service_->Probe();
  ASSERT_FALSE(outcomes.empty());
  EXPECT_FALSE(outcomes[0].usable);
}

// NOLINTNEXTLINE
TEST_F(CodeboxServiceTest, SweeperEvictsIdleSessions) {
  options_.session.idle_timeout = milliseconds(100);
  StartService();
  std::string sid = service_->CreateSession({}, session::EnvironmentOptions());
  auto deadline = std::chrono::steady_clock::now() + seconds(10);
  while (!host_.Containers().empty() &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(milliseconds(10));
  }
  EXPECT_THAT(host_.Containers(), IsEmpty());
  EXPECT_THROW(service_->SubmitExecution(sid, "print(1)"),  // NOLINT
               core::session_not_found);
}

// NOLINTNEXTLINE
TEST_F(CodeboxServiceTest, StopTerminatesSessions) {
  StartService();
  service_->CreateSession({}, session::EnvironmentOptions());
  service_->CreateSession({}, session::EnvironmentOptions());
  EXPECT_EQ(host_.Containers().size(), 2u);
  service_->Stop();
  EXPECT_THAT(host_.Containers(), IsEmpty());
}

}  // namespace
