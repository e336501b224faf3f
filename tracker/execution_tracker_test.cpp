#include "tracker/execution_tracker.hpp"

#include <condition_variable>
#include <mutex>
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
using ::testing::Not;

using std::chrono::milliseconds;
using std::chrono::seconds;
using tracker::RequestStatus;

const std::string test_tmpdir = "/tmp/codebox_testdir";

// Blocks code containing "# hold" in validation until Release.
class HoldingValidator : public security::Validator {
 public:
  HoldingValidator() : security::Validator(security::Policy::Default()) {}

  void ValidateCode(const std::string& code) const override {
    if (code.find("# hold") != std::string::npos) {
      std::unique_lock<std::mutex> lck(mutex_);
      held_ = true;
      cv_.notify_all();
      cv_.wait(lck, [this] { return released_; });
    }
    security::Validator::ValidateCode(code);
  }

  void WaitHeld() {
    std::unique_lock<std::mutex> lck(mutex_);
    cv_.wait(lck, [this] { return held_; });
  }

  void Release() {
    std::lock_guard<std::mutex> lck(mutex_);
    released_ = true;
    cv_.notify_all();
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  mutable bool held_ = false;
  bool released_ = false;
};

class ExecutionTrackerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::WriteAll(script_, "# agent\n");
    backend::BackendOptions backend_options;
    backend_options.workspace_directory = workspaces_.Path();
    factory_.reset(new backend::BackendFactory(&host_, backend_options));
    validator_.reset(new security::Validator(security::Policy::Default()));

    session::SessionOptions session_options;
    session_options.kernel_script = script_;
    session_options.handshake_timeout = seconds(5);
    sessions_.reset(new session::SessionManager(
        factory_.get(), validator_.get(), session_options));
    store_.reset(new tracker::ArtifactStore(store_dir_.Path()));
  }

  void StartTracker(milliseconds queue_timeout = seconds(60),
                    const security::Validator* validator = nullptr) {
    tracker::TrackerOptions options;
    options.num_workers = 4;
    options.queue_timeout = queue_timeout;
    options.busy_retry_interval = milliseconds(10);
    options.retention = seconds(60);
    tracker_.reset(new tracker::ExecutionTracker(
        sessions_.get(), validator ? validator : validator_.get(),
        store_.get(), options));
    tracker_->Start();
  }

  void TearDown() override {
    tracker_.reset();
    sessions_.reset();
  }

  std::string NewSession() {
    return sessions_->CreateSession({}, session::EnvironmentOptions());
  }

  // Submits code and waits for its outcome.
  tracker::RequestResult Run(const std::string& session_id,
                             const std::string& code,
                             RequestStatus expected = RequestStatus::COMPLETED,
                             milliseconds timeout = seconds(5)) {
    std::string id = tracker_->Submit(session_id, code, timeout);
    EXPECT_EQ(tracker_->Wait(id, seconds(10)), expected) << code;
    return tracker_->Result(id);
  }

  util::TempDir workspaces_{test_tmpdir};
  util::TempDir store_dir_{test_tmpdir};
  std::string script_ = util::File::JoinPath(workspaces_.Path(), "kernel.py");
  fake::FakeHost host_;
  std::unique_ptr<backend::BackendFactory> factory_;
  std::unique_ptr<security::Validator> validator_;
  std::unique_ptr<session::SessionManager> sessions_;
  std::unique_ptr<tracker::ArtifactStore> store_;
  HoldingValidator holding_validator_;
  std::unique_ptr<tracker::ExecutionTracker> tracker_;
};

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, StateSurvivesBetweenRequests) {
  StartTracker();
  std::string sid = NewSession();
  auto result = Run(sid, "x = 1+1");
  EXPECT_EQ(result.error_kind, "");
  EXPECT_FALSE(result.has_display_value);
  EXPECT_EQ(result.stdout_text, "");
  result = Run(sid, "print(x)");
  EXPECT_EQ(result.stdout_text, "2\n");
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, DisplayValue) {
  StartTracker();
  std::string sid = NewSession();
  auto result = Run(sid, "6*7");
  EXPECT_TRUE(result.has_display_value);
  EXPECT_EQ(result.display_value, "42");
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, RejectedCodeNeverReachesSession) {
  StartTracker();
  std::string sid = NewSession();
  size_t execs = host_.Count("docker", "exec");
  EXPECT_THROW(  // NOLINT
      tracker_->Submit(sid, "__import__('os').system('rm -rf /')"),
      core::validation_error);
  EXPECT_EQ(host_.Count("docker", "exec"), execs);
  EXPECT_EQ(sessions_->Info(sid).state, session::SessionState::READY);
  EXPECT_EQ(Run(sid, "print(1)").stdout_text, "1\n");
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, RejectsBadRequests) {
  StartTracker();
  std::string sid = NewSession();
  EXPECT_THROW(tracker_->Submit(sid, "print(1)", seconds(601)),  // NOLINT
               core::validation_error);
  EXPECT_THROW(tracker_->Submit(sid, "print(1)", milliseconds(10)),  // NOLINT
               core::validation_error);
  EXPECT_THROW(tracker_->Submit(sid, std::string(10001, '1')),  // NOLINT
               core::validation_error);
  EXPECT_THROW(tracker_->Submit("missing", "print(1)"),  // NOLINT
               core::session_not_found);
  EXPECT_THROW(tracker_->Status("missing"),  // NOLINT
               core::request_not_found);
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, ResultNotReady) {
  StartTracker();
  std::string sid = NewSession();
  std::string id = tracker_->Submit(sid, "sleep(0.5)\nprint(1)");
  RequestStatus status = tracker_->Status(id).status;
  EXPECT_TRUE(status == RequestStatus::QUEUED ||
              status == RequestStatus::RUNNING);
  EXPECT_THROW(tracker_->Result(id), core::result_not_ready);  // NOLINT
  EXPECT_THROW(tracker_->ListFiles(id), core::result_not_ready);  // NOLINT
  EXPECT_EQ(tracker_->Wait(id, seconds(10)), RequestStatus::COMPLETED);
  tracker::RequestInfo info = tracker_->Status(id);
  EXPECT_EQ(info.session_id, sid);
  EXPECT_LE(info.created, info.started);
  EXPECT_LE(info.started, info.completed);
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, SameSessionRunsInOrder) {
  StartTracker();
  std::string sid = NewSession();
  std::vector<std::string> ids = {
      tracker_->Submit(sid, "x = 1\nsleep(0.3)"),
      tracker_->Submit(sid, "x = x * 10"),
      tracker_->Submit(sid, "x = x + 2\nsleep(0.1)"),
      tracker_->Submit(sid, "print(x)"),
  };
  bool done = false;
  while (!done) {
    size_t running = 0;
    done = true;
    for (const std::string& id : ids) {
      RequestStatus status = tracker_->Status(id).status;
      if (status == RequestStatus::RUNNING) running++;
      if (!tracker::IsTerminal(status)) done = false;
    }
    EXPECT_LE(running, 1u);
    std::this_thread::sleep_for(milliseconds(2));
  }
  for (const std::string& id : ids) {
    EXPECT_EQ(tracker_->Status(id).status, RequestStatus::COMPLETED);
  }
  EXPECT_EQ(tracker_->Result(ids.back()).stdout_text, "12\n");
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, OrderFollowsRegistration) {
  StartTracker(seconds(60), &holding_validator_);
  std::string sid = NewSession();
  std::string first;
  std::thread submitter(
      [&] { first = tracker_->Submit(sid, "# hold\nx = 1"); });
  holding_validator_.WaitHeld();
  std::string second = tracker_->Submit(sid, "x = x * 10\nprint(x)");
  std::this_thread::sleep_for(milliseconds(200));
  EXPECT_EQ(tracker_->Status(second).status, RequestStatus::QUEUED);
  holding_validator_.Release();
  submitter.join();
  EXPECT_EQ(tracker_->Wait(second, seconds(10)), RequestStatus::COMPLETED);
  EXPECT_EQ(tracker_->Result(second).stdout_text, "10\n");
  EXPECT_EQ(tracker_->Status(first).status, RequestStatus::COMPLETED);
  EXPECT_LE(tracker_->Status(first).completed,
            tracker_->Status(second).started);
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, RejectedRequestGivesUpItsTurn) {
  StartTracker(seconds(60), &holding_validator_);
  std::string sid = NewSession();
  std::thread submitter([&] {
    EXPECT_THROW(  // NOLINT
        tracker_->Submit(sid, "# hold\n__import__('os').getcwd()"),
        core::validation_error);
  });
  holding_validator_.WaitHeld();
  std::string id = tracker_->Submit(sid, "print(1)");
  std::this_thread::sleep_for(milliseconds(200));
  EXPECT_EQ(tracker_->Status(id).status, RequestStatus::QUEUED);
  holding_validator_.Release();
  submitter.join();
  EXPECT_EQ(tracker_->Wait(id, seconds(10)), RequestStatus::COMPLETED);
  EXPECT_EQ(tracker_->Result(id).stdout_text, "1\n");
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, QueuedWhileSessionInstalls) {
  StartTracker();
  std::string sid = NewSession();
  host_.SetInstallDelay(milliseconds(600));
  std::thread installer(
      [&] { sessions_->InstallDependencies(sid, {"numpy"}); });
  while (sessions_->Info(sid).state != session::SessionState::BUSY) {
    std::this_thread::sleep_for(milliseconds(1));
  }
  std::string id = tracker_->Submit(sid, "print(1)");
  std::this_thread::sleep_for(milliseconds(300));
  EXPECT_EQ(tracker_->Status(id).status, RequestStatus::QUEUED);
  installer.join();
  EXPECT_EQ(tracker_->Wait(id, seconds(10)), RequestStatus::COMPLETED);
  tracker::RequestInfo info = tracker_->Status(id);
  EXPECT_LE(info.created, info.started);
  EXPECT_EQ(tracker_->Result(id).stdout_text, "1\n");
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, MistypedRepliesKeepSessionUsable) {
  StartTracker();
  std::string sid = NewSession();
  auto result = Run(sid, "spoof_reply()\nprint(1)");
  EXPECT_EQ(result.stdout_text, "1\n");
  EXPECT_EQ(result.error_kind, "");
  EXPECT_EQ(sessions_->Info(sid).state, session::SessionState::READY);
  EXPECT_EQ(Run(sid, "print(2)").stdout_text, "2\n");
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, SessionsRunInParallel) {
  StartTracker();
  std::string a = NewSession();
  std::string b = NewSession();
  std::string first = tracker_->Submit(a, "sleep(1)");
  std::string second = tracker_->Submit(b, "sleep(1)");
  auto deadline = std::chrono::steady_clock::now() + seconds(5);
  bool both_running = false;
  while (!both_running && std::chrono::steady_clock::now() < deadline) {
    both_running = tracker_->Status(first).status == RequestStatus::RUNNING &&
                   tracker_->Status(second).status == RequestStatus::RUNNING;
  }
  EXPECT_TRUE(both_running);
  EXPECT_EQ(tracker_->Wait(first, seconds(10)), RequestStatus::COMPLETED);
  EXPECT_EQ(tracker_->Wait(second, seconds(10)), RequestStatus::COMPLETED);
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, UserErrorFailsRequest) {
  StartTracker();
  std::string sid = NewSession();
  auto result = Run(sid, "print(1)\ny", RequestStatus::FAILED);
  EXPECT_EQ(result.stdout_text, "1\n");
  EXPECT_EQ(result.error_kind, "NameError");
  EXPECT_THAT(result.traceback, Not(IsEmpty()));
  EXPECT_EQ(sessions_->Info(sid).state, session::SessionState::READY);
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, TimeoutDiscardsSession) {
  StartTracker();
  std::string sid = NewSession();
  auto result = Run(sid, "sleep(3)", RequestStatus::TIMED_OUT, seconds(1));
  EXPECT_EQ(result.error_kind, "execution_timeout");
  EXPECT_EQ(sessions_->Info(sid).state, session::SessionState::ERROR);

  result = Run(sid, "print(1)", RequestStatus::FAILED);
  EXPECT_EQ(result.error_kind, "session_busy");
  EXPECT_THAT(result.error_message, HasSubstr("recreated"));
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, QueueTimeout) {
  StartTracker(milliseconds(300));
  std::string sid = NewSession();
  std::string slow = tracker_->Submit(sid, "sleep(1)");
  std::string late = tracker_->Submit(sid, "print(1)");
  EXPECT_EQ(tracker_->Wait(late, seconds(10)), RequestStatus::FAILED);
  EXPECT_EQ(tracker_->Result(late).error_kind, "session_busy");
  EXPECT_EQ(tracker_->Wait(slow, seconds(10)), RequestStatus::COMPLETED);
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, StoresArtifacts) {
  StartTracker();
  std::string sid = NewSession();
  std::string id = tracker_->Submit(sid, "save('answer.txt', 42)\nshow_png()");
  ASSERT_EQ(tracker_->Wait(id, seconds(10)), RequestStatus::COMPLETED);
  EXPECT_THAT(tracker_->Result(id).files,
              ElementsAre("answer.txt", "display-1.png"));
  EXPECT_THAT(tracker_->ListFiles(id),
              ElementsAre("answer.txt", "display-1.png"));
  EXPECT_EQ(tracker_->FetchFile(id, "answer.txt"), "42");
  EXPECT_THROW(tracker_->FetchFile(id, "missing.txt"),  // NOLINT
               core::artifact_not_found);
  EXPECT_THROW(tracker_->FetchFile(id, "../answer.txt"),  // NOLINT
               core::validation_error);

  // Retention.
  auto now = std::chrono::steady_clock::now();
  EXPECT_EQ(tracker_->Sweep(now), 0u);
  EXPECT_EQ(tracker_->Sweep(now + seconds(120)), 1u);
  EXPECT_THROW(tracker_->Status(id), core::request_not_found);  // NOLINT
  EXPECT_FALSE(util::File::Exists(util::File::JoinPath(store_dir_.Path(), id)));
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, DeletedSession) {
  StartTracker();
  std::string sid = NewSession();
  sessions_->Terminate(sid);
  EXPECT_THROW(tracker_->Submit(sid, "print(1)"),  // NOLINT
               core::session_not_found);
}

// NOLINTNEXTLINE
TEST_F(ExecutionTrackerTest, StopCancelsQueuedRequests) {
  StartTracker();
  std::string sid = NewSession();
  std::string running = tracker_->Submit(sid, "sleep(0.3)");
  std::string queued = tracker_->Submit(sid, "print(1)");
  while (tracker_->Status(running).status == RequestStatus::QUEUED) {
    std::this_thread::sleep_for(milliseconds(1));
  }
  tracker_->Stop();
  EXPECT_EQ(tracker_->Status(running).status, RequestStatus::COMPLETED);
  EXPECT_EQ(tracker_->Status(queued).status, RequestStatus::FAILED);
  EXPECT_EQ(tracker_->Result(queued).error_kind, "cancelled");
  EXPECT_THROW(tracker_->Submit(sid, "print(1)"),  // NOLINT
               core::backend_unavailable);
}

}  // namespace
