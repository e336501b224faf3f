#include "server/server.hpp"

#include <thread>

#include <kj/async-io.h>

#include "core/errors.hpp"
#include "fake/fake_host.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::IsEmpty;
using ::testing::StartsWith;

using std::chrono::milliseconds;
using std::chrono::seconds;

const std::string test_tmpdir = "/tmp/codebox_testdir";

class ServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::WriteAll(script_, "# agent\n");
    service::ServiceOptions options;
    options.backend.workspace_directory =
        util::File::JoinPath(tmp_.Path(), "temp");
    options.session.kernel_script = script_;
    options.session.handshake_timeout = seconds(5);
    options.tracker.num_workers = 2;
    options.store_directory = util::File::JoinPath(tmp_.Path(), "files");
    service_.reset(new service::CodeboxService(&host_, options));
    service_->Start();

    auto impl = kj::heap<server::Server>(service_.get());
    impl->SetIoProvider(io_.lowLevelProvider.get());
    client_ = kj::heap<capnproto::Codebox::Client>(kj::mv(impl));
  }

  void TearDown() override {
    client_ = nullptr;
    service_.reset();
  }

  std::string CreateSession() {
    auto request = client_->createSessionRequest();
    request.initDependencies(0);
    auto response = request.send().wait(io_.waitScope);
    return std::string(response.getSessionId());
  }

  std::string Submit(const std::string& session_id, const std::string& code) {
    auto request = client_->submitExecutionRequest();
    request.setSessionId(session_id);
    request.setCode(code);
    auto response = request.send().wait(io_.waitScope);
    std::string request_id(response.getRequestId());
    EXPECT_EQ(service_->WaitExecution(request_id, seconds(10)),
              tracker::RequestStatus::COMPLETED);
    return request_id;
  }

  // The description of the exception thrown by the call.
  template <typename Request>
  std::string Failure(Request request) {
    try {
      request.send().wait(io_.waitScope);
    } catch (const kj::Exception& e) {
      return e.getDescription().cStr();
    }
    ADD_FAILURE() << "The call did not fail";
    return "";
  }

  kj::AsyncIoContext io_ = kj::setupAsyncIo();
  util::TempDir tmp_{test_tmpdir};
  std::string script_ = util::File::JoinPath(tmp_.Path(), "kernel.py");
  fake::FakeHost host_;
  std::unique_ptr<service::CodeboxService> service_;
  kj::Own<capnproto::Codebox::Client> client_;
};

// NOLINTNEXTLINE
TEST_F(ServerTest, ExecutesCode) {
  std::string sid = CreateSession();
  Submit(sid, "x = 6");
  std::string rid = Submit(sid, "print(x)\nsave('x.txt', x)\nx*7");

  auto status = client_->getExecutionStatusRequest();
  status.setRequestId(rid);
  auto info = status.send().wait(io_.waitScope);
  EXPECT_EQ(info.getStatus(), capnproto::ExecutionStatus::COMPLETED);
  EXPECT_EQ(std::string(info.getSessionId()), sid);
  EXPECT_NE(std::string(info.getCompletedAt()), "");

  auto request = client_->getExecutionResultRequest();
  request.setRequestId(rid);
  auto response = request.send().wait(io_.waitScope);
  auto result = response.getResult();
  EXPECT_EQ(std::string(result.getStdout()), "6\n");
  ASSERT_TRUE(result.getDisplayValue().isText());
  EXPECT_EQ(std::string(result.getDisplayValue().getText()), "42");
  EXPECT_TRUE(result.getError().isNone());
  ASSERT_EQ(result.getFiles().size(), 1u);
  EXPECT_EQ(std::string(result.getFiles()[0]), "x.txt");

  auto fetch = client_->fetchFileRequest();
  fetch.setRequestId(rid);
  fetch.setName("x.txt");
  auto fetched = fetch.send().wait(io_.waitScope);
  auto data = fetched.getData();
  EXPECT_EQ(std::string(data.begin(), data.end()), "6");
}

// NOLINTNEXTLINE
TEST_F(ServerTest, ReportsUserErrors) {
  std::string sid = CreateSession();
  auto submit = client_->submitExecutionRequest();
  submit.setSessionId(sid);
  submit.setCode("y");
  auto submitted = submit.send().wait(io_.waitScope);
  std::string rid(submitted.getRequestId());
  service_->WaitExecution(rid, seconds(10));

  auto request = client_->getExecutionResultRequest();
  request.setRequestId(rid);
  auto response = request.send().wait(io_.waitScope);
  EXPECT_EQ(response.getStatus(), capnproto::ExecutionStatus::FAILED);
  ASSERT_TRUE(response.getResult().getError().isDetails());
  EXPECT_EQ(
      std::string(response.getResult().getError().getDetails().getKind()),
      "NameError");
}

// NOLINTNEXTLINE
TEST_F(ServerTest, SubmitWithoutSession) {
  auto submit = client_->submitExecutionRequest();
  submit.setCode("x = 3\nprint(x * 2)");
  submit.initDependencies(1).set(0, "numpy");
  auto submitted = submit.send().wait(io_.waitScope);
  std::string sid(submitted.getSessionId());
  std::string rid(submitted.getRequestId());
  EXPECT_NE(sid, "");
  ASSERT_EQ(service_->WaitExecution(rid, seconds(10)),
            tracker::RequestStatus::COMPLETED);
  EXPECT_EQ(service_->GetExecutionResult(rid).stdout_text, "6\n");
  EXPECT_EQ(host_.Containers().size(), 1u);

  // An existing session is echoed back.
  auto again = client_->submitExecutionRequest();
  again.setSessionId(sid);
  again.setCode("print(x)");
  auto response = again.send().wait(io_.waitScope);
  EXPECT_EQ(std::string(response.getSessionId()), sid);
  EXPECT_EQ(host_.Containers().size(), 1u);

  auto rejected = client_->submitExecutionRequest();
  rejected.setCode("import subprocess");
  EXPECT_THAT(Failure(kj::mv(rejected)), StartsWith("validation_error: "));
  EXPECT_EQ(host_.Containers().size(), 1u);
}

// NOLINTNEXTLINE
TEST_F(ServerTest, ErrorsCarryTheirKind) {
  auto missing = client_->submitExecutionRequest();
  missing.setSessionId("missing");
  missing.setCode("print(1)");
  EXPECT_THAT(Failure(kj::mv(missing)), StartsWith("session_not_found: "));

  std::string sid = CreateSession();
  auto rejected = client_->submitExecutionRequest();
  rejected.setSessionId(sid);
  rejected.setCode("import subprocess");
  EXPECT_THAT(Failure(kj::mv(rejected)), StartsWith("validation_error: "));

  auto create = client_->createSessionRequest();
  create.initDependencies(1).set(0, "forbidden; rm -rf /");
  EXPECT_THAT(Failure(kj::mv(create)), StartsWith("validation_error: "));

  auto files = client_->listFilesRequest();
  files.setRequestId("missing");
  EXPECT_THAT(Failure(kj::mv(files)), StartsWith("request_not_found: "));
}

// NOLINTNEXTLINE
TEST_F(ServerTest, SessionLifecycle) {
  std::string sid = CreateSession();
  EXPECT_EQ(host_.Containers().size(), 1u);

  auto install = client_->installDependenciesRequest();
  install.setSessionId(sid);
  install.initDependencies(1).set(0, "Requests>=2.0");
  auto response = install.send().wait(io_.waitScope);
  auto installed = response.getInstalled();
  ASSERT_EQ(installed.size(), 1u);
  EXPECT_EQ(std::string(installed[0]), "requests>=2.0");

  for (int i = 0; i < 2; i++) {
    auto request = client_->deleteSessionRequest();
    request.setSessionId(sid);
    request.send().wait(io_.waitScope);
  }
  EXPECT_THAT(host_.Containers(), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ServerTest, DestructionWaitsForPendingCalls) {
  host_.SetInstallDelay(milliseconds(500));
  {
    auto request = client_->createSessionRequest();
    request.initDependencies(1).set(0, "numpy");
    auto pending = request.send();
    while (host_.Count("docker", "run") == 0) {
      io_.waitScope.poll();
      std::this_thread::sleep_for(milliseconds(1));
    }
  }
  io_.waitScope.poll();
  client_ = nullptr;
  // Provisioning went on to start the interpreter before the server was
  // gone.
  size_t attached = 0;
  for (const std::vector<std::string>& argv : host_.Commands()) {
    if (argv.size() > 2 && argv[0] == "docker" && argv[1] == "exec" &&
        argv[2] == "-i") {
      attached++;
    }
  }
  EXPECT_EQ(attached, 1u);
}

// NOLINTNEXTLINE
TEST(ServerStatusTest, Conversion) {
  EXPECT_EQ(server::ToCapnp(tracker::RequestStatus::TIMED_OUT),
            capnproto::ExecutionStatus::TIMED_OUT);
  EXPECT_EQ(server::ToCapnp(tracker::RequestStatus::QUEUED),
            capnproto::ExecutionStatus::QUEUED);
}

}  // namespace
