#include <memory>
#include <system_error>

#include "core/errors.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "kernel/kernel_client.hpp"
#include "util/file.hpp"
#include "util/subprocess.hpp"

// Runs the interpreter agent shipped to containers with the local python3.

namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

using std::chrono::milliseconds;
using std::chrono::seconds;

const std::string test_tmpdir = "/tmp/codebox_testdir";

bool HavePython() {
  try {
    return util::RunProcess({"python3", "--version"}, "", seconds(10))
        .Success();
  } catch (const std::system_error&) {
    return false;
  }
}

class CodeboxKernelTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (!HavePython()) GTEST_SKIP() << "python3 not found";
    kernel::ConnectionInfo info;
    info.key = "key";
    util::File::WriteAll(
        util::File::JoinPath(tmp_.Path(), ".codebox/connection.json"),
        info.ToJson());
    auto child = util::ChildProcess::Spawn(
        {"sh", "-c", "cd \"$1\" && exec python3 \"$2\" \"$3\"", "sh",
         tmp_.Path(), CODEBOX_KERNEL_SCRIPT, ".codebox/connection.json"});
    client_.reset(new kernel::KernelClient(std::move(child), "key"));
    client_->Handshake(seconds(30));
  }

  util::TempDir tmp_{test_tmpdir};
  std::unique_ptr<kernel::KernelClient> client_;
};

// NOLINTNEXTLINE
TEST_F(CodeboxKernelTest, StatePersists) {
  auto output = client_->Execute("x = 1+1", seconds(10));
  EXPECT_FALSE(output.failed);
  EXPECT_FALSE(output.has_display_value);
  EXPECT_EQ(output.stdout_text, "");
  output = client_->Execute("print(x)", seconds(10));
  EXPECT_EQ(output.stdout_text, "2\n");
}

// NOLINTNEXTLINE
TEST_F(CodeboxKernelTest, DisplayValueAndStreams) {
  auto output = client_->Execute(
      "import sys\nsys.stderr.write('warn\\n')\n'a' * 3", seconds(10));
  EXPECT_EQ(output.stderr_text, "warn\n");
  EXPECT_TRUE(output.has_display_value);
  EXPECT_EQ(output.display_value, "'aaa'");
  output = client_->Execute("None", seconds(10));
  EXPECT_FALSE(output.has_display_value);
}

// NOLINTNEXTLINE
TEST_F(CodeboxKernelTest, Exception) {
  auto output = client_->Execute("1/0", seconds(10));
  EXPECT_TRUE(output.failed);
  EXPECT_EQ(output.error_name, "ZeroDivisionError");
  EXPECT_EQ(output.error_value, "division by zero");
  EXPECT_THAT(output.traceback, Not(IsEmpty()));
}

// NOLINTNEXTLINE
TEST_F(CodeboxKernelTest, ChildProcessesDoNotCorruptTheChannel) {
  auto output =
      client_->Execute("import os\nos.system('echo stray')\nprint('ok')",
                       seconds(10));
  EXPECT_FALSE(output.failed);
  EXPECT_EQ(output.stdout_text, "ok\n");
  EXPECT_TRUE(client_->Ping(seconds(5)));
}

// NOLINTNEXTLINE
TEST_F(CodeboxKernelTest, ShellEscapesAndMagics) {
  auto output = client_->Execute("!echo hello\n%pwd", seconds(10));
  EXPECT_FALSE(output.failed);
  EXPECT_EQ(output.stdout_text, "hello\n");
  output = client_->Execute("%nosuchmagic", seconds(10));
  EXPECT_TRUE(output.failed);
  EXPECT_EQ(output.error_name, "UsageError");
}

// NOLINTNEXTLINE
TEST_F(CodeboxKernelTest, OutputsDirectory) {
  client_->Execute("open('outputs/result.txt', 'w').write('42')", seconds(10));
  EXPECT_EQ(util::File::ReadAll(
                util::File::JoinPath(tmp_.Path(), "outputs/result.txt")),
            "42");
}

// NOLINTNEXTLINE
TEST_F(CodeboxKernelTest, Timeout) {
  EXPECT_THROW(client_->Execute("import time\ntime.sleep(10)",  // NOLINT
                                milliseconds(300)),
               core::execution_timeout);
}

}  // namespace
