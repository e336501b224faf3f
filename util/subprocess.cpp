#include "util/subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>

#include <kj/debug.h>

extern char** environ;

namespace {

using std::chrono::steady_clock;

const constexpr size_t kReadBufSize = 64 * 1024;
const constexpr size_t kMaxStderrSize = 1024 * 1024;

void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}

void MakePipe(kj::AutoCloseFd* read_end, kj::AutoCloseFd* write_end) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) == -1) {  // NOLINT
    throw std::system_error(errno, std::system_category(), "pipe2");
  }
  *read_end = kj::AutoCloseFd(fds[0]);
  *write_end = kj::AutoCloseFd(fds[1]);
}

// Starts argv with its standard streams connected to new pipes, in its own
// process group. Returns the PID.
int SpawnWithPipes(const std::vector<std::string>& argv, kj::AutoCloseFd* in,
                   kj::AutoCloseFd* out, kj::AutoCloseFd* err) {
  KJ_REQUIRE(!argv.empty(), "Empty command line");
  IgnoreSigpipe();
  kj::AutoCloseFd stdin_read, stdin_write;
  kj::AutoCloseFd stdout_read, stdout_write;
  kj::AutoCloseFd stderr_read, stderr_write;
  MakePipe(&stdin_read, &stdin_write);
  MakePipe(&stdout_read, &stdout_write);
  MakePipe(&stderr_read, &stderr_write);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  KJ_DEFER(posix_spawn_file_actions_destroy(&actions));
  posix_spawn_file_actions_adddup2(&actions, stdin_read, STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, stdout_write, STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, stderr_write, STDERR_FILENO);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  KJ_DEFER(posix_spawnattr_destroy(&attr));
  // A new process group, so that a timeout can kill the whole tree, and the
  // default SIGPIPE disposition we changed in the parent.
  posix_spawnattr_setflags(&attr,
                           POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF);
  posix_spawnattr_setpgroup(&attr, 0);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  posix_spawnattr_setsigdefault(&attr, &default_signals);

  std::vector<std::vector<char>> args;
  for (const std::string& s : argv) {
    std::vector<char> arg(s.begin(), s.end());
    arg.push_back('\0');
    args.push_back(std::move(arg));
  }
  std::vector<char*> args_list(args.size() + 1);
  for (size_t i = 0; i < args.size(); i++) args_list[i] = args[i].data();
  args_list.back() = nullptr;

  int pid = 0;
  int ret = posix_spawnp(&pid, args_list[0], &actions, &attr,
                         args_list.data(), environ);
  if (ret != 0) {
    throw std::system_error(ret, std::system_category(), "spawn " + argv[0]);
  }
  *in = std::move(stdin_write);
  *out = std::move(stdout_read);
  *err = std::move(stderr_read);
  return pid;
}

// Waits for pid until deadline. Returns true and sets status if the process
// was reaped.
bool WaitUntil(int pid, steady_clock::time_point deadline, int* status) {
  while (true) {
    int ret = waitpid(pid, status, WNOHANG);
    if (ret == pid) return true;
    if (ret == -1 && errno != EINTR) {
      throw std::system_error(errno, std::system_category(), "waitpid");
    }
    if (steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

void KillAndReap(int pid) {
  kill(-pid, SIGKILL);
  int status = 0;
  while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
}

void FillStatus(int status, util::ProcessResult* result) {
  if (WIFEXITED(status)) {
    result->exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result->signal = WTERMSIG(status);
    result->exit_code = -1;
  }
}

int RemainingMillis(steady_clock::time_point deadline) {
  auto now = steady_clock::now();
  if (now >= deadline) return 0;
  return std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now)
             .count() +
         1;
}

}  // namespace

namespace util {

ProcessResult RunProcess(const std::vector<std::string>& argv,
                         const std::string& stdin_data,
                         std::chrono::milliseconds timeout) {
  kj::AutoCloseFd in, out, err;
  int pid = SpawnWithPipes(argv, &in, &out, &err);
  auto deadline = steady_clock::now() + timeout;
  ProcessResult result;

  size_t written = 0;
  if (stdin_data.empty()) {
    in = nullptr;
  } else if (fcntl(in, F_SETFL, O_NONBLOCK) == -1) {
    KillAndReap(pid);
    throw std::system_error(errno, std::system_category(), "fcntl");
  }

  bool out_open = true;
  bool err_open = true;
  std::vector<char> buf(kReadBufSize);
  while (out_open || err_open) {
    int wait_ms = RemainingMillis(deadline);
    if (wait_ms == 0) {
      result.timed_out = true;
      break;
    }
    struct pollfd fds[3] = {};
    nfds_t n = 0;
    int out_idx = -1;
    int err_idx = -1;
    int in_idx = -1;
    if (out_open) {
      out_idx = n;
      fds[n++] = {out.get(), POLLIN, 0};
    }
    if (err_open) {
      err_idx = n;
      fds[n++] = {err.get(), POLLIN, 0};
    }
    if (in.get() != -1) {
      in_idx = n;
      fds[n++] = {in.get(), POLLOUT, 0};
    }
    int ready = poll(fds, n, wait_ms);
    if (ready == -1) {
      if (errno == EINTR) continue;
      int saved = errno;
      KillAndReap(pid);
      throw std::system_error(saved, std::system_category(), "poll");
    }
    if (in_idx >= 0 && fds[in_idx].revents) {
      if (fds[in_idx].revents & (POLLERR | POLLHUP)) {
        in = nullptr;
      } else {
        ssize_t w = write(in, stdin_data.data() + written,
                          stdin_data.size() - written);
        if (w > 0) written += w;
        if ((w == -1 && errno != EAGAIN && errno != EINTR) ||
            written == stdin_data.size()) {
          in = nullptr;
        }
      }
    }
    auto drain = [&buf, &fds](int idx, int fd, bool* open, std::string* dst) {
      if (idx < 0 || !fds[idx].revents) return;
      ssize_t r = read(fd, buf.data(), buf.size());
      if (r > 0) {
        dst->append(buf.data(), r);
      } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
        *open = false;
      }
    };
    drain(out_idx, out.get(), &out_open, &result.stdout_data);
    drain(err_idx, err.get(), &err_open, &result.stderr_data);
  }
  in = nullptr;

  int status = 0;
  if (result.timed_out || !WaitUntil(pid, deadline, &status)) {
    result.timed_out = true;
    KillAndReap(pid);
    result.exit_code = -1;
    result.signal = SIGKILL;
    return result;
  }
  FillStatus(status, &result);
  return result;
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(
    const std::vector<std::string>& argv) {
  std::unique_ptr<ChildProcess> child(new ChildProcess());
  child->pid_ =
      SpawnWithPipes(argv, &child->stdin_, &child->stdout_, &child->stderr_);
  return child;
}

void ChildProcess::WriteLine(const std::string& line) {
  if (stdin_.get() == -1) {
    throw std::system_error(EPIPE, std::system_category(), "write");
  }
  std::string data = line + "\n";
  size_t pos = 0;
  while (pos < data.size()) {
    ssize_t w = write(stdin_, data.data() + pos, data.size() - pos);
    if (w == -1 && errno == EINTR) continue;
    if (w == -1) {
      int saved = errno;
      stdin_ = nullptr;
      throw std::system_error(saved, std::system_category(), "write");
    }
    pos += w;
  }
}

bool ChildProcess::Pump(std::chrono::milliseconds timeout) {
  if (stdout_.get() == -1) return false;
  struct pollfd fds[2] = {};
  nfds_t n = 0;
  fds[n++] = {stdout_.get(), POLLIN, 0};
  if (stderr_.get() != -1) fds[n++] = {stderr_.get(), POLLIN, 0};
  int ready = poll(fds, n, static_cast<int>(timeout.count()));
  if (ready == -1) {
    if (errno == EINTR) return true;
    throw std::system_error(errno, std::system_category(), "poll");
  }
  char buf[kReadBufSize];
  if (n > 1 && fds[1].revents) {
    ssize_t r = read(stderr_, buf, sizeof(buf));
    if (r > 0) {
      stderr_buffer_.append(buf, r);
      if (stderr_buffer_.size() > kMaxStderrSize) {
        stderr_buffer_.erase(0, stderr_buffer_.size() - kMaxStderrSize);
      }
    } else if (r == 0 || errno != EINTR) {
      stderr_ = nullptr;
    }
  }
  if (fds[0].revents) {
    ssize_t r = read(stdout_, buf, sizeof(buf));
    if (r > 0) {
      stdout_buffer_.append(buf, r);
    } else if (r == 0 || errno != EINTR) {
      stdout_ = nullptr;
      return false;
    }
  }
  return true;
}

LineChannel::ReadStatus ChildProcess::ReadLine(
    std::string* line, std::chrono::milliseconds timeout) {
  auto deadline = steady_clock::now() + timeout;
  while (true) {
    size_t newline = stdout_buffer_.find('\n');
    if (newline != std::string::npos) {
      *line = stdout_buffer_.substr(0, newline);
      stdout_buffer_.erase(0, newline + 1);
      return ReadStatus::LINE;
    }
    if (stdout_.get() == -1) return ReadStatus::CLOSED;
    int remaining = RemainingMillis(deadline);
    if (remaining == 0) return ReadStatus::TIMEOUT;
    if (!Pump(std::chrono::milliseconds(remaining)) &&
        stdout_buffer_.find('\n') == std::string::npos) {
      return ReadStatus::CLOSED;
    }
  }
}

std::string ChildProcess::ErrorOutput() {
  while (stderr_.get() != -1) {
    struct pollfd fd = {stderr_.get(), POLLIN, 0};
    if (poll(&fd, 1, 0) <= 0 || !fd.revents) break;
    char buf[kReadBufSize];
    ssize_t r = read(stderr_, buf, sizeof(buf));
    if (r <= 0) {
      stderr_ = nullptr;
      break;
    }
    stderr_buffer_.append(buf, r);
  }
  return stderr_buffer_;
}

void ChildProcess::Close() {
  if (pid_ <= 0 || reaped_) return;
  stdin_ = nullptr;
  int status = 0;
  if (!WaitUntil(pid_, steady_clock::now() + std::chrono::seconds(1),
                 &status)) {
    KillAndReap(pid_);
  }
  reaped_ = true;
  stdout_ = nullptr;
  stderr_ = nullptr;
}

ChildProcess::~ChildProcess() {
  if (pid_ > 0 && !reaped_) {
    stdin_ = nullptr;
    KillAndReap(pid_);
  }
}

}  // namespace util
