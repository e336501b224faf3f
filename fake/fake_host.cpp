#include "fake/fake_host.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <thread>

#include "backend/container_engine.hpp"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace fake {

namespace {

using std::chrono::steady_clock;

// base64 of the PNG signature.
const constexpr char* kPngData = "iVBORw0KGgo=";

util::ProcessResult Exit(int32_t code, const std::string& out = "",
                         const std::string& err = "") {
  util::ProcessResult result;
  result.exit_code = code;
  result.stdout_data = out;
  result.stderr_data = err;
  return result;
}

struct EvalError {
  std::string name;
  std::string value;
};

class Evaluator {
 public:
  Evaluator(const std::string& text, const std::map<std::string, int64_t>& vars)
      : text_(text), vars_(vars) {}

  int64_t Evaluate() {
    int64_t value = Sum();
    Skip();
    if (pos_ != text_.size()) throw EvalError{"SyntaxError", "invalid syntax"};
    return value;
  }

 private:
  bool IsDigit(size_t pos) const {
    return pos < text_.size() &&
           isdigit(static_cast<unsigned char>(text_[pos])) != 0;
  }
  bool IsLetter(size_t pos) const {
    return pos < text_.size() &&
           (isalpha(static_cast<unsigned char>(text_[pos])) != 0 ||
            text_[pos] == '_');
  }
  void Skip() {
    while (pos_ < text_.size() && text_[pos_] == ' ') pos_++;
  }
  bool Accept(const char* token) {
    Skip();
    if (text_.compare(pos_, strlen(token), token) != 0) return false;
    pos_ += strlen(token);
    return true;
  }

  int64_t Sum() {
    int64_t value = Product();
    while (true) {
      if (Accept("+")) {
        value += Product();
      } else if (Accept("-")) {
        value -= Product();
      } else {
        return value;
      }
    }
  }

  int64_t Product() {
    int64_t value = Unary();
    while (true) {
      if (Accept("//") || Accept("%")) {
        bool modulo = text_[pos_ - 1] == '%';
        int64_t divisor = Unary();
        if (divisor == 0) {
          throw EvalError{"ZeroDivisionError",
                          "integer division or modulo by zero"};
        }
        int64_t quotient = value / divisor;
        if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
          quotient--;
        }
        value = modulo ? value - quotient * divisor : quotient;
      } else if (Accept("*")) {
        value *= Unary();
      } else {
        return value;
      }
    }
  }

  int64_t Unary() {
    if (Accept("-")) return -Unary();
    if (Accept("(")) {
      int64_t value = Sum();
      if (!Accept(")")) throw EvalError{"SyntaxError", "'(' was never closed"};
      return value;
    }
    Skip();
    size_t start = pos_;
    if (IsDigit(pos_)) {
      while (IsDigit(pos_)) pos_++;
      return std::stoll(text_.substr(start, pos_ - start));
    }
    while (IsDigit(pos_) || IsLetter(pos_)) pos_++;
    if (start == pos_) throw EvalError{"SyntaxError", "invalid syntax"};
    std::string name = text_.substr(start, pos_ - start);
    auto it = vars_.find(name);
    if (it == vars_.end()) {
      throw EvalError{"NameError", "name '" + name + "' is not defined"};
    }
    return it->second;
  }

  const std::string& text_;
  const std::map<std::string, int64_t>& vars_;
  size_t pos_ = 0;
};

// If statement is name(...), stores the argument text.
bool IsCall(const std::string& statement, const std::string& name,
            std::string* args) {
  if (!util::startsWith(statement, name + "(") || statement.back() != ')') {
    return false;
  }
  *args = util::trim(
      statement.substr(name.size() + 1, statement.size() - name.size() - 2));
  return true;
}

bool IsLiteral(const std::string& text, std::string* value) {
  if (text.size() < 2) return false;
  char quote = text[0];
  if ((quote != '\'' && quote != '"') || text.back() != quote) return false;
  *value = text.substr(1, text.size() - 2);
  return true;
}

bool IsIdentifier(const std::string& text) {
  if (text.empty() || isdigit(static_cast<unsigned char>(text[0]))) {
    return false;
  }
  for (char c : text) {
    if (!isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return true;
}

}  // namespace

/*
 * FakeKernel
 */

FakeKernel::FakeKernel(std::string workspace,
                       std::shared_ptr<std::atomic<bool>> alive)
    : workspace_(std::move(workspace)), alive_(std::move(alive)) {
  std::string connection =
      util::File::JoinPath(workspace_, ".codebox/connection.json");
  if (!workspace_.empty() && util::File::Exists(connection)) {
    key_ = kernel::ConnectionInfo::FromJson(util::File::ReadAll(connection))
               .key;
    util::File::MakeDirs(util::File::JoinPath(workspace_, "outputs"));
  } else {
    error_output_ = "python: can't open file '.codebox/kernel.py'";
    closed_ = true;
  }
}

void FakeKernel::Emit(const std::string& channel, const std::string& msg_type,
                      nlohmann::json content, const std::string& parent,
                      steady_clock::time_point ready_at) {
  kernel::Message msg =
      kernel::Message::Make(channel, msg_type, std::move(content), parent);
  pending_.push_back({msg.Serialize(key_), ready_at});
}

void FakeKernel::WriteLine(const std::string& line) {
  std::lock_guard<std::mutex> lck(mutex_);
  if (closed_ || crashed_ || !*alive_) {
    throw std::system_error(EPIPE, std::system_category(), "write");
  }
  kernel::Message msg;
  if (!kernel::Message::Parse(line, key_, &msg)) return;
  auto now = steady_clock::now();
  if (msg.channel == kernel::kHeartbeat) {
    Emit(kernel::kHeartbeat, "pong", nlohmann::json::object(), msg.msg_id,
         now);
  } else if (msg.msg_type == "kernel_info_request") {
    Emit(kernel::kIopub, "status", {{"execution_state", "busy"}}, msg.msg_id,
         now);
    Emit(kernel::kShell, "kernel_info_reply",
         {{"status", "ok"},
          {"protocol_version", kernel::kProtocolVersion},
          {"implementation", "fake"}},
         msg.msg_id, now);
    Emit(kernel::kIopub, "status", {{"execution_state", "idle"}}, msg.msg_id,
         now);
  } else if (msg.msg_type == "execute_request") {
    Execute(msg);
  }
}

void FakeKernel::Execute(const kernel::Message& request) {
  const std::string& parent = request.msg_id;
  auto at = steady_clock::now();
  execution_count_++;
  Emit(kernel::kIopub, "status", {{"execution_state", "busy"}}, parent, at);

  std::vector<std::string> lines =
      util::split(request.content.value("code", ""), '\n');
  bool failed = false;
  EvalError error;
  for (size_t i = 0; i < lines.size() && !failed; i++) {
    std::string statement = util::trim(lines[i]);
    if (statement.empty() || statement[0] == '#') continue;
    bool last = i + 1 == lines.size();
    std::string args;
    std::string text;
    try {
      if (IsCall(statement, "print", &args)) {
        if (!IsLiteral(args, &text)) {
          text = std::to_string(Evaluator(args, vars_).Evaluate());
        }
        Emit(kernel::kIopub, "stream",
             {{"name", "stdout"}, {"text", text + "\n"}}, parent, at);
      } else if (IsCall(statement, "sleep", &args)) {
        at += std::chrono::milliseconds(
            static_cast<int64_t>(std::stod(args) * 1000));
      } else if (IsCall(statement, "show_png", &args)) {
        Emit(kernel::kIopub, "display_data",
             {{"data", {{"image/png", kPngData}, {"text/plain", "<Figure>"}}},
              {"metadata", nlohmann::json::object()}},
             parent, at);
      } else if (IsCall(statement, "save", &args)) {
        size_t comma = args.find(',');
        std::string name;
        if (comma == std::string::npos ||
            !IsLiteral(util::trim(args.substr(0, comma)), &name)) {
          throw EvalError{"TypeError", "save() takes a name and a value"};
        }
        int64_t value =
            Evaluator(util::trim(args.substr(comma + 1)), vars_).Evaluate();
        util::File::WriteAll(
            util::File::JoinPath(workspace_, "outputs/" + name),
            std::to_string(value));
      } else if (IsCall(statement, "spoof_reply", &args)) {
        Emit(kernel::kShell, "execute_reply",
             {{"status", 1}, {"execution_count", "x"}}, parent, at);
        Emit(kernel::kIopub, "stream", {{"name", 2}, {"text", {{"a", 1}}}},
             parent, at);
        Emit(kernel::kIopub, "status", {{"execution_state", false}}, parent,
             at);
      } else if (IsCall(statement, "crash", &args)) {
        crashed_ = true;
        error_output_ = "Fatal Python error: Aborted";
        return;
      } else if (statement.find('=') != std::string::npos &&
                 statement.find("==") == std::string::npos &&
                 IsIdentifier(util::trim(
                     statement.substr(0, statement.find('='))))) {
        size_t eq = statement.find('=');
        vars_[util::trim(statement.substr(0, eq))] =
            Evaluator(util::trim(statement.substr(eq + 1)), vars_).Evaluate();
      } else {
        int64_t value = Evaluator(statement, vars_).Evaluate();
        if (last) {
          Emit(kernel::kIopub, "execute_result",
               {{"data", {{"text/plain", std::to_string(value)}}},
                {"metadata", nlohmann::json::object()},
                {"execution_count", execution_count_}},
               parent, at);
        }
      }
    } catch (const EvalError& e) {
      failed = true;
      error = e;
    }
  }

  if (failed) {
    nlohmann::json content = {
        {"ename", error.name},
        {"evalue", error.value},
        {"traceback",
         {"Traceback (most recent call last):",
          error.name + ": " + error.value}}};
    Emit(kernel::kIopub, "error", content, parent, at);
    content["status"] = "error";
    content["execution_count"] = execution_count_;
    Emit(kernel::kShell, "execute_reply", content, parent, at);
  } else {
    Emit(kernel::kShell, "execute_reply",
         {{"status", "ok"}, {"execution_count", execution_count_}}, parent,
         at);
  }
  Emit(kernel::kIopub, "status", {{"execution_state", "idle"}}, parent, at);
}

util::LineChannel::ReadStatus FakeKernel::ReadLine(
    std::string* line, std::chrono::milliseconds timeout) {
  auto deadline = steady_clock::now() + timeout;
  while (true) {
    auto now = steady_clock::now();
    {
      std::lock_guard<std::mutex> lck(mutex_);
      if (closed_ || !*alive_) return ReadStatus::CLOSED;
      if (!pending_.empty() && pending_.front().ready_at <= now) {
        *line = pending_.front().line;
        pending_.pop_front();
        return ReadStatus::LINE;
      }
      if (pending_.empty() && crashed_) {
        closed_ = true;
        return ReadStatus::CLOSED;
      }
    }
    if (now >= deadline) return ReadStatus::TIMEOUT;
    std::this_thread::sleep_for(
        std::min<steady_clock::duration>(std::chrono::milliseconds(5),
                                         deadline - now));
  }
}

void FakeKernel::Close() {
  std::lock_guard<std::mutex> lck(mutex_);
  closed_ = true;
}

/*
 * FakeHost
 */

void FakeHost::Record(const std::vector<std::string>& argv) {
  std::lock_guard<std::mutex> lck(mutex_);
  commands_.push_back(argv);
}

util::ProcessResult FakeHost::Run(const std::vector<std::string>& argv,
                                  const std::string& stdin_data,
                                  std::chrono::milliseconds timeout) {
  Record(argv);
  return Dispatch(argv, stdin_data, timeout, false);
}

util::ProcessResult FakeHost::Dispatch(const std::vector<std::string>& argv,
                                       const std::string& stdin_data,
                                       std::chrono::milliseconds timeout,
                                       bool in_vm) {
  const std::string& tool = argv.at(0);
  bool engine = tool == "docker" || tool == "podman";
  if (engine || tool == "limactl" || tool == "wsl") {
    bool installed;
    {
      std::lock_guard<std::mutex> lck(mutex_);
      installed = installed_.count(tool) > 0 || (in_vm && engine);
    }
    if (!installed) {
      throw std::system_error(ENOENT, std::system_category(), "spawn " + tool);
    }
    std::vector<std::string> args(argv.begin() + 1, argv.end());
    if (tool == "limactl") return Lima(args, stdin_data, timeout);
    if (engine) return Docker(args, stdin_data, timeout, in_vm);
    return Exit(1, "", "wsl is not emulated");
  }
  return real_.Run(argv, stdin_data, timeout);
}

util::ProcessResult FakeHost::Lima(const std::vector<std::string>& args,
                                   const std::string& stdin_data,
                                   std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lck(mutex_);
  const std::string command = args.empty() ? "" : args[0];
  if (command == "--version") return Exit(0, "limactl version 1.0.0\n");
  if (command == "list") {
    return Exit(0, vm_status_.empty() ? "" : vm_status_ + "\n");
  }
  if (command == "create") {
    vm_status_ = "Stopped";
    return Exit(0);
  }
  if (command == "start") {
    if (vm_start_failures_ > 0) {
      vm_start_failures_--;
      return Exit(1, "", "level=fatal msg=\"failed to start the instance\"");
    }
    vm_status_ = "Running";
    return Exit(0);
  }
  if (command == "stop") {
    vm_status_ = "Stopped";
    return Exit(0);
  }
  if (command == "shell" && args.size() > 2) {
    if (vm_status_ != "Running") {
      return Exit(1, "", "instance is not running");
    }
    lck.unlock();
    return Dispatch(std::vector<std::string>(args.begin() + 2, args.end()),
                    stdin_data, timeout, true);
  }
  return Exit(1, "", "unknown limactl command");
}

util::ProcessResult FakeHost::Docker(const std::vector<std::string>& args,
                                     const std::string& stdin_data,
                                     std::chrono::milliseconds timeout,
                                     bool in_vm) {
  std::unique_lock<std::mutex> lck(mutex_);
  const std::string command = args.empty() ? "" : args[0];
  if (command == "info") {
    if (!engine_responsive_ && !in_vm) {
      return Exit(1, "", "Cannot connect to the Docker daemon");
    }
    return Exit(0, "Server Version: 24.0.0\n");
  }
  if (command == "image" && args.size() == 3 && args[1] == "inspect") {
    return images_.count(args[2]) ? Exit(0, "[]")
                                  : Exit(1, "", "Error: No such image");
  }
  if (command == "pull" && args.size() == 2) {
    if (fail_pull_) return Exit(1, "", "pull access denied");
    images_.insert(args[1]);
    return Exit(0);
  }
  if (command == "run") {
    std::string name;
    std::string workspace;
    for (size_t i = 1; i + 1 < args.size(); i++) {
      if (args[i] == "--name") name = args[i + 1];
      std::string suffix = std::string(":") + backend::kContainerWorkspace;
      if (args[i] == "-v" && args[i + 1].size() > suffix.size() &&
          args[i + 1].compare(args[i + 1].size() - suffix.size(),
                              suffix.size(), suffix) == 0) {
        workspace = args[i + 1].substr(0, args[i + 1].size() - suffix.size());
      }
    }
    if (fail_run_) {
      return Exit(125, "", "docker: Error response from daemon: no memory");
    }
    if (containers_.count(name)) {
      return Exit(125, "", "Conflict. The container name is already in use");
    }
    containers_[name] = {workspace, std::make_shared<std::atomic<bool>>(true)};
    return Exit(0, util::randomId(64) + "\n");
  }
  if (command == "exec" && args.size() > 2) {
    size_t i = 1;
    if (args[i] == "-i") i++;
    std::string name = args[i++];
    auto container = containers_.find(name);
    if (container == containers_.end() || !*container->second.alive) {
      return Exit(1, "", "Error: No such container: " + name);
    }
    std::vector<std::string> argv(args.begin() + i, args.end());
    std::vector<std::string> command_line = argv;
    if (command_line.size() > 4 && command_line[0] == "timeout") {
      command_line.erase(command_line.begin(), command_line.begin() + 4);
    }
    auto install =
        std::find(command_line.begin(), command_line.end(), "install");
    if (!command_line.empty() && command_line[0] == "python" &&
        install != command_line.end()) {
      for (auto it = install + 1; it != command_line.end(); ++it) {
        if (util::startsWith(*it, "-")) continue;
        std::string base = it->substr(0, it->find_first_of("=<>!~"));
        if (failing_packages_.count(base)) {
          return Exit(1, "",
                      "ERROR: No matching distribution found for " + *it);
        }
      }
      std::chrono::milliseconds delay = install_delay_;
      lck.unlock();
      std::this_thread::sleep_for(delay);
      return Exit(0, "Successfully installed\n");
    }
    std::string workspace = container->second.workspace;
    lck.unlock();
    for (std::string& arg : argv) {
      if (util::startsWith(arg, backend::kContainerWorkspace)) {
        arg = workspace + arg.substr(strlen(backend::kContainerWorkspace));
      }
    }
    return real_.Run(argv, stdin_data, timeout);
  }
  if (command == "rm" && args.size() > 1) {
    auto container = containers_.find(args.back());
    if (container == containers_.end()) {
      return Exit(1, "", "Error: No such container: " + args.back());
    }
    *container->second.alive = false;
    containers_.erase(container);
    return Exit(0, args.back() + "\n");
  }
  if (command == "ps") {
    std::string out;
    for (const auto& container : containers_) out += container.first + "\n";
    return Exit(0, out);
  }
  return Exit(1, "", "unknown docker command");
}

std::unique_ptr<util::LineChannel> FakeHost::Spawn(
    const std::vector<std::string>& argv) {
  Record(argv);
  if (argv.size() > 3 && argv[0] == "limactl" && argv[1] == "shell") {
    return Spawn(std::vector<std::string>(argv.begin() + 3, argv.end()));
  }
  if (argv.size() > 3 && argv[0] == "docker" && argv[1] == "exec") {
    std::lock_guard<std::mutex> lck(mutex_);
    auto container = containers_.find(argv[3]);
    if (container == containers_.end()) {
      return std::unique_ptr<util::LineChannel>(new FakeKernel(
          "", std::make_shared<std::atomic<bool>>(false)));
    }
    return std::unique_ptr<util::LineChannel>(new FakeKernel(
        container->second.workspace, container->second.alive));
  }
  return real_.Spawn(argv);
}

void FakeHost::SetInstalled(const std::set<std::string>& tools) {
  std::lock_guard<std::mutex> lck(mutex_);
  installed_ = tools;
}

void FakeHost::SetEngineResponsive(bool responsive) {
  std::lock_guard<std::mutex> lck(mutex_);
  engine_responsive_ = responsive;
}

void FakeHost::SetFailPull(bool fail) {
  std::lock_guard<std::mutex> lck(mutex_);
  fail_pull_ = fail;
}

void FakeHost::SetFailRun(bool fail) {
  std::lock_guard<std::mutex> lck(mutex_);
  fail_run_ = fail;
}

void FakeHost::SetFailingPackages(const std::set<std::string>& packages) {
  std::lock_guard<std::mutex> lck(mutex_);
  failing_packages_ = packages;
}

void FakeHost::SetInstallDelay(std::chrono::milliseconds delay) {
  std::lock_guard<std::mutex> lck(mutex_);
  install_delay_ = delay;
}

void FakeHost::SetVmStatus(const std::string& status) {
  std::lock_guard<std::mutex> lck(mutex_);
  vm_status_ = status;
}

void FakeHost::SetVmStartFailures(int32_t n) {
  std::lock_guard<std::mutex> lck(mutex_);
  vm_start_failures_ = n;
}

void FakeHost::AddOrphan(const std::string& name) {
  std::lock_guard<std::mutex> lck(mutex_);
  containers_[name] = {"", std::make_shared<std::atomic<bool>>(true)};
}

std::vector<std::vector<std::string>> FakeHost::Commands() {
  std::lock_guard<std::mutex> lck(mutex_);
  return commands_;
}

size_t FakeHost::Count(const std::string& tool,
                       const std::string& subcommand) {
  std::lock_guard<std::mutex> lck(mutex_);
  size_t count = 0;
  for (const auto& argv : commands_) {
    if (argv.size() > 1 && argv[0] == tool && argv[1] == subcommand) count++;
  }
  return count;
}

std::set<std::string> FakeHost::Containers() {
  std::lock_guard<std::mutex> lck(mutex_);
  std::set<std::string> names;
  for (const auto& container : containers_) names.insert(container.first);
  return names;
}

std::string FakeHost::WorkspaceOf(const std::string& container) {
  std::lock_guard<std::mutex> lck(mutex_);
  auto it = containers_.find(container);
  return it == containers_.end() ? "" : it->second.workspace;
}

std::string FakeHost::VmStatus() {
  std::lock_guard<std::mutex> lck(mutex_);
  return vm_status_;
}

}  // namespace fake
