#include "backend/host.hpp"

namespace backend {

util::ProcessResult NativeHost::Run(const std::vector<std::string>& argv,
                                    const std::string& stdin_data,
                                    std::chrono::milliseconds timeout) {
  return util::RunProcess(argv, stdin_data, timeout);
}

std::unique_ptr<util::LineChannel> NativeHost::Spawn(
    const std::vector<std::string>& argv) {
  return util::ChildProcess::Spawn(argv);
}

std::string FormatCommand(const std::vector<std::string>& argv) {
  std::string ret;
  for (const std::string& arg : argv) {
    if (!ret.empty()) ret += ' ';
    if (arg.empty() || arg.find_first_of(" \t\n'\"\\$") != std::string::npos) {
      ret += '\'';
      for (char c : arg) {
        if (c == '\'')
          ret += "'\\''";
        else
          ret += c;
      }
      ret += '\'';
    } else {
      ret += arg;
    }
  }
  return ret;
}

}  // namespace backend
