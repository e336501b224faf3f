#include "backend/resource_limits.hpp"

#include <cctype>

#include "core/errors.hpp"

namespace backend {

namespace {

bool IsMemorySize(const std::string& value) {
  size_t digits = 0;
  while (digits < value.size() &&
         isdigit(static_cast<unsigned char>(value[digits])))
    digits++;
  if (digits == 0) return false;
  if (digits == value.size()) return true;
  if (digits + 1 != value.size()) return false;
  return std::string("bkmgBKMG").find(value.back()) != std::string::npos;
}

bool IsCpuShare(const std::string& value) {
  size_t dots = 0;
  bool nonzero = false;
  for (char c : value) {
    if (c == '.') {
      dots++;
    } else if (isdigit(static_cast<unsigned char>(c))) {
      nonzero |= c != '0';
    } else {
      return false;
    }
  }
  return !value.empty() && value != "." && dots <= 1 && nonzero;
}

}  // namespace

ResourceLimits DefaultLimits() {
  ResourceLimits limits;
  limits.memory = "512m";
  limits.cpus = "1";
  limits.pids = 100;
  return limits;
}

ResourceLimits ApplyDefaults(const ResourceLimits& requested,
                             const ResourceLimits& defaults) {
  ResourceLimits ret = requested;
  if (ret.memory.empty()) ret.memory = defaults.memory;
  if (ret.cpus.empty()) ret.cpus = defaults.cpus;
  if (ret.pids == 0) ret.pids = defaults.pids;
  return ret;
}

void CheckLimits(const ResourceLimits& limits) {
  if (!limits.memory.empty() && !IsMemorySize(limits.memory)) {
    throw core::validation_error("Invalid memory limit: " + limits.memory);
  }
  if (!limits.cpus.empty() && !IsCpuShare(limits.cpus)) {
    throw core::validation_error("Invalid CPU limit: " + limits.cpus);
  }
  if (limits.pids < 0) {
    throw core::validation_error("Invalid process limit: " +
                                 std::to_string(limits.pids));
  }
}

std::vector<std::string> ToEngineFlags(const ResourceLimits& limits) {
  std::vector<std::string> flags = {
      "--memory", limits.memory, "--memory-swap", limits.memory,
      "--cpus",   limits.cpus,   "--pids-limit",  std::to_string(limits.pids)};
  if (limits.network_disabled) {
    flags.push_back("--network");
    flags.push_back("none");
  }
  return flags;
}

}  // namespace backend
