#ifndef BACKEND_RESOURCE_LIMITS_HPP
#define BACKEND_RESOURCE_LIMITS_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace backend {

// Logical limits of one isolated environment. Empty or zero fields mean "use
// the default".
struct ResourceLimits {
  std::string memory;  // e.g. "512m", "2G"
  std::string cpus;    // e.g. "1", "0.5"
  int32_t pids = 0;
  bool network_disabled = false;
};

// The limits used when a caller does not specify them.
ResourceLimits DefaultLimits();

// Fills the unspecified fields of requested from defaults.
ResourceLimits ApplyDefaults(const ResourceLimits& requested,
                             const ResourceLimits& defaults);

// Throws core::validation_error if a field is malformed.
void CheckLimits(const ResourceLimits& limits);

// Container engine flags enforcing limits. Fields must be already filled.
std::vector<std::string> ToEngineFlags(const ResourceLimits& limits);

}  // namespace backend

#endif
