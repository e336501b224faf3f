#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static std::string log_file;
  static bool verbose;
  static std::string store_directory;
  static std::string temp_directory;
  static bool keep_workspaces;

  // Backend selection
  static std::string platform;
  static std::string container_engine;
  static std::string image;
  static std::string vm_name;
  static int32_t vm_memory_gib;
  static int32_t vm_cpus;
  static int32_t vm_setup_timeout;
  static int32_t vm_setup_retries;
  static int32_t vm_setup_backoff_millis;
  static int32_t command_timeout;

  // Sessions and executions
  static std::string kernel_script;
  static std::string policy_file;
  static int32_t handshake_timeout;
  static int32_t execution_timeout;
  static int32_t queue_timeout;
  static int32_t idle_timeout;
  static int32_t sweep_interval;
  static int32_t artifact_retention_hours;
  static int32_t num_workers;

  // Server-only flags
  static std::string listen_address;
  static int32_t port;
};

#endif
