#include "util/flags.hpp"

#ifndef CODEBOX_KERNEL_SCRIPT
#define CODEBOX_KERNEL_SCRIPT "kernel/codebox_kernel.py"
#endif

std::string Flags::log_file;
bool Flags::verbose = false;
std::string Flags::store_directory = "files";
std::string Flags::temp_directory = "temp";
bool Flags::keep_workspaces = false;

std::string Flags::platform = "auto";
std::string Flags::container_engine = "docker";
std::string Flags::image = "python:3.11-slim";
std::string Flags::vm_name = "codebox";
int32_t Flags::vm_memory_gib = 4;
int32_t Flags::vm_cpus = 2;
int32_t Flags::vm_setup_timeout = 300;
int32_t Flags::vm_setup_retries = 3;
int32_t Flags::vm_setup_backoff_millis = 2000;
int32_t Flags::command_timeout = 120;

std::string Flags::kernel_script = CODEBOX_KERNEL_SCRIPT;
std::string Flags::policy_file;
int32_t Flags::handshake_timeout = 30;
int32_t Flags::execution_timeout = 300;
int32_t Flags::queue_timeout = 600;
int32_t Flags::idle_timeout = 3600;
int32_t Flags::sweep_interval = 60;
int32_t Flags::artifact_retention_hours = 24;
int32_t Flags::num_workers = 0;

std::string Flags::listen_address = "0.0.0.0";
int32_t Flags::port = 7080;
