#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include <cstdint>
#include <string>

struct Flags {
  // Common flags
  static bool daemon;
  static std::string pidfile;
  static std::string log_file;
  static std::string shell;

  // Sandbox pool flags
  static int32_t num_slots;
  static uint32_t max_usage;
  static std::string runtime;
  static std::string image;
  static std::string container_prefix;
  static std::string workspace_root;
  static std::string mount_point;
  static std::string memory_limit;
  static std::string cpu_limit;
  static int32_t pids_limit;

  // Executor flags
  static int32_t compile_timeout_millis;
  static int32_t run_timeout_millis;

  // Server-only flags
  static std::string listen_address;
  static int32_t port;
  static uint32_t max_finished_jobs;

  // Client-only flags
  static std::string server;
};

#endif
