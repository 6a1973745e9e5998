#include "util/flags.hpp"

bool Flags::daemon = false;
std::string Flags::pidfile;
std::string Flags::log_file;
std::string Flags::shell;

int32_t Flags::num_slots = 2;
uint32_t Flags::max_usage = 100;
std::string Flags::runtime = "docker";
std::string Flags::image = "eclipse-temurin:17-jdk";
std::string Flags::container_prefix = "compile-executor-";
std::string Flags::workspace_root = "/tmp/compiler";
std::string Flags::mount_point = "/app";
std::string Flags::memory_limit = "512m";
std::string Flags::cpu_limit = "0.8";
int32_t Flags::pids_limit = 100;

int32_t Flags::compile_timeout_millis = 10000;
int32_t Flags::run_timeout_millis = 5000;

std::string Flags::listen_address = "0.0.0.0";
int32_t Flags::port = 7071;
uint32_t Flags::max_finished_jobs = 1000;

std::string Flags::server = "127.0.0.1";
