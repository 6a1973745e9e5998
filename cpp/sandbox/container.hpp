#ifndef SANDBOX_CONTAINER_HPP
#define SANDBOX_CONTAINER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace sandbox {

struct ContainerConfig {
  std::string runtime = "docker";
  std::string image = "eclipse-temurin:17-jdk";
  std::string name_prefix = "compile-executor-";
  // Directory of the host mounted into every container at mount_point.
  std::string host_root = "/tmp/compiler";
  std::string mount_point = "/app";
  int32_t pids_limit = 100;
  std::string memory = "512m";
  std::string cpus = "0.8";
};

// Builds the command lines used to drive the container runtime. Every
// argument is shell-quoted, so the result can be passed to a Runner as is.
class ContainerCommands {
 public:
  explicit ContainerCommands(ContainerConfig config)
      : config_(std::move(config)) {}

  // Name of the container backing the given slot.
  std::string Name(size_t index) const;

  // Starts a detached, idle container without network access.
  std::string Create(const std::string& name) const;
  std::string Remove(const std::string& name) const;
  // Lists the names of all the containers, one per line.
  std::string List() const;
  std::string Probe(const std::string& name) const;

  // Runs argv inside the container, with <mount_point>/<job_dir> as working
  // directory.
  std::string Exec(const std::string& name, const std::string& job_dir,
                   const std::vector<std::string>& argv) const;

  // Names in the output of List() that carry our prefix.
  std::vector<std::string> ParseList(const std::string& output) const;

  // Whether the output of Probe() says that the container is running.
  static bool ParseProbe(const std::string& output);

  // Exit codes of an exec that come from the runtime rather than from the
  // command: 125 (runtime error), 126 (not invocable), 127 (not found).
  static bool IsRuntimeError(int32_t exit_code);

  const ContainerConfig& Config() const { return config_; }

 private:
  ContainerConfig config_;
};

}  // namespace sandbox

#endif
