#include "sandbox/container.hpp"

#include "util/misc.hpp"

namespace sandbox {

std::string ContainerCommands::Name(size_t index) const {
  return config_.name_prefix + std::to_string(index);
}

std::string ContainerCommands::Create(const std::string& name) const {
  return util::shellJoin({config_.runtime, "run", "-d", "--name", name,
                          "--network", "none", "--pids-limit",
                          std::to_string(config_.pids_limit), "--cap-drop",
                          "ALL", "--memory", config_.memory, "--cpus",
                          config_.cpus, "-v",
                          config_.host_root + ":" + config_.mount_point,
                          config_.image, "tail", "-f", "/dev/null"});
}

std::string ContainerCommands::Remove(const std::string& name) const {
  return util::shellJoin({config_.runtime, "rm", "-f", name});
}

std::string ContainerCommands::List() const {
  return util::shellJoin({config_.runtime, "ps", "-a", "--filter",
                          "name=^" + config_.name_prefix, "--format",
                          "{{.Names}}"});
}

std::string ContainerCommands::Probe(const std::string& name) const {
  return util::shellJoin(
      {config_.runtime, "inspect", "-f", "{{.State.Running}}", name});
}

std::string ContainerCommands::Exec(
    const std::string& name, const std::string& job_dir,
    const std::vector<std::string>& argv) const {
  std::vector<std::string> words = {config_.runtime, "exec", "-w",
                                    config_.mount_point + "/" + job_dir, name};
  words.insert(words.end(), argv.begin(), argv.end());
  return util::shellJoin(words);
}

std::vector<std::string> ContainerCommands::ParseList(
    const std::string& output) const {
  std::vector<std::string> names;
  for (const std::string& line : util::split(output, '\n')) {
    std::string name = util::trim(line);
    // The runtime filter is a regex match: check the prefix again.
    if (name.compare(0, config_.name_prefix.size(), config_.name_prefix) == 0 &&
        name.size() > config_.name_prefix.size()) {
      names.push_back(name);
    }
  }
  return names;
}

bool ContainerCommands::ParseProbe(const std::string& output) {
  return util::trim(output) == "true";
}

bool ContainerCommands::IsRuntimeError(int32_t exit_code) {
  return exit_code == 125 || exit_code == 126 || exit_code == 127;
}

}  // namespace sandbox
