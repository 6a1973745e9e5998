#include "util/which.hpp"
#include <unistd.h>
#include <cstdlib>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {
std::unordered_map<std::string, std::string> cmd_cache;
std::mutex cmd_cache_mutex;

bool IsExecutable(const std::string& path) {
  return util::File::IsRegular(path) && access(path.c_str(), X_OK) == 0;
}
}  // namespace

namespace util {

std::string which(const std::string& cmd, bool use_cache) {
  std::lock_guard<std::mutex> lck(cmd_cache_mutex);
  if (use_cache && cmd_cache.count(cmd) > 0) return cmd_cache[cmd];

  const char* path = std::getenv("PATH");
  if (path == nullptr) return "";

  for (const std::string& dir : split(path, ':')) {
    std::string fullpath = File::JoinPath(dir, cmd);
    if (IsExecutable(fullpath)) return cmd_cache[cmd] = fullpath;
  }
  return "";
}

}  // namespace util
