#include "sandbox/runner.hpp"

#include <kj/debug.h>

#include "util/file.hpp"
#include "util/which.hpp"

namespace sandbox {

namespace {
const constexpr char* kDefaultShell = "/bin/sh";
}  // namespace

Shell Shell::Detect(const std::string& preferred) {
  std::string program = preferred;
  if (program.empty()) {
    program = util::File::IsRegular(kDefaultShell) ? kDefaultShell
                                                   : util::which("sh");
  } else if (program.find('/') == std::string::npos) {
    program = util::which(program);
  }
  KJ_REQUIRE(!program.empty() && util::File::IsRegular(program),
             "No usable shell found", preferred);
  KJ_LOG(INFO, "Using shell", program);
  return Shell{program, "-c"};
}

}  // namespace sandbox
