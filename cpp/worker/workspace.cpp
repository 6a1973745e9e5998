#include "worker/workspace.hpp"

#include <kj/debug.h>

#include "util/file.hpp"

namespace worker {

Workspace::Workspace(const std::string& root, const std::string& job_id)
    : job_dir_(job_id), path_(util::File::JoinPath(root, job_id)) {
  KJ_REQUIRE(!job_id.empty() && job_id.find('/') == std::string::npos &&
                 job_id != "." && job_id != "..",
             "Invalid job directory", job_id);
}

Workspace::~Workspace() {
  try {
    if (util::File::Exists(path_)) util::File::RemoveTree(path_);
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Could not remove workspace", path_, e.what());
  }
}

void Workspace::Prepare(const std::string& file_name,
                        const std::string& contents) {
  if (util::File::Exists(path_)) util::File::RemoveTree(path_);
  util::File::MakeDirs(path_);
  util::File::MakeShared(path_);
  std::string file = util::File::JoinPath(path_, file_name);
  util::File::WriteString(file, contents);
  util::File::MakeShared(file);
}

}  // namespace worker
