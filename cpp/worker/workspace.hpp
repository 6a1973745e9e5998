#ifndef WORKER_WORKSPACE_HPP
#define WORKER_WORKSPACE_HPP

#include <string>

#include <kj/common.h>

namespace worker {

// Directory of a single job, <root>/<job_id>, shared with the containers.
// It is removed, with everything inside, when the object is destroyed.
class Workspace {
 public:
  Workspace(const std::string& root, const std::string& job_id);
  ~Workspace();
  KJ_DISALLOW_COPY(Workspace);

  // Recreates an empty directory containing only file_name with the given
  // contents. Files are readable and writable by every user, since the
  // compiler in the container may run as a different user.
  void Prepare(const std::string& file_name, const std::string& contents);

  const std::string& Path() const { return path_; }
  const std::string& JobDir() const { return job_dir_; }

 private:
  std::string job_dir_;
  std::string path_;
};

}  // namespace worker

#endif
