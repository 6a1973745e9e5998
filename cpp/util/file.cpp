#include "util/file.hpp"

#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/io.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <system_error>

#if defined(__unix__) || defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <ftw.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

const constexpr char* kPathSeparators = "/";
const constexpr size_t kReadBufSize = 64 * 1024;

bool MkDir(const std::string& dir) {
  return mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IXOTH) != -1 ||
         errno == EEXIST;
}

bool OsRemove(const std::string& path) { return remove(path.c_str()) != -1; }

std::vector<std::string> OsListFiles(const std::string& path) {
  thread_local std::vector<std::string> files;
  files.clear();
  KJ_ASSERT(nftw(path.c_str(),
                 [](const char* fpath, const struct stat* /*sb*/,
                    int typeflags, struct FTW* /*ftwbuf*/) {
                   if (typeflags != FTW_F) return 0;
                   files.emplace_back(fpath);
                   return 0;
                 },
                 64, FTW_PHYS | FTW_MOUNT) != -1,
            path, strerror(errno));
  std::vector<std::string> ret = std::move(files);
  files.clear();
  std::sort(ret.begin(), ret.end());
  return ret;
}

bool OsRemoveTree(const std::string& path) {
  return nftw(path.c_str(),
              [](const char* fpath, const struct stat* /*sb*/,
                 int /*typeflags*/,
                 struct FTW* /*ftwbuf*/) { return remove(fpath); },
              64, FTW_DEPTH | FTW_PHYS | FTW_MOUNT) != -1;
}

bool OsMakeShared(const std::string& path) {
  return chmod(path.c_str(), S_IRWXU | S_IRWXG | S_IRWXO) != -1;
}

const size_t max_path_len = 1 << 15;
std::string OsTempDir(const std::string& path) {
  std::string tmp = util::File::JoinPath(path, "XXXXXX");
  KJ_REQUIRE(tmp.size() < max_path_len, tmp.size(), max_path_len,
             "Path too long");
  char data[max_path_len + 1];
  data[0] = 0;
  strncat(data, tmp.c_str(), max_path_len - 1);  // NOLINT
  if (mkdtemp(data) == nullptr)                  // NOLINT
    return "";
  return data;  // NOLINT
}

kj::AutoCloseFd OsTempFile(const std::string& path, std::string* tmp) {
  *tmp = path + ".XXXXXX";
  char data[max_path_len];
  data[0] = 0;
  strncat(data, tmp->c_str(), max_path_len - 1);  // NOLINT
  int fd = mkostemp(data, O_CLOEXEC);             // NOLINT
  *tmp = data;                                    // NOLINT
  return kj::AutoCloseFd(fd);
}

std::string OsReadString(const std::string& path) {
  kj::AutoCloseFd fd{open(path.c_str(), O_CLOEXEC | O_RDONLY)};  // NOLINT
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Read " + path);
  }
  std::string content;
  char buf[kReadBufSize];
  while (true) {
    ssize_t amount = read(fd, buf, sizeof(buf));  // NOLINT
    if (amount == -1 && errno == EINTR) continue;
    if (amount == -1) {
      throw std::system_error(errno, std::system_category(), "Read " + path);
    }
    if (amount == 0) return content;
    content.append(buf, amount);
  }
}

// Writes content to a temporary file next to path, then renames it over
// path: readers never see a partial file.
void OsWriteString(const std::string& path, const std::string& content) {
  std::string temp_file;
  kj::AutoCloseFd fd = OsTempFile(path, &temp_file);
  if (fd.get() == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  bool done = false;
  KJ_DEFER(if (!done) OsRemove(temp_file));
  if (fchmod(fd, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH) == -1) {
    throw std::system_error(errno, std::system_category(), "fchmod " + path);
  }
  size_t pos = 0;
  while (pos < content.size()) {
    ssize_t written = write(fd, content.data() + pos,  // NOLINT
                            content.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      throw std::system_error(errno, std::system_category(),
                              "write " + temp_file);
    }
    pos += written;
  }
  if (fsync(fd) == -1 || rename(temp_file.c_str(), path.c_str()) == -1) {
    throw std::system_error(errno, std::system_category(), "Write " + path);
  }
  done = true;
}

int OsFileType(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) return 0;
  return st.st_mode & S_IFMT;
}

}  // namespace
#endif

namespace util {
std::vector<std::string> File::ListFiles(const std::string& path) {
  MakeDirs(path);
  return OsListFiles(path);
}

std::string File::ReadString(const std::string& path) {
  return OsReadString(path);
}

void File::WriteString(const std::string& path, const std::string& content) {
  MakeDirs(BaseDir(path));
  OsWriteString(path, content);
}

void File::MakeDirs(const std::string& path) {
  if (path.empty()) return;
  uint64_t pos = 0;
  while (pos != std::string::npos) {
    pos = path.find_first_of(kPathSeparators, pos + 1);
    if (!MkDir(path.substr(0, pos))) {
      throw std::system_error(errno, std::system_category(), "mkdir " + path);
    }
  }
}

void File::Remove(const std::string& path) {
  if (!OsRemove(path)) {
    throw std::system_error(errno, std::system_category(), "remove " + path);
  }
}

void File::RemoveTree(const std::string& path) {
  if (!OsRemoveTree(path)) {
    throw std::system_error(errno, std::system_category(),
                            "removetree " + path);
  }
}

void File::MakeShared(const std::string& path) {
  if (!OsMakeShared(path)) {
    throw std::system_error(errno, std::system_category(), "chmod " + path);
  }
}

std::string File::JoinPath(const std::string& first,
                           const std::string& second) {
  if (second.empty()) return first;
  if (first.empty()) return second;
  if (strchr(kPathSeparators, second[0]) != nullptr) return second;
  if (strchr(kPathSeparators, first.back()) != nullptr) return first + second;
  return first + kPathSeparators[0] + second;  // NOLINT
}

std::string File::BaseDir(const std::string& path) {
  if (path.find_last_of(kPathSeparators) == std::string::npos) return "";
  return path.substr(0, path.find_last_of(kPathSeparators));
}

std::string File::BaseName(const std::string& path) {
  return path.substr(path.find_last_of(kPathSeparators) + 1);
}

int64_t File::Size(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return -1;
  }
  return st.st_size;
}

bool File::IsRegular(const std::string& path) {
  return OsFileType(path) == S_IFREG;
}

TempDir::TempDir(const std::string& base) {
  File::MakeDirs(base);
  path_ = OsTempDir(base);
  if (path_.empty()) {
    throw std::system_error(errno, std::system_category(), "mkdtemp");
  }
}
void TempDir::Keep() { keep_ = true; }
const std::string& TempDir::Path() const { return path_; }
TempDir::~TempDir() {  // NOLINT
  if (!keep_ && !moved_) {
    kj::UnwindDetector detector;
    detector.catchExceptionsIfUnwinding([&]() { File::RemoveTree(path_); });
  }
}

}  // namespace util
