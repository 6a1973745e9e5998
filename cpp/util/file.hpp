#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP
#include <memory>
#include <string>
#include <vector>

#include <kj/common.h>
#include <kj/debug.h>

namespace util {

class File {
 public:
  // Lists all the regular files in a directory tree.
  static std::vector<std::string> ListFiles(const std::string& path);

  // Reads a whole file into a string.
  static std::string ReadString(const std::string& path);

  // Writes a whole string to a file, replacing it if it exists. The file
  // appears at path only once it is complete.
  static void WriteString(const std::string& path, const std::string& content);

  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Removes a file.
  static void Remove(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Makes a directory readable, writable and traversable by every user, so
  // that a sandbox running under another uid can use it.
  static void MakeShared(const std::string& path);

  // Joins two paths.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the directory name for a path
  static std::string BaseDir(const std::string& path);

  // Computes the file name for a path
  static std::string BaseName(const std::string& path);

  // Computes a file's size. Returns a negative number in case of errors.
  static int64_t Size(const std::string& path);

  // Returns true if a file exists
  static bool Exists(const std::string& path) { return Size(path) >= 0; }

  static bool IsRegular(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(TempDir&& other) noexcept { *this = std::move(other); }
  TempDir& operator=(TempDir&& other) noexcept {
    path_ = std::move(other.path_);
    keep_ = other.keep_;
    other.moved_ = true;
    return *this;
  }
  KJ_DISALLOW_COPY(TempDir);

 private:
  std::string path_;
  bool keep_ = false;
  bool moved_ = false;
};

}  // namespace util

#endif
