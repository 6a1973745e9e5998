#include "worker/validator.hpp"

namespace worker {

const std::vector<std::string>& ForbiddenKeywords() {
  static const std::vector<std::string> keywords = {
      "System.exit",    "Runtime.getRuntime", "ProcessBuilder",
      "java.io.File",   "java.nio.file",      "java.net",
      "java.lang.reflect", "sun.misc.Unsafe", "Thread",
      "ForkJoinPool"};
  return keywords;
}

size_t Utf8Length(const std::string& text) {
  size_t length = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) length++;
  }
  return length;
}

void ValidateCode(const std::string& source) {
  for (const std::string& keyword : ForbiddenKeywords()) {
    if (source.find(keyword) != std::string::npos) {
      throw SecurityViolation(keyword);
    }
  }
}

}  // namespace worker
