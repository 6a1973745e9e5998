#ifndef UTIL_MISC_HPP
#define UTIL_MISC_HPP
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include <kj/string.h>

namespace util {

template <typename Out>
void split(const std::string& s, char delim, Out result) {
  std::stringstream ss(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    if (!item.empty()) *(result++) = item;
  }
}
std::vector<std::string> split(const std::string& s, char delim);

// Removes leading and trailing whitespace.
std::string trim(const std::string& s);

// Quotes s so that a POSIX shell passes it through as a single word.
std::string shellQuote(const std::string& s);

// Joins the shell-quoted words with spaces.
std::string shellJoin(const std::vector<std::string>& words);

std::function<bool()> setBool(bool* var);
std::function<bool(kj::StringPtr)> setString(std::string* var);
std::function<bool(kj::StringPtr)> setInt(int32_t* var);
std::function<bool(kj::StringPtr)> setUint(uint32_t* var);

}  // namespace util
#endif
