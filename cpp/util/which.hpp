#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which: returns the first executable
// file called cmd in the directories listed in PATH, or an empty string.
// Positive lookups are cached unless use_cache is false; a cached path is
// returned even if the file was removed afterwards.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
