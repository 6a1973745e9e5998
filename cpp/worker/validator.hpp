#ifndef WORKER_VALIDATOR_HPP
#define WORKER_VALIDATOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace worker {

// Maximum length of a source, in characters.
static const constexpr size_t kMaxCodeLength = 10000;

// Number of characters (code points) in an UTF-8 string.
size_t Utf8Length(const std::string& text);

// The source uses an API that submissions may not touch.
class SecurityViolation : public std::runtime_error {
 public:
  explicit SecurityViolation(std::string keyword)
      : std::runtime_error("Forbidden keyword detected: " + keyword),
        keyword_(std::move(keyword)) {}
  const std::string& keyword() const { return keyword_; }

 private:
  std::string keyword_;
};

// Forbidden keywords, in the order in which they are checked.
const std::vector<std::string>& ForbiddenKeywords();

// Throws SecurityViolation with the first forbidden keyword (in list order)
// that occurs anywhere in source, comments and string literals included.
void ValidateCode(const std::string& source);

}  // namespace worker

#endif
