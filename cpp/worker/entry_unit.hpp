#ifndef WORKER_ENTRY_UNIT_HPP
#define WORKER_ENTRY_UNIT_HPP

#include <stdexcept>
#include <string>

namespace worker {

// The entry unit of a source could not be determined.
class ResolutionError : public std::runtime_error {
 public:
  enum Kind { NO_ENTRY_POINT, AMBIGUOUS_ENTRY_POINT, NO_OWNING_UNIT };

  explicit ResolutionError(Kind kind)
      : std::runtime_error(Message(kind)), kind_(kind) {}
  Kind kind() const { return kind_; }

  static const char* Message(Kind kind);

 private:
  Kind kind_;
};

// Returns the name of the class that owns the only main method of source:
// the last class declaration that precedes it in the text. This is a textual
// heuristic, not a parse: declarations and signatures inside comments or
// string literals are counted too. The matcher recurses on long whitespace
// runs: callers bound the source length (see kMaxCodeLength).
std::string ResolveEntryUnit(const std::string& source);

}  // namespace worker

#endif
