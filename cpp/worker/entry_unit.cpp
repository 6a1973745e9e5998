#include "worker/entry_unit.hpp"

#include <iterator>
#include <regex>

namespace worker {

namespace {
const std::regex& EntryPointRegex() {
  static const std::regex re(R"(public\s+static\s+void\s+main\s*\()");
  return re;
}
const std::regex& UnitRegex() {
  static const std::regex re(R"((public\s+)?class\s+(\w+))");
  return re;
}
}  // namespace

const char* ResolutionError::Message(Kind kind) {
  switch (kind) {
    case NO_ENTRY_POINT:
      return "no main method found";
    case AMBIGUOUS_ENTRY_POINT:
      return "only one main method is allowed";
    case NO_OWNING_UNIT:
      return "no class declaration owns the main method";
  }
  return "unknown resolution error";
}

std::string ResolveEntryUnit(const std::string& source) {
  auto begin =
      std::sregex_iterator(source.begin(), source.end(), EntryPointRegex());
  auto end = std::sregex_iterator();
  if (begin == end) throw ResolutionError(ResolutionError::NO_ENTRY_POINT);
  size_t entry_pos = begin->position();
  if (std::next(begin) != end) {
    throw ResolutionError(ResolutionError::AMBIGUOUS_ENTRY_POINT);
  }

  std::string unit;
  std::string head = source.substr(0, entry_pos);
  for (auto it = std::sregex_iterator(head.begin(), head.end(), UnitRegex());
       it != end; ++it) {
    unit = (*it)[2].str();
  }
  if (unit.empty()) throw ResolutionError(ResolutionError::NO_OWNING_UNIT);
  return unit;
}

}  // namespace worker
