#include "AssessmentMode.hpp"

#include "core/storage/LocalPaths.hpp"

namespace sigdrift {

const char* to_string(AssessmentMode mode) {
  switch (mode) {
    case AssessmentMode::Open:    return "open";
    case AssessmentMode::Execute: return "execute";
  }
  return "execute";
}

std::optional<AssessmentMode> parse_assessment_mode(const std::string& s) {
  if (s == "open") return AssessmentMode::Open;
  if (s == "execute") return AssessmentMode::Execute;
  return std::nullopt;
}

static bool has_suffix(const std::string& s, const std::string& suffix) {
  return s.size() > suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

AssessmentMode default_mode_for(const std::string& path, const std::string& home) {
  static const char* kOpenSuffixes[] = {
    ".prefPane", ".plugin", ".bundle", ".component", ".qlgenerator", ".saver"
  };

  const bool in_library =
    is_under(path, "/Library") ||
    (!home.empty() && is_under(path, normalize_path(home) + "/Library"));
  if (!in_library) return AssessmentMode::Execute;

  for (const char* suffix : kOpenSuffixes) {
    if (has_suffix(path, suffix)) return AssessmentMode::Open;
  }
  return AssessmentMode::Execute;
}

} // namespace sigdrift
