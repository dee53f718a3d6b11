#pragma once
#include <optional>
#include <string>

namespace sigdrift {

// Usage context presented to the platform assessment tool.
enum class AssessmentMode { Open, Execute };

const char* to_string(AssessmentMode mode);

std::optional<AssessmentMode> parse_assessment_mode(const std::string& s);

// "open" for plug-in style bundles under a Library tree, "execute" otherwise.
AssessmentMode default_mode_for(const std::string& path, const std::string& home);

} // namespace sigdrift
