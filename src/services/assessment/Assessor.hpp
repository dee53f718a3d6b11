#pragma once
#include <map>
#include <optional>
#include <string>

#include "core/expectations/AssessmentMode.hpp"

namespace sigdrift {

static constexpr char kOriginatorProperty[] = "assessment:originator";

struct AssessmentResult {
  int status = 0;
  // flattened top-level entries of the tool's property list output
  std::optional<std::map<std::string, std::string>> properties;
  std::string diagnostics;
};

// Platform signature assessment. Blocking; no timeout.
class Assessor {
public:
  virtual ~Assessor() = default;
  virtual AssessmentResult assess(const std::string& path, AssessmentMode mode) = 0;
};

} // namespace sigdrift
