#pragma once
#include <string>
#include <utility>
#include <vector>

#include "Assessor.hpp"

namespace sigdrift {

// Runs the platform assessment tool ("spctl --assess --raw") as a child
// process and parses its property list output.
class SpctlAssessor : public Assessor {
public:
  explicit SpctlAssessor(std::string tool) : tool_(std::move(tool)) {}

  AssessmentResult assess(const std::string& path, AssessmentMode mode) override;

  std::vector<std::string> commandFor(const std::string& path, AssessmentMode mode) const;

private:
  std::string tool_;
};

struct ProcessOutput {
  int status = 0;   // exit code, 128 + signal, or 127 if it could not be started
  std::string out;
  std::string err;
};

// fork/exec argv[0] (PATH lookup) and collect stdout and stderr.
ProcessOutput run_process(const std::vector<std::string>& argv);

} // namespace sigdrift
