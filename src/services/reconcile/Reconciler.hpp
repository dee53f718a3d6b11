#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "core/expectations/ExpectationStore.hpp"
#include "services/assessment/Assessor.hpp"

namespace sigdrift {

struct ReconcileOptions {
  bool allowAdd = false;     // may create records for untracked targets
  bool allowFreshen = false; // may overwrite a drifted expectation
};

enum class Outcome {
  Created,   // new record
  Unchanged, // matched, record refreshed
  Updated,   // drifted, record overwritten
  Verified,  // matched, nothing written
  Skipped,   // stored path no longer exists
  Failed
};

const char* to_string(Outcome outcome);

struct TargetReport {
  std::string target;
  std::string key;
  Outcome outcome = Outcome::Failed;
  std::string message;
};

struct RunReport {
  std::vector<TargetReport> targets;
  bool changed = false;

  bool failed() const;
  size_t count(Outcome outcome) const;
};

// Current time as UTC ISO-8601, e.g. "2024-05-01T12:00:00Z".
std::string utc_timestamp();

// Checks each target's current originator against the store and decides
// whether to record, confirm, update or fail it.
class Reconciler {
public:
  using Clock = std::function<std::string()>;

  Reconciler(ExpectationStore& store, Assessor& assessor, ReconcileOptions options,
             Clock clock = utc_timestamp);

  // An empty list reconciles every key in the store. Saves the store once
  // if any record changed.
  // Throws TargetMissingError for an explicit target that does not exist and
  // ContractError if the assessor reports success without an originator.
  RunReport run(const std::vector<std::string>& targets);

private:
  TargetReport reconcileOne(const std::string& target, bool explicitTargets, bool& changed);

  ExpectationStore& store_;
  Assessor& assessor_;
  ReconcileOptions options_;
  Clock clock_;
};

} // namespace sigdrift
