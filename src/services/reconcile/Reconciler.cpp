#include "Reconciler.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <utility>

#include "core/Errors.hpp"
#include "core/expectations/OriginatorPattern.hpp"
#include "core/storage/LocalPaths.hpp"

namespace sigdrift {

const char* to_string(Outcome outcome) {
  switch (outcome) {
    case Outcome::Created:   return "created";
    case Outcome::Unchanged: return "unchanged";
    case Outcome::Updated:   return "updated";
    case Outcome::Verified:  return "verified";
    case Outcome::Skipped:   return "skipped";
    case Outcome::Failed:    return "failed";
  }
  return "failed";
}

bool RunReport::failed() const {
  return count(Outcome::Failed) != 0;
}

size_t RunReport::count(Outcome outcome) const {
  return static_cast<size_t>(std::count_if(targets.begin(), targets.end(),
    [outcome](const TargetReport& t) { return t.outcome == outcome; }));
}

std::string utc_timestamp() {
  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  gmtime_r(&now, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

Reconciler::Reconciler(ExpectationStore& store, Assessor& assessor, ReconcileOptions options,
                       Clock clock)
  : store_(store), assessor_(assessor), options_(options), clock_(std::move(clock)) {}

RunReport Reconciler::run(const std::vector<std::string>& targets) {
  const bool explicitTargets = !targets.empty();
  const std::vector<std::string> work = explicitTargets ? targets : store_.keys();

  RunReport report;
  for (const auto& target : work) {
    report.targets.push_back(reconcileOne(target, explicitTargets, report.changed));
  }

  if (report.changed) store_.save();
  return report;
}

TargetReport Reconciler::reconcileOne(const std::string& target, bool explicitTargets, bool& changed) {
  TargetReport rep;
  rep.target = target;

  const ResolvedKey resolved = store_.resolve(target);
  rep.key = resolved.key;

  auto fail = [&](std::string message) {
    spdlog::error("{}: {}", rep.key, message);
    rep.outcome = Outcome::Failed;
    rep.message = std::move(message);
    return rep;
  };

  if (!path_exists(resolved.path)) {
    if (explicitTargets) throw TargetMissingError("no such file or directory: " + resolved.path);
    spdlog::debug("{}: {} is gone, skipping", rep.key, resolved.path);
    rep.outcome = Outcome::Skipped;
    rep.message = "not present";
    return rep;
  }

  std::optional<ExpectationRecord> existing = store_.get(resolved.key);
  const bool isNew = !existing;
  if (isNew && !explicitTargets) {
    throw std::logic_error("store enumeration produced unknown key " + resolved.key);
  }
  if (isNew && !options_.allowAdd) return fail("untracked, and adding is disabled");

  ExpectationRecord record = existing ? std::move(*existing) : ExpectationRecord{};
  const bool willPersist = isNew || options_.allowFreshen;

  const AssessmentMode mode =
    record.assessment_type.value_or(default_mode_for(resolved.path, store_.home()));
  spdlog::debug("{}: assessing {} as {}", rep.key, resolved.path, to_string(mode));

  const AssessmentResult result = assessor_.assess(resolved.path, mode);
  if (result.status != 0) {
    std::string message = "assessment failed with status " + std::to_string(result.status);
    if (!result.diagnostics.empty()) message += ": " + result.diagnostics;
    return fail(std::move(message));
  }

  if (!result.properties || result.properties->count(kOriginatorProperty) == 0) {
    throw ContractError(std::string("assessment of ") + resolved.path +
                        " succeeded but reported no " + kOriginatorProperty);
  }
  const std::string& observed = result.properties->at(kOriginatorProperty);
  const OriginatorPattern fresh = OriginatorPattern::fromObserved(observed);

  const bool matched =
    record.originator && OriginatorPattern::parse(*record.originator).matches(observed);
  const std::string before = record.originator.value_or("(none)");

  if (isNew) {
    record.originator = fresh.str();
    rep.outcome = Outcome::Created;
    rep.message = "Created with originator " + fresh.str();
    spdlog::info("{}: {}", rep.key, rep.message);
  } else if (willPersist && matched) {
    rep.outcome = Outcome::Unchanged;
    rep.message = "No change";
    spdlog::info("{}: {}", rep.key, rep.message);
  } else if (willPersist) {
    rep.outcome = Outcome::Updated;
    rep.message = "Originator changing from " + before + " to " + fresh.str();
    spdlog::warn("{}: {} ({})", rep.key, rep.message, observed);
    record.originator = fresh.str();
  } else if (matched) {
    rep.outcome = Outcome::Verified;
    rep.message = "Verified (originator " + before + ")";
    spdlog::info("{}: {}", rep.key, rep.message);
  } else {
    return fail("Originator changed from " + before + " to " + fresh.str() + " (" + observed + ")");
  }

  if (willPersist) {
    record.last_updated = clock_();
    store_.set(resolved.key, std::move(record));
    changed = true;
  }
  return rep;
}

} // namespace sigdrift
