#include "Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/storage/LocalPaths.hpp"

namespace sigdrift {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key); v && *v) return std::string(v);
  return defval;
}

std::string store_path_for(const Options& opts, const std::string& home) {
  std::string p = opts.storePath.empty()
    ? get_env_or("SIGDRIFT_STORE", "~/.sigdrift/expectations.json")
    : opts.storePath;
  return expand_home(p, home);
}

// -------- logging --------

spdlog::level::level_enum parse_log_level(const std::string& name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // from_str maps unknown names to off, which would hide every failure
  if (lower == "trace") return spdlog::level::trace;
  if (lower == "debug") return spdlog::level::debug;
  if (lower == "info")  return spdlog::level::info;
  if (lower == "warn")  return spdlog::level::warn;
  if (lower == "error") return spdlog::level::err;
  if (lower == "off")   return spdlog::level::off;
  throw UsageError("unknown log level '" + name + "' (expected trace, debug, info, warn, error or off)");
}

spdlog::level::level_enum log_level_for(const Options& opts) {
  const std::string env = get_env_or("SIGDRIFT_LOG_LEVEL", "");
  if (!env.empty()) return parse_log_level(env);

  if (opts.quiet) return spdlog::level::warn;
  if (opts.verbosity == 1) return spdlog::level::debug;
  if (opts.verbosity > 1) return spdlog::level::trace;
  return spdlog::level::info;
}

void configure_logging(const Options& opts) {
  const auto level = log_level_for(opts);
  spdlog::set_pattern("%^%l%$: %v");
  spdlog::set_level(level);
}

// -------- reporting --------

void print_records(std::ostream& os, const ExpectationStore& store) {
  for (const auto& [key, r] : store) {
    os << key
       << "\t" << r.originator.value_or("-")
       << "\t" << (r.assessment_type ? to_string(*r.assessment_type) : "-")
       << "\t" << r.last_updated.value_or("-") << "\n";
  }
}

std::string format_summary(const RunReport& report) {
  return fmt::format("{} target(s): {} verified, {} unchanged, {} created, {} updated, {} skipped, {} failed",
                     report.targets.size(),
                     report.count(Outcome::Verified), report.count(Outcome::Unchanged),
                     report.count(Outcome::Created), report.count(Outcome::Updated),
                     report.count(Outcome::Skipped), report.count(Outcome::Failed));
}

int exit_code_for(const RunReport& report) {
  return report.failed() ? kExitFailed : kExitOk;
}

} // namespace sigdrift
