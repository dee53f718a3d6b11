#pragma once
#include <ostream>
#include <string>

#include <spdlog/common.h>

#include "cli/Options.hpp"
#include "core/expectations/ExpectationStore.hpp"
#include "services/reconcile/Reconciler.hpp"

namespace sigdrift {

// exit status
constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;  // a target did not check out
constexpr int kExitFatal = 2;   // usage, store or contract error

// Environment value, or defval when unset or empty.
std::string get_env_or(const char* key, const std::string& defval);

// --store, else SIGDRIFT_STORE, else ~/.sigdrift/expectations.json; ~ expanded.
std::string store_path_for(const Options& opts, const std::string& home);

// Accepts trace, debug, info, warn, error and off in any case.
// Throws UsageError for anything else.
spdlog::level::level_enum parse_log_level(const std::string& name);

// -q wins over any -v. SIGDRIFT_LOG_LEVEL, when set, wins over both.
spdlog::level::level_enum log_level_for(const Options& opts);

void configure_logging(const Options& opts);

// One line per record: key, originator, assessment type, last update.
void print_records(std::ostream& os, const ExpectationStore& store);

std::string format_summary(const RunReport& report);

int exit_code_for(const RunReport& report);

} // namespace sigdrift
