// src/main.cpp
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "cli/Config.hpp"
#include "cli/Options.hpp"
#include "core/Errors.hpp"
#include "core/expectations/ExpectationStore.hpp"
#include "core/storage/LocalPaths.hpp"
#include "services/assessment/SpctlAssessor.hpp"
#include "services/reconcile/Reconciler.hpp"

using namespace sigdrift;

int main(int argc, char** argv) {
  Options opts;
  try {
    opts = parse_options(argc, argv);
  } catch (const UsageError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    print_usage(std::cerr, argv[0]);
    return kExitFatal;
  }
  if (opts.help) {
    print_usage(std::cout, argv[0]);
    return kExitOk;
  }

  try {
    configure_logging(opts);
  } catch (const UsageError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return kExitFatal;
  }

  try {
    const std::string home = current_home();
    ExpectationStore store(store_path_for(opts, home), home, opts.substituteHome);
    store.load();

    if (opts.list) {
      print_records(std::cout, store);
      return kExitOk;
    }

    SpctlAssessor assessor(get_env_or("SIGDRIFT_SPCTL", "/usr/sbin/spctl"));
    Reconciler reconciler(store, assessor, ReconcileOptions{opts.add, opts.freshen});

    const RunReport report = reconciler.run(opts.targets);

    spdlog::info("{}", format_summary(report));
    if (report.changed) spdlog::debug("store saved to {}", store.storePath());

    return exit_code_for(report);
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return kExitFatal;
  }
}
