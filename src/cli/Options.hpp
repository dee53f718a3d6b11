#pragma once
#include <ostream>
#include <string>
#include <vector>

namespace sigdrift {

// command line options
struct Options {
  std::string storePath;       // empty: SIGDRIFT_STORE or the default
  bool substituteHome = true;
  bool add = false;
  bool freshen = false;
  bool list = false;
  bool help = false;
  bool quiet = false;          // -q, wins over -v
  int verbosity = 0;           // +1 per -v
  std::vector<std::string> targets;
};

// Throws UsageError on unknown options or --add without targets.
Options parse_options(int argc, char** argv);

void print_usage(std::ostream& os, const char* argv0);

} // namespace sigdrift
