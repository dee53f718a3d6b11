#include "Options.hpp"

#include <getopt.h>

#include "core/Errors.hpp"

namespace sigdrift {

static const struct option kLongOpts[] = {
  {"help",    no_argument,       nullptr, 'h'},
  {"store",   required_argument, nullptr, 's'},
  {"add",     no_argument,       nullptr, 'a'},
  {"freshen", no_argument,       nullptr, 'f'},
  {"update",  no_argument,       nullptr, 'u'},
  {"list",    no_argument,       nullptr, 'l'},
  {"verbose", no_argument,       nullptr, 'v'},
  {"quiet",   no_argument,       nullptr, 'q'},
  {"home",    no_argument,       nullptr, 'H'},
  {"no-home", no_argument,       nullptr, 'N'},
  {nullptr, 0, nullptr, 0}
};

void print_usage(std::ostream& os, const char* argv0) {
  os << "Usage: " << argv0 << " [options] [TARGET ...]\n"
     << "Checks that each TARGET is still signed by the originator recorded for it.\n"
     << "With no TARGET, every tracked path is checked.\n"
     << "\n"
     << "  -s, --store PATH    expectations file (SIGDRIFT_STORE, default ~/.sigdrift/expectations.json)\n"
     << "      --no-home       do not rewrite paths under $HOME as ~/...\n"
     << "      --home          store new keys under ~/... when possible (default)\n"
     << "  -a, --add           record untracked targets\n"
     << "  -f, --freshen       accept a changed originator and update the record\n"
     << "  -u, --update        same as --add --freshen\n"
     << "  -l, --list          print tracked records and exit\n"
     << "  -v, --verbose       more output, may be repeated\n"
     << "  -q, --quiet         only warnings and errors, overrides -v\n"
     << "  -h, --help          show this help message\n"
     << "\n"
     << "Exit status: 0 if every target checked out, 1 if any failed, 2 on fatal errors.\n";
}

Options parse_options(int argc, char** argv) {
  Options o;

  // full rescan, also resets GNU getopt's internal state between calls
  optind = 0;
  opterr = 0;
  optopt = 0;

  int opt = 0;
  while ((opt = getopt_long(argc, argv, "hs:afulvq", kLongOpts, nullptr)) != -1) {
    switch (opt) {
      case 'h': o.help = true; break;
      case 's': o.storePath = optarg; break;
      case 'a': o.add = true; break;
      case 'f': o.freshen = true; break;
      case 'u': o.add = true; o.freshen = true; break;
      case 'l': o.list = true; break;
      case 'v': o.verbosity++; break;
      case 'q': o.quiet = true; break;
      case 'H': o.substituteHome = true; break;
      case 'N': o.substituteHome = false; break;
      case '?':
      default:
        if (optopt == 's') throw UsageError("option --store requires a path");
        if (optopt) throw UsageError(std::string("unknown option -") + static_cast<char>(optopt));
        throw UsageError(std::string("unknown option ") + argv[optind - 1]);
    }
  }

  for (int i = optind; i < argc; ++i) o.targets.emplace_back(argv[i]);

  if (o.help) return o;
  if (o.add && o.targets.empty()) throw UsageError("--add requires at least one target");
  if (o.list && (o.add || o.freshen)) throw UsageError("--list cannot be combined with --add/--freshen/--update");
  return o;
}

} // namespace sigdrift
