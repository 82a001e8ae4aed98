// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "args.hpp"

#include "config.hpp"
#include "duration.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <stdexcept>

using namespace pollcatch;

#ifndef POLLCATCH_VERSION
#define POLLCATCH_VERSION "unknown"
#endif

static const std::string summary = R"EOF(
Usage:
  pollcatch-decoder longpolls [options]... TRACE... MIN_LENGTH
  pollcatch-decoder dump POLLS_DB
  pollcatch-decoder -h | -V

Report the polls that ran for at least MIN_LENGTH (for example 5ms or
1s 500ms) in one or more JFR traces, with the stack of each long poll.
)EOF";

static const std::string options = R"EOF(
Options for longpolls:
  -d N, --stack-depth=N     Show at most N frames of each stack. Default 5.
  -e PATH, --export=PATH    Also export the long polls to PATH as polls.db.
  -p PATH, --pr-file=PATH   Time samples without an appword by the poll
                            records file written by pollcatch_record_polls.
  -c PATH, --config=PATH    Read settings from a YAML file. Options given
                            on the command line take precedence.
  -s TEXT, --skip-frame=TEXT
                            Ignore samples with a frame containing TEXT.
                            May be given multiple times.

General options:
  -v, --verbose             Report progress. Give twice for debug output.
  -q, --quiet               Only report errors.
  -h, --help                Display this help and exit.
  -V, --version             Print the version and exit.

Exit status is 0 on success, 1 if any trace failed to decode and 2 on
usage errors.
)EOF";

[[noreturn]] static void usageError(const std::string& msg) {
  std::cerr << "pollcatch-decoder: " << msg << "\n"
               "Try 'pollcatch-decoder --help' for more information.\n";
  std::exit(2);
}

[[noreturn]] static void help() {
  std::cout << summary << options;
  std::exit(0);
}

[[noreturn]] static void version() {
  std::cout << "pollcatch-decoder " << POLLCATCH_VERSION << "\n";
  std::exit(0);
}

static std::size_t parseDepth(const char* arg) {
  char* end = nullptr;
  errno = 0;
  const auto v = std::strtoll(arg, &end, 10);
  if(errno != 0 || end == arg || *end != '\0' || v < 0)
    usageError(std::string("invalid stack depth '") + arg + "'");
  return (std::size_t)v;
}

DecoderArgs::DecoderArgs(int argc, char* const argv[]) {
  if(argc < 2) usageError("missing subcommand");
  const std::string sub = argv[1];
  if(sub == "-h" || sub == "--help") help();
  if(sub == "-V" || sub == "--version") version();
  if(sub == "longpolls") mode = Mode::longpolls;
  else if(sub == "dump") mode = Mode::dump;
  else usageError("unknown subcommand '" + sub + "'");

  static const struct option longopts[] = {
    {"stack-depth", required_argument, nullptr, 'd'},
    {"export", required_argument, nullptr, 'e'},
    {"pr-file", required_argument, nullptr, 'p'},
    {"config", required_argument, nullptr, 'c'},
    {"skip-frame", required_argument, nullptr, 's'},
    {"verbose", no_argument, nullptr, 'v'},
    {"quiet", no_argument, nullptr, 'q'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, 0},
  };

  std::optional<std::size_t> depth;
  std::optional<std::filesystem::path> config;
  std::vector<std::string> skips;

  // Reset getopt's state, the subcommand takes the place of argv[0]
  optind = 0;
  opterr = 0;
  int opt;
  while((opt = getopt_long(argc - 1, argv + 1, "+:d:e:p:c:s:vqhV", longopts, nullptr)) != -1) {
    switch(opt) {
    case 'd': depth = parseDepth(optarg); break;
    case 'e': exportPath = optarg; break;
    case 'p': prFile = optarg; break;
    case 'c': config = optarg; break;
    case 's': skips.emplace_back(optarg); break;
    case 'v': verbosity = verbosity < 0 ? 1 : verbosity + 1; break;
    case 'q': verbosity = -1; break;
    case 'h': help();
    case 'V': version();
    case ':':
      if(optopt != 0)
        usageError(std::string("option requires an argument -- '") + (char)optopt + "'");
      usageError(std::string("option '") + argv[optind] + "' requires an argument");
    default:
      if(optopt != 0) usageError(std::string("invalid option -- '") + (char)optopt + "'");
      usageError(std::string("unrecognized option '") + argv[optind] + "'");
    }
  }
  std::vector<std::string> positional(argv + 1 + optind, argv + argc);

  if(mode == Mode::dump) {
    if(depth || exportPath || prFile || config || !skips.empty())
      usageError("dump takes no longpolls options");
    if(positional.size() != 1) usageError("dump expects exactly one POLLS_DB");
    pollsdb = positional.front();
    return;
  }

  if(positional.size() < 2) usageError("expected at least one TRACE and a MIN_LENGTH");
  try {
    minLength = parseDuration(positional.back());
  } catch(std::invalid_argument& e) {
    usageError(e.what());
  }
  positional.pop_back();
  traces.assign(positional.begin(), positional.end());

  if(config) {
    DecoderConfig cfg;
    try {
      cfg = DecoderConfig::load(*config);
    } catch(std::runtime_error& e) {
      usageError(e.what());
    }
    if(cfg.stackDepth) stackDepth = *cfg.stackDepth;
    skipFrames = std::move(cfg.skipFrames);
    if(cfg.prFile && !prFile) prFile = std::move(cfg.prFile);
    if(cfg.exportPath && !exportPath) exportPath = std::move(cfg.exportPath);
  }
  if(depth) stackDepth = *depth;
  if(!skips.empty()) skipFrames = std::move(skips);
}

util::log::Settings DecoderArgs::logSettings() const noexcept {
  if(verbosity < 0) return util::log::Settings(true, false, false, false, false);
  if(verbosity == 0) return util::log::Settings::standard;
  return util::log::Settings(true, true, true, true, verbosity > 1);
}
