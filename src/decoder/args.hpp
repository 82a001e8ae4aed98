// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_ARGS_H
#define POLLCATCH_DECODER_ARGS_H

#include "../common/util/log.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pollcatch {

/// Argument parser front-end for pollcatch-decoder. Usage errors are reported
/// on stderr and exit with status 2, before any trace is opened.
class DecoderArgs {
public:
  /// Parse the command line and fill *this
  DecoderArgs(int, char* const*);
  ~DecoderArgs() = default;

  enum class Mode {
    /// Report the long polls of one or more traces
    longpolls,
    /// Print the records of a polls.db export
    dump,
  };
  Mode mode;

  /// Trace files to decode, in the order given.
  std::vector<std::filesystem::path> traces;

  /// Polls shorter than this are not reported.
  std::chrono::nanoseconds minLength{0};

  /// Number of frames to print per stack.
  std::size_t stackDepth = 5;

  /// Frame substrings that mark a sample as idle.
  std::vector<std::string> skipFrames;

  /// Poll records file written by the runtime, if any.
  std::optional<std::filesystem::path> prFile;

  /// Where to export the long polls as polls.db, if anywhere.
  std::optional<std::filesystem::path> exportPath;

  /// polls.db file to dump.
  std::filesystem::path pollsdb;

  /// Log settings requested by -v and -q.
  util::log::Settings logSettings() const noexcept;

private:
  int verbosity = 0;
};

}

#endif  // POLLCATCH_DECODER_ARGS_H
