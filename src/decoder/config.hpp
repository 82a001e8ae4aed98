// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_CONFIG_H
#define POLLCATCH_DECODER_CONFIG_H

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace pollcatch {

/// Decoder settings read from a YAML file. Every key is optional:
///
///   stack-depth: 10
///   skip-frames: [Parker.park, epoll_wait]
///   pr-file: /tmp/polls.bin
///   export: polls.db
struct DecoderConfig {
  std::optional<std::size_t> stackDepth;
  std::vector<std::string> skipFrames;
  std::optional<std::filesystem::path> prFile;
  std::optional<std::filesystem::path> exportPath;

  /// Parse the given file. Unknown keys are warned about and ignored.
  /// Throws std::runtime_error if the file is unreadable or malformed.
  static DecoderConfig load(const std::filesystem::path&);

  /// Parse from an in-memory YAML document.
  static DecoderConfig parse(const std::string&);
};

}

#endif  // POLLCATCH_DECODER_CONFIG_H
