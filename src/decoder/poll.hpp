// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_POLL_H
#define POLLCATCH_DECODER_POLL_H

#include <cstdint>
#include <string>
#include <vector>

namespace pollcatch {

/// Single symbolized frame of a sampled stack.
struct StackFrame {
  std::int64_t id;      ///< Method constant pool id
  std::string symbol;   ///< Symbol name, or the raw id if unresolved
  bool resolved;
};

/// Sampled stack, leaf frame first.
struct Stack {
  std::int64_t id;
  std::vector<StackFrame> frames;
  bool resolved;  ///< False if the stack id had no constant pool entry
};

/// One sample taken inside a poll, as decoded from a trace.
struct PollEvent {
  std::uint64_t timestamp;  ///< Nanoseconds
  std::int64_t thread;      ///< OS thread id
  std::uint64_t duration;   ///< Nanoseconds since the poll started
  std::int64_t stackId;
};

}

#endif  // POLLCATCH_DECODER_POLL_H
