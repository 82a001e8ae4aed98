// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_EXTRACTOR_H
#define POLLCATCH_DECODER_EXTRACTOR_H

#include "poll.hpp"
#include "resolver.hpp"
#include "sink.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace pollcatch {

/// Single-pass filter from decoded poll events to the long polls handed to
/// the report sinks. Holds no state between runs.
class Extractor final {
public:
  struct Options {
    /// Polls shorter than this are discarded.
    std::chrono::nanoseconds threshold{0};
    /// Samples with a frame containing any of these are idle, not work.
    std::vector<std::string> skipFrames;
  };

  explicit Extractor(Options);
  ~Extractor() = default;

  /// Add a Sink to receive the long polls. The Sink must outlive the Extractor.
  Extractor& operator<<(ReportSink&);

  /// Filter the events of one trace, in order, into every Sink. Returns the
  /// number of long polls retained.
  std::size_t run(const std::vector<PollEvent>&, Resolver&) const;

  const Options& options() const noexcept { return opts; }

private:
  bool idle(const Stack&) const noexcept;

  Options opts;
  std::vector<std::reference_wrapper<ReportSink>> sinks;
};

}

#endif  // POLLCATCH_DECODER_EXTRACTOR_H
