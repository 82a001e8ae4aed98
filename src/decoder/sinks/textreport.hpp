// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_SINKS_TEXTREPORT_H
#define POLLCATCH_DECODER_SINKS_TEXTREPORT_H

#include "../sink.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace pollcatch::sinks {

/// ReportSink rendering each long poll as a human-readable entry:
///
///   [<sec>.<usec>] thread <tid> - poll of <N>us
///    - <i>: <symbol>
///    - <n> more frame(s) (pass --stack-depth=<L> to show)
///
/// followed by a blank line.
class TextReport final : public ReportSink {
public:
  /// Render to the given stream, showing at most `depth` frames per stack.
  TextReport(std::ostream&, std::size_t depth);
  ~TextReport() = default;

  void notifyLongPoll(const PollEvent&, const Stack&) override;
  void write() override;

private:
  std::ostream& out;
  std::size_t depth;
};

/// Format nanoseconds as fixed-point seconds with microsecond precision.
std::string formatTimestamp(std::uint64_t nanos);

}

#endif  // POLLCATCH_DECODER_SINKS_TEXTREPORT_H
