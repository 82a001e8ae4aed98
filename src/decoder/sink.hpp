// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_SINK_H
#define POLLCATCH_DECODER_SINK_H

#include "poll.hpp"

namespace pollcatch {

/// Destination for the long polls retained by the Extractor.
class ReportSink {
public:
  virtual ~ReportSink() = default;

  /// Notify the Sink of a retained long poll, in trace order.
  // MT: Externally Synchronized
  virtual void notifyLongPoll(const PollEvent&, const Stack&) = 0;

  /// Write out anything still held by the Sink. Called once, after the last
  /// trace.
  // MT: Externally Synchronized
  virtual void write();

protected:
  /// You should never create a base ReportSink. Use a subclass.
  ReportSink() = default;
};

}

#endif  // POLLCATCH_DECODER_SINK_H
