// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_DECODE_H
#define POLLCATCH_DECODER_DECODE_H

#include "poll.hpp"
#include "resolver.hpp"
#include "sources/jfr.hpp"
#include "sources/pollrecords.hpp"

#include <vector>

namespace pollcatch {

/// Second pass over a trace: join every raw sample against the constant pools
/// (and the poll records, if any) to give its thread and poll duration.
///
/// The duration is the sample's appword (nanoseconds) when it has one. Failing
/// that, the enclosing recorded poll is looked up in the clock the trace was
/// recorded with. Samples that fall outside every poll are dropped. Trace
/// order is kept.
std::vector<PollEvent> decodePolls(const sources::JfrTrace&, const Resolver&,
                                   const sources::PollRecords* = nullptr);

}

#endif  // POLLCATCH_DECODER_DECODE_H
