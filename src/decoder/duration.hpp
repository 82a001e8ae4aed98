// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_DURATION_H
#define POLLCATCH_DECODER_DURATION_H

#include <chrono>
#include <string>
#include <string_view>

namespace pollcatch {

/// Parse a human-readable duration such as `5ms`, `1s 500ms` or `2min`.
/// Every number needs a unit: ns, us/µs, ms, s, m/min, h, d, w, M (months)
/// or y (years), each with its usual long spellings. Throws
/// std::invalid_argument if the text is not a duration or does not fit.
std::chrono::nanoseconds parseDuration(std::string_view);

/// Format a duration in the form accepted by parseDuration.
std::string formatDuration(std::chrono::nanoseconds);

}

#endif  // POLLCATCH_DECODER_DURATION_H
