// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_LONGPOLLS_H
#define POLLCATCH_DECODER_LONGPOLLS_H

#include "args.hpp"

#include <ostream>

namespace pollcatch {

/// Run the longpolls subcommand, writing the report to the given stream.
/// Each trace is decoded in isolation: a trace that fails contributes no rows
/// and does not stop the others. Returns the process exit status.
int longpolls(const DecoderArgs&, std::ostream&);

/// Run the dump subcommand. Returns the process exit status.
int dump(const DecoderArgs&, std::ostream&);

}

#endif  // POLLCATCH_DECODER_LONGPOLLS_H
