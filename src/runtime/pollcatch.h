// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*- // technically C99

#ifndef _POLLCATCH_H_
#define _POLLCATCH_H_

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/// Chain the poll-time publisher in front of the handler currently installed
/// for `signo` (normally the profiler's SIGPROF handler). The profiler must
/// already be running. Returns 0 on success, -1 with errno set otherwise.
__attribute__((visibility("default")))
int pollcatch_enable(int signo);

/// Restore the handler that was installed before pollcatch_enable().
__attribute__((visibility("default")))
void pollcatch_disable(void);

/// Per-sample annotation hook for the profiler (asprof_set_helper). Returns
/// the nanoseconds spent in the current poll at the last sample taken on this
/// thread, or 0 if the thread was not in a poll, and clears the slot.
__attribute__((visibility("default")))
uint64_t pollcatch_asprof_helper(void);

/// Record every sampled poll to the file at `path`, flushed once a second.
/// Returns 0 on success, -1 if the file could not be opened.
__attribute__((visibility("default")))
int pollcatch_record_polls(const char* path);

#ifdef __cplusplus
} // extern "C"
#endif

#endif  // ! _POLLCATCH_H_
