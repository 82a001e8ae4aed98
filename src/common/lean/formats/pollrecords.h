// SPDX-FileCopyrightText: 2002-2024 Rice University
//
// SPDX-License-Identifier: BSD-3-Clause

//***************************************************************************
//
// Purpose:
//   Low-level types and functions for reading/writing poll record files
//
// Description:
//   A poll record file is a plain sequence of self-sized little-endian
//   records, written by the runtime while the profiler is running:
//
//   00: size   u32   Total size of the record, including this header
//   04: kind   u32   One of fmt_pollrec_kind_t
//   08: payload, at least as large as the kind requires
//
//   Readers skip records of unknown kinds, and skip any bytes past the end
//   of the payload of a known kind.
//
//***************************************************************************

#ifndef FORMATS_POLLRECORDS_H
#define FORMATS_POLLRECORDS_H

#include "primitive.h"

#if defined(__cplusplus)
extern "C" {
#endif

/// Size of the common record header
enum { FMT_POLLREC_SZ_Hdr = 0x08 };

typedef enum fmt_pollrec_kind_t {
  fmt_pollrec_kind_poll = 0,
  fmt_pollrec_kind_calibration = 1,
} fmt_pollrec_kind_t;

typedef struct fmt_pollrec_hdr_t {
  uint32_t size;
  uint32_t kind;
} fmt_pollrec_hdr_t;

static inline void fmt_pollrec_hdr_read(fmt_pollrec_hdr_t* hdr, const char d[FMT_POLLREC_SZ_Hdr]) {
  hdr->size = fmt_u32_read(d + 0x00);
  hdr->kind = fmt_u32_read(d + 0x04);
}
static inline void fmt_pollrec_hdr_write(char d[FMT_POLLREC_SZ_Hdr], const fmt_pollrec_hdr_t* hdr) {
  fmt_u32_write(d + 0x00, hdr->size);
  fmt_u32_write(d + 0x04, hdr->kind);
}

// Sampled poll {Poll}, header included
enum { FMT_POLLREC_SZ_Poll = 0x24 };
typedef struct fmt_pollrec_poll_t {
  uint64_t start;      ///< Poll entry, in the recording clock
  uint64_t end;        ///< Poll exit, in the recording clock
  uint64_t clockEnd;   ///< Poll exit, CLOCK_MONOTONIC nanoseconds
  uint32_t tid;        ///< OS thread identifier
} fmt_pollrec_poll_t;

static inline void fmt_pollrec_poll_read(fmt_pollrec_poll_t* rec, const char d[FMT_POLLREC_SZ_Poll]) {
  rec->start = fmt_u64_read(d + 0x08);
  rec->end = fmt_u64_read(d + 0x10);
  rec->clockEnd = fmt_u64_read(d + 0x18);
  rec->tid = fmt_u32_read(d + 0x20);
}
static inline void fmt_pollrec_poll_write(char d[FMT_POLLREC_SZ_Poll], const fmt_pollrec_poll_t* rec) {
  const fmt_pollrec_hdr_t hdr = {FMT_POLLREC_SZ_Poll, fmt_pollrec_kind_poll};
  fmt_pollrec_hdr_write(d, &hdr);
  fmt_u64_write(d + 0x08, rec->start);
  fmt_u64_write(d + 0x10, rec->end);
  fmt_u64_write(d + 0x18, rec->clockEnd);
  fmt_u32_write(d + 0x20, rec->tid);
}

// Clock calibration {Calibration}, header included
//   monotonic = ((src - srcEpoch) * mul >> shift) + refEpoch
enum { FMT_POLLREC_SZ_Calibration = 0x24 };
typedef struct fmt_pollrec_calibration_t {
  uint64_t srcEpoch;
  uint64_t refEpoch;
  uint64_t mul;
  uint32_t shift;
} fmt_pollrec_calibration_t;

static inline void fmt_pollrec_calibration_read(fmt_pollrec_calibration_t* rec,
                                                const char d[FMT_POLLREC_SZ_Calibration]) {
  rec->srcEpoch = fmt_u64_read(d + 0x08);
  rec->refEpoch = fmt_u64_read(d + 0x10);
  rec->mul = fmt_u64_read(d + 0x18);
  rec->shift = fmt_u32_read(d + 0x20);
}
static inline void fmt_pollrec_calibration_write(char d[FMT_POLLREC_SZ_Calibration],
                                                 const fmt_pollrec_calibration_t* rec) {
  const fmt_pollrec_hdr_t hdr = {FMT_POLLREC_SZ_Calibration, fmt_pollrec_kind_calibration};
  fmt_pollrec_hdr_write(d, &hdr);
  fmt_u64_write(d + 0x08, rec->srcEpoch);
  fmt_u64_write(d + 0x10, rec->refEpoch);
  fmt_u64_write(d + 0x18, rec->mul);
  fmt_u32_write(d + 0x20, rec->shift);
}

#if defined(__cplusplus)
}  // extern "C"
#endif

#endif  // FORMATS_POLLRECORDS_H
