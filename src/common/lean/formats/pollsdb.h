// SPDX-FileCopyrightText: 2002-2024 Rice University
//
// SPDX-License-Identifier: BSD-3-Clause

//***************************************************************************
//
// Purpose:
//   Low-level types and functions for reading/writing polls.db
//
// Description:
//   polls.db is the compact export of the long polls retained by the
//   decoder: a fixed header, a packed array of fixed-size records and an
//   8-byte footer. All integers are little-endian.
//
//   00: magic "POLLCATCHpolls"   14 bytes
//   0e: major version             u8
//   0f: minor version             u8
//   10: nRecords                  u64
//   18: pRecords                  u64
//   pRecords: nRecords x {timestamp, thread, duration, stackId}  4x u64
//   end - 8: footer "polls.db"
//
//***************************************************************************

#ifndef FORMATS_POLLSDB_H
#define FORMATS_POLLSDB_H

#include "common.h"

#if defined(__cplusplus)
extern "C" {
#endif

/// Major and minor version of the polls.db format implemented here
enum { FMT_POLLSDB_MajorVersion = 1 };
enum { FMT_POLLSDB_MinorVersion = 0 };

/// Check the given file start bytes for the polls.db format.
/// If minorVer != NULL, also returns the exact minor version.
enum fmt_version_t fmt_pollsdb_check(const char[16], uint8_t* minorVer);

/// Footer byte sequence for polls.db files.
extern const char fmt_pollsdb_footer[8];

/// Size of the polls.db file header in serialized form
enum { FMT_POLLSDB_SZ_FHdr = 0x20 };

/// polls.db file header
typedef struct fmt_pollsdb_fHdr_t {
  // NOTE: magic and versions are constant and cannot be adjusted
  uint64_t nRecords;
  uint64_t pRecords;
} fmt_pollsdb_fHdr_t;

/// Read a polls.db file header from a byte array
void fmt_pollsdb_fHdr_read(fmt_pollsdb_fHdr_t*, const char[FMT_POLLSDB_SZ_FHdr]);

/// Write a polls.db file header into a byte array
void fmt_pollsdb_fHdr_write(char[FMT_POLLSDB_SZ_FHdr], const fmt_pollsdb_fHdr_t*);

// Long poll record {Poll}
enum { FMT_POLLSDB_SZ_Poll = 0x20 };
typedef struct fmt_pollsdb_poll_t {
  uint64_t timestamp;  ///< Nanoseconds, as derived from the trace clock
  uint64_t thread;     ///< OS thread identifier
  uint64_t duration;   ///< Nanoseconds since the start of the poll
  uint64_t stackId;    ///< Stack identifier within the source trace
} fmt_pollsdb_poll_t;

void fmt_pollsdb_poll_read(fmt_pollsdb_poll_t*, const char[FMT_POLLSDB_SZ_Poll]);
void fmt_pollsdb_poll_write(char[FMT_POLLSDB_SZ_Poll], const fmt_pollsdb_poll_t*);

#if defined(__cplusplus)
}  // extern "C"
#endif

#endif  // FORMATS_POLLSDB_H
