// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

//***************************************************************************
//
// Purpose:
//   Definitions shared by every pollcatch binary format
//
// Description:
//   Result of checking the magic and version bytes at the start of a file.
//
//***************************************************************************

#ifndef FORMATS_COMMON_H
#define FORMATS_COMMON_H

#include <assert.h>
#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#if defined(__cplusplus)
extern "C" {
#endif

/// Outcome of a fmt_*_check function. Readers must refuse negative results
/// and should warn on positive ones.
enum fmt_version_t {
  /// Written by this very version of the format
  fmt_version_exact = 0,
  /// Wrong magic, some other kind of file entirely
  fmt_version_invalid = -1,
  /// Older minor version, which is no longer readable
  fmt_version_backward = -2,
  /// Another major version
  fmt_version_major = -3,
  /// Newer minor version, trailing fields will be ignored
  fmt_version_forward = 1,
};

#if defined(__cplusplus)
}  // extern "C"
#endif

#endif  // FORMATS_COMMON_H
