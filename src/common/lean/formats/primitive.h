// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

//***************************************************************************
//
// Purpose:
//   Fixed-width integer and float conversions to and from raw bytes
//
// Description:
//   fmt_uN_read/fmt_uN_write handle the little-endian fields of the pollcatch
//   formats. fmt_uN_readbe and fmt_fN_readbe handle the big-endian fields of
//   the profiler's JFR container, which is never written here.
//
//***************************************************************************

#ifndef FORMATS_PRIMITIVE_H
#define FORMATS_PRIMITIVE_H

#include "common.h"

#include <endian.h>
#include <string.h>

#if defined(__cplusplus)
extern "C" {
#endif

// All access goes through memcpy: the buffers carry no alignment guarantee
// and the copies compile down to single loads and stores.

static inline uint16_t fmt_u16_read(const char* src) {
  uint16_t raw;
  memcpy(&raw, src, sizeof raw);
  return le16toh(raw);
}
static inline uint16_t fmt_u16_readbe(const char* src) {
  uint16_t raw;
  memcpy(&raw, src, sizeof raw);
  return be16toh(raw);
}
static inline void fmt_u16_write(char* dst, uint16_t value) {
  const uint16_t raw = htole16(value);
  memcpy(dst, &raw, sizeof raw);
}

static inline uint32_t fmt_u32_read(const char* src) {
  uint32_t raw;
  memcpy(&raw, src, sizeof raw);
  return le32toh(raw);
}
static inline uint32_t fmt_u32_readbe(const char* src) {
  uint32_t raw;
  memcpy(&raw, src, sizeof raw);
  return be32toh(raw);
}
static inline void fmt_u32_write(char* dst, uint32_t value) {
  const uint32_t raw = htole32(value);
  memcpy(dst, &raw, sizeof raw);
}

static inline uint64_t fmt_u64_read(const char* src) {
  uint64_t raw;
  memcpy(&raw, src, sizeof raw);
  return le64toh(raw);
}
static inline uint64_t fmt_u64_readbe(const char* src) {
  uint64_t raw;
  memcpy(&raw, src, sizeof raw);
  return be64toh(raw);
}
static inline void fmt_u64_write(char* dst, uint64_t value) {
  const uint64_t raw = htole64(value);
  memcpy(dst, &raw, sizeof raw);
}

static_assert(sizeof(float) == sizeof(uint32_t), "float must be IEEE single precision");
static_assert(sizeof(double) == sizeof(uint64_t), "double must be IEEE double precision");

static inline float fmt_f32_readbe(const char* src) {
  const uint32_t bits = fmt_u32_readbe(src);
  float value;
  memcpy(&value, &bits, sizeof value);
  return value;
}

static inline double fmt_f64_readbe(const char* src) {
  const uint64_t bits = fmt_u64_readbe(src);
  double value;
  memcpy(&value, &bits, sizeof value);
  return value;
}

#if defined(__cplusplus)
}  // extern "C"
#endif

#endif  // FORMATS_PRIMITIVE_H
