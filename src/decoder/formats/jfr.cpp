// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "jfr.hpp"

#include "../../common/lean/formats/primitive.h"

#include <cstring>

using namespace pollcatch::formats;

std::optional<jfr::ChunkHeader> jfr::readChunkHeader(const char d[SZ_ChunkHeader]) noexcept {
  if(std::memcmp(d, magic, sizeof magic) != 0) return std::nullopt;
  ChunkHeader hdr;
  hdr.major = fmt_u16_readbe(d + 0x04);
  hdr.minor = fmt_u16_readbe(d + 0x06);
  hdr.size = (std::int64_t)fmt_u64_readbe(d + 0x08);
  hdr.cpOffset = (std::int64_t)fmt_u64_readbe(d + 0x10);
  hdr.metadataOffset = (std::int64_t)fmt_u64_readbe(d + 0x18);
  hdr.startNanos = (std::int64_t)fmt_u64_readbe(d + 0x20);
  hdr.durationNanos = (std::int64_t)fmt_u64_readbe(d + 0x28);
  hdr.startTicks = (std::int64_t)fmt_u64_readbe(d + 0x30);
  hdr.ticksPerSecond = (std::int64_t)fmt_u64_readbe(d + 0x38);
  hdr.features = fmt_u32_readbe(d + 0x40);
  return hdr;
}
