// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

//***************************************************************************
//
// Purpose:
//   Layout constants for the JFR container written by the profiler
//
// Description:
//   A JFR file is a sequence of chunks. Each chunk starts with a fixed
//   big-endian header:
//
//   00: magic "FLR\0"       4 bytes
//   04: major version       u16     (1 or 2)
//   06: minor version       u16
//   08: chunk size          i64     Including this header
//   10: constant pool       i64     Offset of the last checkpoint event
//   18: metadata            i64     Offset of the metadata event
//   20: start nanos         i64
//   28: duration nanos      i64
//   30: start ticks         i64
//   38: ticks per second    i64
//   40: features            i32     Bit 0: integers are LEB128-compressed
//
//   The rest of the chunk is a packed run of events, each led by its own
//   size (which counts the size field itself) and its type id. Type 0 is the
//   metadata event, type 1 a checkpoint (constant pool) event.
//
//***************************************************************************

#ifndef POLLCATCH_DECODER_FORMATS_JFR_H
#define POLLCATCH_DECODER_FORMATS_JFR_H

#include <cstdint>
#include <optional>

namespace pollcatch::formats::jfr {

inline constexpr char magic[4] = {'F', 'L', 'R', '\0'};

inline constexpr std::size_t SZ_ChunkHeader = 0x44;

inline constexpr std::uint32_t featureCompressedInts = 1;

inline constexpr std::int64_t typeMetadata = 0;
inline constexpr std::int64_t typeCheckpoint = 1;

/// Encodings of a serialized string, given by its leading byte.
enum class StringEncoding : std::uint8_t {
  null = 0,
  empty = 1,
  constantPool = 2,
  utf8 = 3,
  charArray = 4,
  latin1 = 5,
};

struct ChunkHeader {
  std::uint16_t major;
  std::uint16_t minor;
  std::int64_t size;
  std::int64_t cpOffset;
  std::int64_t metadataOffset;
  std::int64_t startNanos;
  std::int64_t durationNanos;
  std::int64_t startTicks;
  std::int64_t ticksPerSecond;
  std::uint32_t features;

  bool compressedInts() const noexcept { return features & featureCompressedInts; }
};

/// Parse a chunk header. Returns nothing if the magic does not match.
std::optional<ChunkHeader> readChunkHeader(const char[SZ_ChunkHeader]) noexcept;

}

#endif  // POLLCATCH_DECODER_FORMATS_JFR_H
