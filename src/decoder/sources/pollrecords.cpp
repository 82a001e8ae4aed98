// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "pollrecords.hpp"

#include "../../common/lean/formats/pollrecords.h"
#include "../../common/util/log.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

using namespace pollcatch;
using namespace sources;

static std::uint64_t mulDivPo2(std::uint64_t v, std::uint64_t mul, std::uint32_t shift) noexcept {
  unsigned __int128 x = (unsigned __int128)v * mul;
  return (std::uint64_t)(shift >= 128 ? 0 : x >> shift);
}

std::uint64_t ClockCalibration::scale(std::uint64_t src) const noexcept {
  const auto delta = src > srcEpoch ? src - srcEpoch : 0;
  return mulDivPo2(delta, mul, shift) + refEpoch;
}

std::uint64_t ClockCalibration::scaleDuration(std::uint64_t delta) const noexcept {
  return mulDivPo2(delta, mul, shift);
}

PollRecords::PollRecords(std::istream& in) {
  std::optional<ClockCalibration> calibration;
  std::uint64_t offset = 0;
  char buf[std::max<int>(FMT_POLLREC_SZ_Poll, FMT_POLLREC_SZ_Calibration)];
  while(true) {
    in.read(buf, FMT_POLLREC_SZ_Hdr);
    const auto got = in.gcount();
    if(got == 0) break;
    if(got < FMT_POLLREC_SZ_Hdr)
      throw CorruptRecords("truncated record header at offset " + std::to_string(offset));
    fmt_pollrec_hdr_t hdr;
    fmt_pollrec_hdr_read(&hdr, buf);

    std::uint32_t need = FMT_POLLREC_SZ_Hdr;
    if(hdr.kind == fmt_pollrec_kind_poll) need = FMT_POLLREC_SZ_Poll;
    else if(hdr.kind == fmt_pollrec_kind_calibration) need = FMT_POLLREC_SZ_Calibration;
    if(hdr.size < need)
      throw CorruptRecords("record at offset " + std::to_string(offset) + " has size "
                           + std::to_string(hdr.size) + ", at least "
                           + std::to_string(need) + " is needed");

    in.read(buf + FMT_POLLREC_SZ_Hdr, need - FMT_POLLREC_SZ_Hdr);
    if((std::uint32_t)in.gcount() != need - FMT_POLLREC_SZ_Hdr)
      throw CorruptRecords("truncated record at offset " + std::to_string(offset));
    // Anything past what we understand is skipped, also for unknown kinds
    const std::streamsize extra = hdr.size - need;
    if(extra > 0) {
      in.ignore(extra);
      if(in.gcount() != extra)
        throw CorruptRecords("truncated record at offset " + std::to_string(offset));
    }
    offset += hdr.size;

    if(hdr.kind == fmt_pollrec_kind_calibration) {
      fmt_pollrec_calibration_t cal;
      fmt_pollrec_calibration_read(&cal, buf);
      calibration = ClockCalibration{cal.srcEpoch, cal.refEpoch, cal.mul, cal.shift};
    } else if(hdr.kind == fmt_pollrec_kind_poll) {
      fmt_pollrec_poll_t poll;
      fmt_pollrec_poll_read(&poll, buf);
      const auto span = poll.end > poll.start ? poll.end - poll.start : 0;
      tsc.push_back({poll.tid, poll.start, span});
      // Without a calibration the recording clock is taken to be monotonic
      const auto duration = calibration ? calibration->scaleDuration(span) : span;
      const auto clockStart = poll.clockEnd > duration ? poll.clockEnd - duration : 0;
      monotonic.push_back({poll.tid, clockStart, duration});
    } else {
      ++unknown;
    }
  }
  if(in.bad()) throw CorruptRecords("read error at offset " + std::to_string(offset));

  std::sort(tsc.begin(), tsc.end());
  std::sort(monotonic.begin(), monotonic.end());
  util::log::info{} << "Read " << tsc.size() << " poll records";
  if(unknown > 0)
    util::log::vwarning{} << "Skipped " << unknown << " poll records of unknown kinds";
}

PollRecords PollRecords::open(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios_base::in | std::ios_base::binary);
  if(!in)
    throw std::system_error(errno, std::generic_category(), "unable to open " + path.string());
  return PollRecords(in);
}

std::optional<std::uint64_t> PollRecords::lookup(ClockSource src, std::uint32_t tid,
                                                 std::uint64_t t) const noexcept {
  const auto& keys = src == ClockSource::tsc ? tsc : monotonic;
  // Last poll on this thread starting no later than t
  auto it = std::partition_point(keys.begin(), keys.end(), [&](const Key& k){
    return k.tid < tid || (k.tid == tid && k.clockStart <= t);
  });
  if(it == keys.begin()) return std::nullopt;
  const Key& k = *std::prev(it);
  if(k.tid == tid && k.clockStart < t && t - k.clockStart < k.duration)
    return t - k.clockStart;
  return std::nullopt;
}
