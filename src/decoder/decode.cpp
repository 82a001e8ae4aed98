// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "decode.hpp"

#include "../common/util/log.hpp"

using namespace pollcatch;
using namespace sources;

static std::uint64_t ticksToNanos(std::uint64_t ticks, std::int64_t tps) noexcept {
  return (std::uint64_t)((unsigned __int128)ticks * 1000000000u / (std::uint64_t)tps);
}

std::vector<PollEvent> pollcatch::decodePolls(const JfrTrace& trace, const Resolver& resolver,
                                              const PollRecords* records) {
  std::vector<PollEvent> out;
  // The profiler's default clock
  ClockSource clock = ClockSource::monotonic;
  std::size_t outside = 0;
  std::size_t stackless = 0;

  for(const auto& ev: trace.events()) {
    if(const auto* setting = std::get_if<RawSetting>(&ev)) {
      if(resolver.string(setting->name) == "clock") {
        clock = resolver.string(setting->value) == "tsc" ? ClockSource::tsc
                                                          : ClockSource::monotonic;
        util::log::debug{} << "Trace clock is now "
                           << (clock == ClockSource::tsc ? "tsc" : "monotonic");
      }
      continue;
    }

    const auto& sample = std::get<RawSample>(ev);
    if(!sample.stackId) {
      ++stackless;
      continue;
    }
    const auto ticks = sample.ticks > 0 ? (std::uint64_t)sample.ticks : 0;
    PollEvent pe;
    pe.timestamp = ticksToNanos(ticks, sample.ticksPerSecond);
    pe.thread = resolver.thread(sample.thread);
    pe.stackId = *sample.stackId;
    pe.duration = 0;

    if(sample.appword && *sample.appword > 0) {
      pe.duration = *sample.appword;
    } else if(records != nullptr && pe.thread >= 0) {
      if(auto delta = records->lookup(clock, (std::uint32_t)pe.thread, ticks))
        pe.duration = ticksToNanos(*delta, sample.ticksPerSecond);
    }

    if(pe.duration == 0) {
      ++outside;
      continue;
    }
    out.push_back(pe);
  }

  util::log::info{} << out.size() << " samples taken inside polls, " << outside << " outside";
  if(stackless > 0)
    util::log::vwarning{} << stackless << " samples without a stack trace were ignored";
  return out;
}
