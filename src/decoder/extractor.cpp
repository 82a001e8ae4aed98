// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "extractor.hpp"

#include "../common/util/log.hpp"

using namespace pollcatch;

Extractor::Extractor(Options o) : opts(std::move(o)) {};

Extractor& Extractor::operator<<(ReportSink& s) {
  sinks.push_back(s);
  return *this;
}

bool Extractor::idle(const Stack& s) const noexcept {
  for(const auto& f: s.frames)
    for(const auto& pat: opts.skipFrames)
      if(f.symbol.find(pat) != std::string::npos) return true;
  return false;
}

std::size_t Extractor::run(const std::vector<PollEvent>& events, Resolver& resolver) const {
  const auto threshold = (std::uint64_t)opts.threshold.count();
  std::size_t kept = 0;
  std::size_t idled = 0;
  for(const auto& ev: events) {
    if(ev.duration < threshold) continue;
    const Stack& stack = resolver.stack(ev.stackId);
    if(!opts.skipFrames.empty() && idle(stack)) {
      ++idled;
      continue;
    }
    for(ReportSink& s: sinks) s.notifyLongPoll(ev, stack);
    ++kept;
  }
  util::log::info{} << kept << " of " << events.size() << " polls reached the threshold";
  if(idled > 0)
    util::log::info{} << idled << " long polls skipped as idle";
  return kept;
}
