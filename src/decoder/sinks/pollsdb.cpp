// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "pollsdb.hpp"

#include "../../common/util/log.hpp"

#include "../../common/lean/formats/pollsdb.h"

#include <array>

using namespace pollcatch;
using namespace sinks;

PollsDB::PollsDB(std::filesystem::path p) : file(std::move(p), true) {};

void PollsDB::notifyLongPoll(const PollEvent& ev, const Stack&) {
  polls.push_back(ev);
}

void PollsDB::write() {
  file.initialize();
  auto fi = file.open();

  fmt_pollsdb_fHdr_t fhdr;
  fhdr.nRecords = polls.size();
  fhdr.pRecords = FMT_POLLSDB_SZ_FHdr;

  std::array<char, FMT_POLLSDB_SZ_FHdr> hdrbuf;
  fmt_pollsdb_fHdr_write(hdrbuf.data(), &fhdr);
  fi.writeat(0, hdrbuf);

  std::vector<char> buf(polls.size() * FMT_POLLSDB_SZ_Poll);
  char* cur = buf.data();
  for(const auto& ev: polls) {
    fmt_pollsdb_poll_t rec;
    rec.timestamp = ev.timestamp;
    rec.thread = (std::uint64_t)ev.thread;
    rec.duration = ev.duration;
    rec.stackId = (std::uint64_t)ev.stackId;
    fmt_pollsdb_poll_write(cur, &rec);
    cur += FMT_POLLSDB_SZ_Poll;
  }
  fi.writeat(fhdr.pRecords, buf);
  fi.writeat(fhdr.pRecords + buf.size(), sizeof fmt_pollsdb_footer, fmt_pollsdb_footer);

  util::log::info{} << "Exported " << polls.size() << " long polls to " << file.path().string();
}
