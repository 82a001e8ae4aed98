// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "pollsdb.hpp"

#include "../../common/util/file.hpp"
#include "../../common/util/log.hpp"

#include "../../common/lean/formats/pollsdb.h"

#include <cstring>

using namespace pollcatch;
using namespace sources;

std::vector<PollEvent> sources::readPollsDB(const std::filesystem::path& path) {
  util::File file(path, false);
  file.initialize();
  const auto size = file.size();
  if(size < FMT_POLLSDB_SZ_FHdr + sizeof fmt_pollsdb_footer)
    throw CorruptPollsDB(path.string() + ": too small to be a polls.db");
  auto fi = file.open();

  char hdrbuf[FMT_POLLSDB_SZ_FHdr];
  fi.readat(0, sizeof hdrbuf, hdrbuf);
  uint8_t minor;
  switch(fmt_pollsdb_check(hdrbuf, &minor)) {
  case fmt_version_invalid:
    throw CorruptPollsDB(path.string() + ": not a polls.db file");
  case fmt_version_major:
    throw CorruptPollsDB(path.string() + ": unsupported major version "
                         + std::to_string((int)(uint8_t)hdrbuf[0x0e]));
  case fmt_version_forward:
    util::log::warning{} << path.string() << ": polls.db minor version " << (int)minor
                         << " is newer than supported, some fields may be missed";
    break;
  case fmt_version_backward:
  case fmt_version_exact:
    break;
  }

  fmt_pollsdb_fHdr_t fhdr;
  fmt_pollsdb_fHdr_read(&fhdr, hdrbuf);
  if(fhdr.pRecords < FMT_POLLSDB_SZ_FHdr || fhdr.pRecords > size
     || fhdr.nRecords > (size - fhdr.pRecords) / FMT_POLLSDB_SZ_Poll
     || fhdr.pRecords + fhdr.nRecords * FMT_POLLSDB_SZ_Poll + sizeof fmt_pollsdb_footer > size)
    throw CorruptPollsDB(path.string() + ": record array exceeds the file");

  char footer[sizeof fmt_pollsdb_footer];
  fi.readat(size - sizeof footer, sizeof footer, footer);
  if(std::memcmp(footer, fmt_pollsdb_footer, sizeof footer) != 0)
    throw CorruptPollsDB(path.string() + ": missing footer, file may be truncated");

  std::vector<char> buf(fhdr.nRecords * FMT_POLLSDB_SZ_Poll);
  fi.readat(fhdr.pRecords, buf.size(), buf.data());

  std::vector<PollEvent> polls;
  polls.reserve(fhdr.nRecords);
  for(std::size_t i = 0; i < fhdr.nRecords; i++) {
    fmt_pollsdb_poll_t rec;
    fmt_pollsdb_poll_read(&rec, buf.data() + i * FMT_POLLSDB_SZ_Poll);
    polls.push_back({rec.timestamp, (std::int64_t)rec.thread, rec.duration,
                     (std::int64_t)rec.stackId});
  }
  return polls;
}
