// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "longpolls.hpp"

#include "decode.hpp"
#include "duration.hpp"
#include "extractor.hpp"
#include "resolver.hpp"
#include "sinks/pollsdb.hpp"
#include "sinks/textreport.hpp"
#include "sources/jfr.hpp"
#include "sources/pollrecords.hpp"
#include "sources/pollsdb.hpp"

#include "../common/util/log.hpp"

#include <memory>
#include <optional>
#include <system_error>

using namespace pollcatch;

int pollcatch::longpolls(const DecoderArgs& args, std::ostream& out) {
  bool failed = false;

  std::optional<sources::PollRecords> records;
  if(args.prFile) {
    try {
      records = sources::PollRecords::open(*args.prFile);
    } catch(sources::CorruptRecords& e) {
      util::log::error{} << args.prFile->string() << ": " << e.what();
      failed = true;
    } catch(std::system_error& e) {
      util::log::error{} << args.prFile->string() << ": " << e.what();
      failed = true;
    }
  }

  util::log::info{} << "Reporting polls of at least " << formatDuration(args.minLength);
  sinks::TextReport report(out, args.stackDepth);
  std::unique_ptr<sinks::PollsDB> db;
  if(args.exportPath) db = std::make_unique<sinks::PollsDB>(*args.exportPath);

  Extractor extractor({args.minLength, args.skipFrames});
  extractor << report;
  if(db) extractor << *db;

  for(const auto& path: args.traces) {
    try {
      auto trace = sources::JfrTrace::open(path);
      util::log::info{} << "Decoded " << path.string();
      Resolver resolver(trace.pools());
      const auto events = decodePolls(trace, resolver, records ? &*records : nullptr);
      extractor.run(events, resolver);
    } catch(sources::CorruptTrace& e) {
      util::log::error{} << path.string() << ": corrupt trace: " << e.what();
      failed = true;
    } catch(std::system_error& e) {
      util::log::error{} << path.string() << ": " << e.what();
      failed = true;
    }
  }

  report.write();
  if(db) {
    try {
      db->write();
    } catch(std::system_error& e) {
      util::log::error{} << e.what();
      failed = true;
    }
  }
  return failed ? 1 : 0;
}

int pollcatch::dump(const DecoderArgs& args, std::ostream& out) {
  std::vector<PollEvent> polls;
  try {
    polls = sources::readPollsDB(args.pollsdb);
  } catch(sources::CorruptPollsDB& e) {
    util::log::error{} << e.what();
    return 1;
  } catch(std::system_error& e) {
    util::log::error{} << e.what();
    return 1;
  }
  for(const auto& p: polls) {
    out << '[' << sinks::formatTimestamp(p.timestamp) << "] thread " << p.thread
        << " - poll of " << p.duration / 1000u << "us, stack " << p.stackId << '\n';
  }
  out.flush();
  return 0;
}
