// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "poll-records.hpp"

#include "../common/util/log.hpp"
#include "../common/lean/formats/pollrecords.h"

#include <cerrno>
#include <cstring>
#include <new>
#include <stdexcept>

using namespace pollcatch;

PollRecordWriter::PollRecordWriter(const std::filesystem::path& path,
                                   std::chrono::milliseconds flushInterval)
  : out(path, std::ios_base::out | std::ios_base::binary | std::ios_base::trunc),
    interval(flushInterval) {
  if(!out)
    throw std::runtime_error("unable to open poll record file " + path.string()
                             + ": " + std::strerror(errno));
  writer = std::thread([this]{ run(); });
}

PollRecordWriter::~PollRecordWriter() {
  {
    std::unique_lock<std::mutex> l(lock);
    stopping = true;
  }
  wake.notify_all();
  writer.join();
}

void PollRecordWriter::push(const PollRecord& rec) noexcept {
  fmt_pollrec_poll_t fmt = {rec.start, rec.end, rec.clockEnd, rec.tid};
  char buf[FMT_POLLREC_SZ_Poll];
  fmt_pollrec_poll_write(buf, &fmt);

  enqueue(buf, sizeof buf);
}

void PollRecordWriter::push(const Calibration& cal) noexcept {
  fmt_pollrec_calibration_t fmt = {cal.srcEpoch, cal.refEpoch, cal.mul, cal.shift};
  char buf[FMT_POLLREC_SZ_Calibration];
  fmt_pollrec_calibration_write(buf, &fmt);

  enqueue(buf, sizeof buf);
}

void PollRecordWriter::enqueue(const char* data, std::size_t size) noexcept {
  std::unique_lock<std::mutex> l(lock);
  if(failed) return;
  try {
    pending.insert(pending.end(), data, data + size);
  } catch(std::bad_alloc&) {
    // No logging here, it would allocate as well
    failed = true;
    pending.clear();
    flushed.notify_all();
    return;
  }
  ++queuedGen;
}

void PollRecordWriter::flush() {
  std::unique_lock<std::mutex> l(lock);
  const auto target = queuedGen;
  flushWanted = true;
  wake.notify_all();
  flushed.wait(l, [&]{ return writtenGen >= target || failed; });
}

bool PollRecordWriter::good() const noexcept {
  std::unique_lock<std::mutex> l(lock);
  return !failed;
}

void PollRecordWriter::run() {
  std::vector<char> batch;
  std::unique_lock<std::mutex> l(lock);
  while(true) {
    wake.wait(l, [&]{ return stopping || queuedGen > writtenGen; });
    // Gather whatever else arrives within one interval into a single write
    wake.wait_for(l, interval, [&]{ return stopping || flushWanted; });
    flushWanted = false;

    batch.swap(pending);
    const auto gen = queuedGen;
    const bool last = stopping;
    l.unlock();

    if(!batch.empty()) {
      out.write(batch.data(), batch.size());
      out.flush();
      batch.clear();
    }
    const bool ok = static_cast<bool>(out);
    if(!ok)
      util::log::error{} << "Error writing the poll record file, no further polls will be recorded";

    l.lock();
    writtenGen = gen;
    if(!ok) {
      failed = true;
      pending.clear();
    }
    flushed.notify_all();
    if(last || failed) return;
  }
}
