// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_RUNTIME_POLL_RECORDS_H
#define POLLCATCH_RUNTIME_POLL_RECORDS_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <vector>

namespace pollcatch {

/// A single sampled poll, as recorded on poll exit.
struct PollRecord {
  std::uint64_t start;
  std::uint64_t end;
  std::uint64_t clockEnd;
  std::uint32_t tid;
};

/// Mapping from a source clock onto CLOCK_MONOTONIC nanoseconds.
struct Calibration {
  std::uint64_t srcEpoch;
  std::uint64_t refEpoch;
  std::uint64_t mul;
  std::uint32_t shift;
};

/// Background writer for the poll record file. Records are queued from the
/// executor threads and written by a dedicated thread, which flushes the file
/// at least once every flush interval.
///
/// Never call into this from a signal handler.
class PollRecordWriter final {
public:
  /// Open (truncating) the record file at the given path and start the
  /// writer thread. Throws std::runtime_error if the file cannot be opened.
  explicit PollRecordWriter(const std::filesystem::path&,
      std::chrono::milliseconds flushInterval = std::chrono::seconds(1));

  /// Stops the writer thread after writing everything queued.
  ~PollRecordWriter();

  PollRecordWriter(const PollRecordWriter&) = delete;
  PollRecordWriter& operator=(const PollRecordWriter&) = delete;

  /// Queue a sampled poll.
  // MT: Internally Synchronized
  void push(const PollRecord&) noexcept;

  /// Queue a clock calibration.
  // MT: Internally Synchronized
  void push(const Calibration&) noexcept;

  /// Block until everything queued so far has been written and flushed.
  // MT: Internally Synchronized
  void flush();

  /// Returns false once the writer has given up, after an I/O error or
  /// running out of memory.
  bool good() const noexcept;

private:
  void enqueue(const char*, std::size_t) noexcept;
  void run();

  std::ofstream out;
  std::chrono::milliseconds interval;

  mutable std::mutex lock;
  std::condition_variable wake;
  std::condition_variable flushed;
  std::vector<char> pending;
  std::uint64_t queuedGen = 0;
  std::uint64_t writtenGen = 0;
  bool stopping = false;
  bool flushWanted = false;
  bool failed = false;

  std::thread writer;
};

}

#endif  // POLLCATCH_RUNTIME_POLL_RECORDS_H
