// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_SOURCES_POLLRECORDS_H
#define POLLCATCH_DECODER_SOURCES_POLLRECORDS_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <stdexcept>
#include <vector>

namespace pollcatch::sources {

/// The poll record file is damaged: a truncated record, or a record smaller
/// than its kind requires.
class CorruptRecords : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Clock the profiler timestamps its samples with.
enum class ClockSource { tsc, monotonic };

/// Mapping from the recording clock onto CLOCK_MONOTONIC nanoseconds:
///   monotonic = ((src - srcEpoch) * mul >> shift) + refEpoch
struct ClockCalibration {
  std::uint64_t srcEpoch;
  std::uint64_t refEpoch;
  std::uint64_t mul;
  std::uint32_t shift;

  std::uint64_t scale(std::uint64_t src) const noexcept;
  std::uint64_t scaleDuration(std::uint64_t delta) const noexcept;
};

/// Sampled polls recorded by the runtime, indexed for lookup by thread and
/// time in either clock the profiler may use.
class PollRecords final {
public:
  /// Read every record from the stream. Throws CorruptRecords.
  explicit PollRecords(std::istream&);
  ~PollRecords() = default;

  PollRecords(PollRecords&&) = default;
  PollRecords& operator=(PollRecords&&) = default;

  /// Read the file at the given path. Throws CorruptRecords, or
  /// std::system_error if the file cannot be opened.
  static PollRecords open(const std::filesystem::path&);

  /// Time since the start of the recorded poll on thread `tid` enclosing
  /// time `t`, both in the given clock. Nothing if no poll encloses `t`.
  std::optional<std::uint64_t> lookup(ClockSource, std::uint32_t tid,
                                      std::uint64_t t) const noexcept;

  /// Number of poll records read.
  std::size_t size() const noexcept { return tsc.size(); }

  /// Number of records of unknown kinds skipped.
  std::size_t skipped() const noexcept { return unknown; }

  struct Key {
    std::uint32_t tid;
    std::uint64_t clockStart;
    std::uint64_t duration;

    bool operator<(const Key& o) const noexcept {
      if(tid != o.tid) return tid < o.tid;
      if(clockStart != o.clockStart) return clockStart < o.clockStart;
      return duration < o.duration;
    }
  };

private:
  std::vector<Key> tsc;
  std::vector<Key> monotonic;
  std::size_t unknown = 0;
};

}

#endif  // POLLCATCH_DECODER_SOURCES_POLLRECORDS_H
