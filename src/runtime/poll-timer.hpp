// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_RUNTIME_POLL_TIMER_H
#define POLLCATCH_RUNTIME_POLL_TIMER_H

#include <atomic>
#include <cstdint>
#include <optional>

namespace pollcatch {

class PollRecordWriter;

/// Timing of the poll the current thread is in, as seen at one instant.
struct PollSnapshot {
  std::uint64_t start;    ///< Monotonic nanoseconds at poll entry
  std::uint64_t elapsed;  ///< Nanoseconds since poll entry
};

/// Per-thread "in poll since T" state. Written only by the owning thread from
/// normal control flow; read (and `sampled` set) by signal handlers running on
/// that same thread.
struct PollTimerState {
  std::atomic<std::uint64_t> start{0};
  std::atomic<bool> in_poll{false};
  std::atomic<bool> sampled{false};
};

static_assert(std::atomic<std::uint64_t>::is_always_lock_free,
              "Poll start timestamps must be lock-free to be read from signal handlers");
static_assert(std::atomic<bool>::is_always_lock_free,
              "Poll flags must be lock-free to be read from signal handlers");

/// Monotonic clock, in nanoseconds. Async-signal-safe.
std::uint64_t monotonicNanos() noexcept;

/// Narrow interface over the calling thread's PollTimerState.
class PollTimer final {
public:
  PollTimer() = delete;

  /// Mark the calling thread as inside a poll, starting now.
  static void enter() noexcept;

  /// Mark the calling thread as no longer inside a poll. If the poll was
  /// sampled and a recorder is installed, the poll is handed to it.
  static void exit() noexcept;

  /// Return the current poll's start and elapsed time, or nothing if the
  /// calling thread is not inside a poll.
  // MT: Async-Signal-Safe
  static std::optional<PollSnapshot> snapshot() noexcept;

  /// Note that a sample was taken during the current poll.
  // MT: Async-Signal-Safe
  static void mark_sampled() noexcept;

  /// Returns true if the calling thread is inside a poll.
  static bool active() noexcept;

  /// Install (or with nullptr, remove) the process-wide recorder for sampled
  /// polls. The recorder must outlive its installation.
  static void record(PollRecordWriter*) noexcept;
};

}

#endif  // POLLCATCH_RUNTIME_POLL_TIMER_H
