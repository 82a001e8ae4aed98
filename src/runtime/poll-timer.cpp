// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "poll-timer.hpp"

#include "poll-records.hpp"

#include <time.h>
#include <unistd.h>
#include <sys/syscall.h>

using namespace pollcatch;

// initial-exec keeps the first access from a signal handler off the
// dynamic TLS allocation path.
static thread_local PollTimerState state
    __attribute__((tls_model("initial-exec")));

static std::atomic<PollRecordWriter*> recorder{nullptr};

std::uint64_t pollcatch::monotonicNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (std::uint64_t)ts.tv_sec * 1000000000ULL + (std::uint64_t)ts.tv_nsec;
}

void PollTimer::enter() noexcept {
  state.sampled.store(false, std::memory_order_relaxed);
  state.start.store(monotonicNanos(), std::memory_order_relaxed);
  // A handler that sees in_poll must also see the start stored above
  std::atomic_signal_fence(std::memory_order_release);
  state.in_poll.store(true, std::memory_order_release);
}

void PollTimer::exit() noexcept {
  state.in_poll.store(false, std::memory_order_release);
  std::atomic_signal_fence(std::memory_order_seq_cst);
  if(!state.sampled.load(std::memory_order_acquire)) return;
  state.sampled.store(false, std::memory_order_relaxed);

  PollRecordWriter* w = recorder.load(std::memory_order_acquire);
  if(w == nullptr) return;
  const auto end = monotonicNanos();
  w->push(PollRecord{state.start.load(std::memory_order_relaxed), end, end,
           (std::uint32_t)syscall(SYS_gettid)});
}

std::optional<PollSnapshot> PollTimer::snapshot() noexcept {
  if(!state.in_poll.load(std::memory_order_acquire)) return std::nullopt;
  std::atomic_signal_fence(std::memory_order_acquire);
  const auto start = state.start.load(std::memory_order_relaxed);
  const auto now = monotonicNanos();
  return PollSnapshot{start, now > start ? now - start : 0};
}

void PollTimer::mark_sampled() noexcept {
  state.sampled.store(true, std::memory_order_relaxed);
}

bool PollTimer::active() noexcept {
  return state.in_poll.load(std::memory_order_relaxed);
}

void PollTimer::record(PollRecordWriter* w) noexcept {
  recorder.store(w, std::memory_order_release);
}
