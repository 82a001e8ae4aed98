// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_RUNTIME_POLL_WRAPPER_H
#define POLLCATCH_RUNTIME_POLL_WRAPPER_H

#include "poll-timer.hpp"

#include <memory>
#include <type_traits>
#include <utility>

namespace pollcatch {

/// Outcome of a single resume of a suspendable computation.
enum class PollStatus { pending, ready };

/// Abstract suspendable computation, for executors that hold their tasks by
/// interface rather than by type.
class Resumable {
public:
  virtual ~Resumable() = default;

  /// Make as much progress as possible without blocking.
  virtual PollStatus resume() = 0;
};

/// Timing bracket around one poll. The outermost scope on a thread owns the
/// bracket, nested scopes are no-ops. The bracket is closed on every exit
/// path, exceptions included.
template<class Timer = PollTimer>
class PollScope final {
public:
  PollScope() noexcept : owner(!Timer::active()) {
    if(owner) Timer::enter();
  }
  ~PollScope() {
    if(owner) Timer::exit();
  }

  PollScope(const PollScope&) = delete;
  PollScope(PollScope&&) = delete;
  PollScope& operator=(const PollScope&) = delete;
  PollScope& operator=(PollScope&&) = delete;

private:
  bool owner;
};

/// Decorator that times every resume() of the wrapped computation. Apart from
/// the timing bracket it behaves exactly as the computation does.
template<class F, class Timer = PollTimer>
class PollTimed {
public:
  template<class... Args>
  explicit PollTimed(std::in_place_t, Args&&... args)
    : inner(std::forward<Args>(args)...) {}
  explicit PollTimed(F f) : inner(std::move(f)) {}

  decltype(auto) resume() {
    PollScope<Timer> scope;
    return inner.resume();
  }

  /// Access the wrapped computation, e.g. to fetch its result once ready.
  F& get() noexcept { return inner; }
  const F& get() const noexcept { return inner; }

private:
  F inner;
};

/// Timed wrapper over any Resumable, itself usable as a Resumable.
template<class Timer = PollTimer>
class TimedResumable final : public Resumable {
public:
  explicit TimedResumable(std::unique_ptr<Resumable> r)
    : inner(std::move(r)) {}

  PollStatus resume() override {
    PollScope<Timer> scope;
    return inner->resume();
  }

  Resumable& get() noexcept { return *inner; }

private:
  std::unique_ptr<Resumable> inner;
};

/// Wrap the given computation so that its polls are timed.
template<class F>
PollTimed<std::decay_t<F>> timed(F&& f) {
  return PollTimed<std::decay_t<F>>(std::forward<F>(f));
}

}

#endif  // POLLCATCH_RUNTIME_POLL_WRAPPER_H
