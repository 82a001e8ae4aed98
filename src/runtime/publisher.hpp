// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_RUNTIME_PUBLISHER_H
#define POLLCATCH_RUNTIME_PUBLISHER_H

#include <csignal>
#include <cstdint>
#include <sys/types.h>

namespace pollcatch {

/// Handler that was installed for a signal before we took it over.
/// SIG_DFL and SIG_IGN dispositions are never invoked.
class ChainedHandler final {
public:
  ChainedHandler() noexcept = default;
  explicit ChainedHandler(const struct sigaction&) noexcept;

  /// Invoke the handler, in whichever calling convention it was installed with.
  // MT: Async-Signal-Safe
  void operator()(int, siginfo_t*, void*) const noexcept;

  /// Returns true if there is nothing to chain to.
  bool empty() const noexcept { return action == nullptr && handler == nullptr; }

private:
  void (*action)(int, siginfo_t*, void*) = nullptr;
  void (*handler)(int) = nullptr;
};

/// Sink for the poll timing of a sample, typically the profiler's per-sample
/// annotation slot. Implementations are called from signal handlers and must
/// be async-signal-safe.
class Annotator {
public:
  virtual ~Annotator() = default;

  /// Annotate the sample being taken on thread `tid`, which has been inside
  /// its current poll for `elapsed` nanoseconds.
  virtual void annotate(pid_t tid, std::uint64_t elapsed) noexcept = 0;
};

/// Annotator storing the elapsed time into a per-thread slot, read back by the
/// profiler through pollcatch_asprof_helper().
class AppwordAnnotator final : public Annotator {
public:
  void annotate(pid_t, std::uint64_t elapsed) noexcept override;

  /// Return and clear the calling thread's slot.
  // MT: Async-Signal-Safe
  static std::uint64_t take() noexcept;
};

/// Signal-time half of the instrumentation: reads the Poll Timer, annotates
/// the sample and then chains to the previous handler.
class Publisher final {
public:
  Publisher(Annotator&, ChainedHandler) noexcept;

  /// Handle one delivery of the signal. Never allocates, locks or blocks, and
  /// always ends with exactly one invocation of the chained handler.
  // MT: Async-Signal-Safe
  void operator()(int, siginfo_t*, void*) const noexcept;

private:
  Annotator& annotator;
  ChainedHandler previous;
};

/// Process-wide installation of a Publisher in front of the current handler
/// for a signal. Only one SignalChain may exist at a time.
class SignalChain final {
public:
  /// Install the chain. Throws std::logic_error if a chain is already
  /// installed and std::system_error if the disposition cannot be changed.
  SignalChain(int signo, Annotator&);

  /// Restore the previous disposition and wait for in-flight handlers.
  ~SignalChain();

  SignalChain(const SignalChain&) = delete;
  SignalChain(SignalChain&&) = delete;
  SignalChain& operator=(const SignalChain&) = delete;
  SignalChain& operator=(SignalChain&&) = delete;

  int signal() const noexcept { return signo; }

private:
  static void trampoline(int, siginfo_t*, void*) noexcept;

  int signo;
  struct sigaction saved;
  Publisher publisher;
};

}

#endif  // POLLCATCH_RUNTIME_PUBLISHER_H
