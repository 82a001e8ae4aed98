// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "publisher.hpp"

#include "poll-timer.hpp"

#include "../common/util/log.hpp"

#include <atomic>
#include <cerrno>
#include <stdexcept>
#include <string.h>
#include <system_error>
#include <sched.h>
#include <unistd.h>
#include <sys/syscall.h>

using namespace pollcatch;

ChainedHandler::ChainedHandler(const struct sigaction& sa) noexcept {
  if(sa.sa_flags & SA_SIGINFO) {
    action = sa.sa_sigaction;
  } else if(sa.sa_handler != SIG_DFL && sa.sa_handler != SIG_IGN) {
    handler = sa.sa_handler;
  }
}

void ChainedHandler::operator()(int sig, siginfo_t* info, void* uc) const noexcept {
  if(action != nullptr) action(sig, info, uc);
  else if(handler != nullptr) handler(sig);
}

static thread_local std::atomic<std::uint64_t> appword
    __attribute__((tls_model("initial-exec"))) {0};

void AppwordAnnotator::annotate(pid_t, std::uint64_t elapsed) noexcept {
  // Never report a zero, that reads as "not in a poll"
  appword.store(elapsed == 0 ? 1 : elapsed, std::memory_order_relaxed);
}

std::uint64_t AppwordAnnotator::take() noexcept {
  return appword.exchange(0, std::memory_order_relaxed);
}

Publisher::Publisher(Annotator& a, ChainedHandler prev) noexcept
  : annotator(a), previous(prev) {}

void Publisher::operator()(int sig, siginfo_t* info, void* uc) const noexcept {
  const int saved_errno = errno;
  if(auto snap = PollTimer::snapshot()) {
    annotator.annotate((pid_t)syscall(SYS_gettid), snap->elapsed);
    PollTimer::mark_sampled();
  }
  errno = saved_errno;
  previous(sig, info, uc);
}

// The installed Publisher and the number of trampolines currently running.
// The chained handler is kept separately so a trampoline that runs while the
// chain is being torn down still forwards the signal.
static std::atomic<const Publisher*> installed{nullptr};
static std::atomic<int> inflight{0};
static std::atomic<bool> claimed{false};
static ChainedHandler fallback;

void SignalChain::trampoline(int sig, siginfo_t* info, void* uc) noexcept {
  inflight.fetch_add(1, std::memory_order_acq_rel);
  if(const Publisher* p = installed.load(std::memory_order_acquire))
    (*p)(sig, info, uc);
  else
    fallback(sig, info, uc);
  inflight.fetch_sub(1, std::memory_order_release);
}

static struct sigaction claim(int signo) {
  if(claimed.exchange(true, std::memory_order_acq_rel))
    throw std::logic_error("a signal chain is already installed");
  struct sigaction old = {};
  if(sigaction(signo, nullptr, &old) != 0) {
    const int err = errno;
    claimed.store(false, std::memory_order_release);
    throw std::system_error(err, std::generic_category(), "sigaction");
  }
  return old;
}

SignalChain::SignalChain(int s, Annotator& a)
  : signo(s), saved(claim(s)), publisher(a, ChainedHandler(saved)) {
  fallback = ChainedHandler(saved);
  installed.store(&publisher, std::memory_order_release);

  struct sigaction sa = {};
  sa.sa_sigaction = &SignalChain::trampoline;
  sa.sa_mask = saved.sa_mask;
  sa.sa_flags = SA_SIGINFO | SA_RESTART | (saved.sa_flags & SA_ONSTACK);
  if(sigaction(signo, &sa, nullptr) != 0) {
    const int err = errno;
    installed.store(nullptr, std::memory_order_release);
    claimed.store(false, std::memory_order_release);
    throw std::system_error(err, std::generic_category(), "sigaction");
  }
}

SignalChain::~SignalChain() {
  if(sigaction(signo, &saved, nullptr) != 0) {
    char buf[1024];
    util::log::error{} << "Unable to restore the handler for signal " << signo
                       << ": " << strerror_r(errno, buf, sizeof buf)
                       << ", samples will still be forwarded";
  }
  installed.store(nullptr, std::memory_order_release);
  while(inflight.load(std::memory_order_acquire) > 0) sched_yield();
  claimed.store(false, std::memory_order_release);
}
