// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "publisher.hpp"

#include "poll-records.hpp"
#include "poll-timer.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <new>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

using namespace pollcatch;

// Count every heap allocation made by this test binary, and fail them on demand
static std::atomic<long> allocations{0};
static std::atomic<bool> exhausted{false};

void* operator new(std::size_t n) {
  allocations.fetch_add(1, std::memory_order_relaxed);
  if(exhausted.load(std::memory_order_relaxed)) throw std::bad_alloc();
  if(void* p = std::malloc(n ? n : 1)) return p;
  throw std::bad_alloc();
}
void operator delete(void* p) noexcept { std::free(p); }
void operator delete(void* p, std::size_t) noexcept { std::free(p); }

namespace {

struct RecordingAnnotator final : public Annotator {
  int calls = 0;
  std::uint64_t last = 0;
  void annotate(pid_t, std::uint64_t elapsed) noexcept override {
    ++calls;
    last = elapsed;
    errno = EINTR;  // handlers must not leak errno
  }
};

int chained = 0;
int chainedErrno = 0;
int nestLimit = 0;
const Publisher* reenter = nullptr;

void countingAction(int, siginfo_t*, void*) {
  chainedErrno = errno;
  // Simulate another delivery landing in the middle of the chained handler
  if(reenter != nullptr && chained < nestLimit) {
    ++chained;
    (*reenter)(SIGPROF, nullptr, nullptr);
    return;
  }
  ++chained;
}

int plainCalls = 0;
void plainHandler(int) { ++plainCalls; }

ChainedHandler counting() {
  struct sigaction sa = {};
  sa.sa_sigaction = countingAction;
  sa.sa_flags = SA_SIGINFO;
  return ChainedHandler(sa);
}

void resetCounters() {
  chained = 0;
  chainedErrno = 0;
  nestLimit = 0;
  reenter = nullptr;
  plainCalls = 0;
}

}

TEST(PublisherTest, AnnotatesOnlyInsidePolls) {
  resetCounters();
  RecordingAnnotator annot;
  Publisher pub(annot, counting());

  pub(SIGPROF, nullptr, nullptr);
  EXPECT_EQ(annot.calls, 0);
  EXPECT_EQ(chained, 1);

  PollTimer::enter();
  pub(SIGPROF, nullptr, nullptr);
  PollTimer::exit();
  EXPECT_EQ(annot.calls, 1);
  EXPECT_EQ(chained, 2);
}

TEST(PublisherTest, PreservesErrno) {
  resetCounters();
  RecordingAnnotator annot;
  Publisher pub(annot, counting());
  PollTimer::enter();
  errno = EAGAIN;
  pub(SIGPROF, nullptr, nullptr);
  const int after = errno;
  PollTimer::exit();
  EXPECT_EQ(annot.calls, 1);
  EXPECT_EQ(chainedErrno, EAGAIN);
  EXPECT_EQ(after, EAGAIN);
}

TEST(PublisherTest, NestedDeliveryNeitherAllocatesNorDropsChains) {
  resetCounters();
  RecordingAnnotator annot;
  Publisher pub(annot, counting());
  reenter = &pub;
  nestLimit = 16;

  PollTimer::enter();
  const long before = allocations.load();
  pub(SIGPROF, nullptr, nullptr);
  const long after = allocations.load();
  PollTimer::exit();

  EXPECT_EQ(after, before);
  // One outer delivery plus nestLimit nested ones, each chained exactly once
  EXPECT_EQ(chained, nestLimit + 1);
  EXPECT_EQ(annot.calls, nestLimit + 1);
}

TEST(PublisherTest, ChainedDispositions) {
  resetCounters();
  struct sigaction sa = {};
  sa.sa_handler = SIG_IGN;
  EXPECT_TRUE(ChainedHandler(sa).empty());
  sa.sa_handler = SIG_DFL;
  EXPECT_TRUE(ChainedHandler(sa).empty());

  sa.sa_handler = plainHandler;
  ChainedHandler plain(sa);
  EXPECT_FALSE(plain.empty());
  plain(SIGPROF, nullptr, nullptr);
  EXPECT_EQ(plainCalls, 1);

  // Nothing to chain to is not an error
  RecordingAnnotator annot;
  Publisher pub(annot, ChainedHandler());
  PollTimer::enter();
  pub(SIGPROF, nullptr, nullptr);
  PollTimer::exit();
  EXPECT_EQ(annot.calls, 1);
}

TEST(PublisherTest, AppwordSlot) {
  AppwordAnnotator annot;
  EXPECT_EQ(AppwordAnnotator::take(), 0u);
  annot.annotate(0, 1234);
  EXPECT_EQ(AppwordAnnotator::take(), 1234u);
  EXPECT_EQ(AppwordAnnotator::take(), 0u);
  annot.annotate(0, 0);
  EXPECT_NE(AppwordAnnotator::take(), 0u);
}

TEST(PublisherTest, SignalChainInstallsAndRestores) {
  resetCounters();
  struct sigaction prev = {};
  prev.sa_sigaction = countingAction;
  prev.sa_flags = SA_SIGINFO;
  sigemptyset(&prev.sa_mask);
  struct sigaction original;
  ASSERT_EQ(sigaction(SIGUSR2, &prev, &original), 0);

  RecordingAnnotator annot;
  {
    SignalChain chain(SIGUSR2, annot);
    EXPECT_THROW((SignalChain{SIGUSR1, annot}), std::logic_error);

    raise(SIGUSR2);
    EXPECT_EQ(chained, 1);
    EXPECT_EQ(annot.calls, 0);

    PollTimer::enter();
    raise(SIGUSR2);
    PollTimer::exit();
    EXPECT_EQ(chained, 2);
    EXPECT_EQ(annot.calls, 1);
  }

  struct sigaction now;
  ASSERT_EQ(sigaction(SIGUSR2, nullptr, &now), 0);
  EXPECT_EQ(now.sa_sigaction, countingAction);
  raise(SIGUSR2);
  EXPECT_EQ(chained, 3);
  EXPECT_EQ(annot.calls, 1);

  // A new chain can be installed once the old one is gone
  { SignalChain again(SIGUSR2, annot); }
  ASSERT_EQ(sigaction(SIGUSR2, &original, nullptr), 0);
}

TEST(PublisherTest, SignalChainRejectsBadSignals) {
  RecordingAnnotator annot;
  EXPECT_THROW((SignalChain{SIGKILL, annot}), std::system_error);
  // The failed attempt must not keep the chain claimed
  EXPECT_NO_THROW((SignalChain{SIGUSR2, annot}));
}

TEST(PollRecordsTest, OutOfMemoryStopsTheWriter) {
  const auto path = std::filesystem::temp_directory_path()
                    / ("pollcatch-" + std::to_string(getpid()) + "-oom");
  {
    PollRecordWriter w(path, std::chrono::hours(1));
    exhausted = true;
    w.push(PollRecord{1, 2, 3, 4});
    exhausted = false;
    EXPECT_FALSE(w.good());
    // Later records are dropped instead of queued
    w.push(PollRecord{5, 6, 7, 8});
    w.flush();
    EXPECT_FALSE(w.good());
  }
  EXPECT_EQ(std::filesystem::file_size(path), 0u);
  std::filesystem::remove(path);
}
