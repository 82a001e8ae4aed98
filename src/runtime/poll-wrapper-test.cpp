// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "poll-wrapper.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace pollcatch;

namespace {

// Timer that only counts, and notices overlapping brackets
struct CountingTimer {
  static inline int enters = 0;
  static inline int exits = 0;
  static inline int overlaps = 0;
  static inline bool inside = false;

  static void reset() { enters = exits = overlaps = 0; inside = false; }
  static void enter() noexcept {
    if(inside) ++overlaps;
    ++enters;
    inside = true;
  }
  static void exit() noexcept {
    ++exits;
    inside = false;
  }
  static bool active() noexcept { return inside; }
};

struct Countdown {
  int remaining;
  PollStatus resume() {
    EXPECT_TRUE(CountingTimer::inside);
    return --remaining > 0 ? PollStatus::pending : PollStatus::ready;
  }
};

struct Failing {
  PollStatus resume() { throw std::runtime_error("boom"); }
};

class CountdownResumable : public Resumable {
public:
  explicit CountdownResumable(int n) : remaining(n) {}
  PollStatus resume() override {
    return --remaining > 0 ? PollStatus::pending : PollStatus::ready;
  }
  int remaining;
};

}

TEST(PollWrapperTest, PairedAcrossSuspends) {
  CountingTimer::reset();
  PollTimed<Countdown, CountingTimer> f(Countdown{3});
  EXPECT_EQ(f.resume(), PollStatus::pending);
  EXPECT_EQ(f.resume(), PollStatus::pending);
  EXPECT_EQ(f.resume(), PollStatus::ready);
  EXPECT_EQ(CountingTimer::enters, 3);
  EXPECT_EQ(CountingTimer::exits, 3);
  EXPECT_EQ(CountingTimer::overlaps, 0);
  EXPECT_FALSE(CountingTimer::inside);
}

TEST(PollWrapperTest, ExitOnThrow) {
  CountingTimer::reset();
  PollTimed<Failing, CountingTimer> f(Failing{});
  EXPECT_THROW(f.resume(), std::runtime_error);
  EXPECT_THROW(f.resume(), std::runtime_error);
  EXPECT_EQ(CountingTimer::enters, 2);
  EXPECT_EQ(CountingTimer::exits, 2);
  EXPECT_FALSE(CountingTimer::inside);
}

TEST(PollWrapperTest, NestedWrappersShareOneBracket) {
  CountingTimer::reset();
  struct Outer {
    PollTimed<Countdown, CountingTimer> inner{Countdown{2}};
    PollStatus resume() { return inner.resume(); }
  };
  PollTimed<Outer, CountingTimer> f(std::in_place);
  EXPECT_EQ(f.resume(), PollStatus::pending);
  EXPECT_EQ(f.resume(), PollStatus::ready);
  EXPECT_EQ(CountingTimer::enters, 2);
  EXPECT_EQ(CountingTimer::exits, 2);
  EXPECT_EQ(CountingTimer::overlaps, 0);
}

TEST(PollWrapperTest, Transparent) {
  CountingTimer::reset();
  TimedResumable<CountingTimer> r(std::make_unique<CountdownResumable>(2));
  Resumable& base = r;
  EXPECT_EQ(base.resume(), PollStatus::pending);
  EXPECT_EQ(base.resume(), PollStatus::ready);
  EXPECT_EQ(static_cast<CountdownResumable&>(r.get()).remaining, 0);
  EXPECT_EQ(CountingTimer::enters, CountingTimer::exits);
}

TEST(PollWrapperTest, DrivesPollTimer) {
  struct Probe {
    bool sawPoll = false;
    PollStatus resume() {
      sawPoll = PollTimer::snapshot().has_value();
      return PollStatus::ready;
    }
  };
  auto f = timed(Probe{});
  EXPECT_EQ(f.resume(), PollStatus::ready);
  EXPECT_TRUE(f.get().sawPoll);
  EXPECT_FALSE(PollTimer::active());
}
