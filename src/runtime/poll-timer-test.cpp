// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "poll-timer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace pollcatch;

TEST(PollTimerTest, IdleByDefault) {
  std::thread t([]{
    EXPECT_FALSE(PollTimer::active());
    EXPECT_FALSE(PollTimer::snapshot().has_value());
  });
  t.join();
}

TEST(PollTimerTest, EnterExit) {
  const auto before = monotonicNanos();
  PollTimer::enter();
  EXPECT_TRUE(PollTimer::active());
  auto snap = PollTimer::snapshot();
  ASSERT_TRUE(snap.has_value());
  EXPECT_GE(snap->start, before);
  EXPECT_LE(snap->start, monotonicNanos());
  PollTimer::exit();
  EXPECT_FALSE(PollTimer::active());
  EXPECT_FALSE(PollTimer::snapshot().has_value());
}

TEST(PollTimerTest, ElapsedGrows) {
  PollTimer::enter();
  std::this_thread::sleep_for(std::chrono::milliseconds(2));
  auto snap = PollTimer::snapshot();
  PollTimer::exit();
  ASSERT_TRUE(snap.has_value());
  EXPECT_GE(snap->elapsed, 2000000u);
}

TEST(PollTimerTest, ReentryRestartsTheClock) {
  PollTimer::enter();
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  PollTimer::exit();
  PollTimer::enter();
  auto snap = PollTimer::snapshot();
  PollTimer::exit();
  ASSERT_TRUE(snap.has_value());
  EXPECT_LT(snap->elapsed, 5000000u);
}

TEST(PollTimerTest, PerThread) {
  PollTimer::enter();
  bool otherActive = true;
  std::thread t([&]{ otherActive = PollTimer::snapshot().has_value(); });
  t.join();
  EXPECT_TRUE(PollTimer::active());
  PollTimer::exit();
  EXPECT_FALSE(otherActive);
}
