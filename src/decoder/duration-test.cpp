// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "duration.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace pollcatch;
using namespace std::literals::chrono_literals;

TEST(DurationTest, Units) {
  EXPECT_EQ(parseDuration("5ms"), 5ms);
  EXPECT_EQ(parseDuration("250us"), 250us);
  EXPECT_EQ(parseDuration("250\xC2\xB5s"), 250us);
  EXPECT_EQ(parseDuration("17ns"), 17ns);
  EXPECT_EQ(parseDuration("2s"), 2s);
  EXPECT_EQ(parseDuration("3min"), 3min);
  EXPECT_EQ(parseDuration("3m"), 3min);
  EXPECT_EQ(parseDuration("1h"), 1h);
  EXPECT_EQ(parseDuration("2 days"), 48h);
  EXPECT_EQ(parseDuration("1w"), 168h);
  EXPECT_EQ(parseDuration("1M"), std::chrono::seconds(2630016));
  EXPECT_EQ(parseDuration("1y"), std::chrono::seconds(31557600));
  EXPECT_EQ(parseDuration("0s"), 0ns);
}

TEST(DurationTest, Sequences) {
  EXPECT_EQ(parseDuration("1s 500ms"), 1500ms);
  EXPECT_EQ(parseDuration("1s500ms"), 1500ms);
  EXPECT_EQ(parseDuration(" 2h 5min "), 125min);
  EXPECT_EQ(parseDuration("1 second 2 msec"), 1002ms);
}

TEST(DurationTest, Invalid) {
  EXPECT_THROW(parseDuration(""), std::invalid_argument);
  EXPECT_THROW(parseDuration("   "), std::invalid_argument);
  EXPECT_THROW(parseDuration("5"), std::invalid_argument);
  EXPECT_THROW(parseDuration("ms"), std::invalid_argument);
  EXPECT_THROW(parseDuration("5 parsecs"), std::invalid_argument);
  EXPECT_THROW(parseDuration("-5ms"), std::invalid_argument);
  EXPECT_THROW(parseDuration("1.5s"), std::invalid_argument);
  EXPECT_THROW(parseDuration("99999999999999999999ns"), std::invalid_argument);
  EXPECT_THROW(parseDuration("1000y"), std::invalid_argument);
}

TEST(DurationTest, Format) {
  EXPECT_EQ(formatDuration(0ns), "0s");
  EXPECT_EQ(formatDuration(1500ms), "1s 500ms");
  EXPECT_EQ(formatDuration(90min + 7us), "1h 30m 7us");
  EXPECT_EQ(parseDuration(formatDuration(123456789ns)), 123456789ns);
}
