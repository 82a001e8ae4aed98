// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "extractor.hpp"

#include "decode.hpp"
#include "sinks/textreport.hpp"
#include "test/jfr-builder.hpp"

#include "../common/lean/formats/pollrecords.h"

#include <gtest/gtest.h>

#include <iterator>
#include <sstream>

using namespace pollcatch;
using namespace sources;
using namespace std::literals::chrono_literals;
using test::ChunkBuilder;

namespace {

constexpr std::int64_t ms = 1000000;

JfrTrace decode(const std::string& bytes) {
  std::istringstream in(bytes);
  return JfrTrace(in);
}

// One frame per method name, all in class "A".
ChunkBuilder& withStack(ChunkBuilder& b, std::int64_t key, const std::vector<std::string>& names) {
  b.symbol(1000, "A").javaClass(1000, 1000);
  std::vector<std::int64_t> methods;
  for(std::size_t i = 0; i < names.size(); i++) {
    const std::int64_t id = key * 1000 + i + 1;
    b.symbol(id, names[i]).method(id, 1000, id);
    methods.push_back(id);
  }
  return b.stack(key, methods);
}

struct Collector final : ReportSink {
  std::vector<PollEvent> polls;
  void notifyLongPoll(const PollEvent& ev, const Stack&) override { polls.push_back(ev); }
};

std::string report(const std::string& trace, std::chrono::nanoseconds threshold,
                   std::size_t depth, std::vector<std::string> skip = {}) {
  auto t = decode(trace);
  Resolver r(t.pools());
  std::ostringstream ss;
  sinks::TextReport text(ss, depth);
  Extractor ex({threshold, std::move(skip)});
  ex << text;
  ex.run(decodePolls(t, r), r);
  text.write();
  return ss.str();
}

}

TEST(ExtractorTest, Threshold) {
  ChunkBuilder b;
  b.thread(1, 7);
  withStack(b, 1, {"run"});
  b.wallClock(1000000000, 1, 1, 2 * ms);
  b.wallClock(1000000000, 1, 1, 6 * ms);
  b.wallClock(2000000000, 1, 1, 11 * ms);
  EXPECT_EQ(report(b.build(), 5ms, 5),
            "[1.000000] thread 7 - poll of 6000us\n"
            " -   1: A.run\n"
            "\n"
            "[2.000000] thread 7 - poll of 11000us\n"
            " -   1: A.run\n"
            "\n");
}

TEST(ExtractorTest, DepthTruncation) {
  std::vector<std::string> names;
  for(int i = 0; i < 60; i++) names.push_back("f" + std::to_string(i));
  ChunkBuilder b;
  b.thread(1, 7);
  withStack(b, 1, names);
  b.wallClock(1500000, 1, 1, 10 * ms);
  EXPECT_EQ(report(b.build(), 1ms, 5),
            "[0.001500] thread 7 - poll of 10000us\n"
            " -   1: A.f0\n"
            " -   2: A.f1\n"
            " -   3: A.f2\n"
            " -   4: A.f3\n"
            " -   5: A.f4\n"
            " -  55 more frame(s) (pass --stack-depth=60 to show)\n"
            "\n");
  const auto full = report(b.build(), 1ms, 60);
  EXPECT_NE(full.find(" -  60: A.f59\n"), std::string::npos);
  EXPECT_EQ(full.find("more frame(s)"), std::string::npos);
}

TEST(ExtractorTest, UnresolvableStack) {
  ChunkBuilder b;
  b.thread(1, 7);
  b.wallClock(0, 1, 77, 10 * ms);
  EXPECT_EQ(report(b.build(), 1ms, 5),
            "[0.000000] thread 7 - poll of 10000us\n"
            " - (unresolvable stack 77)\n"
            "\n");
}

TEST(ExtractorTest, ThresholdIsMonotonic) {
  ChunkBuilder b;
  b.thread(1, 7).thread(2, 8);
  withStack(b, 1, {"run"});
  const std::int64_t lengths[] = {1, 3, 3, 4, 9, 12, 30, 2, 7};
  for(std::size_t i = 0; i < std::size(lengths); i++)
    b.wallClock(i * ms, 1 + i % 2, 1, lengths[i] * ms);
  auto t = decode(b.build());
  Resolver r(t.pools());
  const auto events = decodePolls(t, r);
  ASSERT_EQ(events.size(), std::size(lengths));

  std::vector<PollEvent> previous = events;
  for(auto threshold: {0ms, 1ms, 3ms, 4ms, 10ms, 31ms}) {
    Collector c;
    Extractor ex({threshold, {}});
    ex << c;
    EXPECT_EQ(ex.run(events, r), c.polls.size());
    EXPECT_LE(c.polls.size(), previous.size());
    // Retained polls appear in trace order and are a subset of the last run
    std::size_t j = 0;
    for(const auto& p: c.polls) {
      EXPECT_GE(p.duration, (std::uint64_t)std::chrono::nanoseconds(threshold).count());
      while(j < previous.size() && previous[j].timestamp != p.timestamp) ++j;
      EXPECT_LT(j, previous.size());
    }
    previous = c.polls;
  }
  EXPECT_TRUE(previous.empty());
}

TEST(ExtractorTest, SkipFrames) {
  ChunkBuilder b;
  b.thread(1, 7);
  withStack(b, 1, {"work"});
  withStack(b, 2, {"park_timeout", "run"});
  b.wallClock(0, 1, 1, 10 * ms);
  b.wallClock(1, 1, 2, 10 * ms);
  const auto out = report(b.build(), 1ms, 5, {"park_timeout"});
  EXPECT_NE(out.find("A.work"), std::string::npos);
  EXPECT_EQ(out.find("A.run"), std::string::npos);
}

TEST(ExtractorTest, SamplesOutsidePollsAreDropped) {
  ChunkBuilder b;
  b.thread(1, 7);
  b.wallClock(0, 1, 1, 0);
  b.execution(5, 1, 1);
  b.wallClock(10, 1, 1, 3);
  auto t = decode(b.build());
  Resolver r(t.pools());
  const auto events = decodePolls(t, r);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].duration, 3u);
  EXPECT_EQ(events[0].timestamp, 10u);
}

TEST(ExtractorTest, SamplesWithoutStacksAreDropped) {
  ChunkBuilder b;
  b.defineClass(ChunkBuilder::tWallClock, "profiler.WallClockSample",
                {{"startTime", ChunkBuilder::tLong},
                 {"sampledThread", ChunkBuilder::tThread, true},
                 {"appword", ChunkBuilder::tLong}},
                "jdk.jfr.Event");
  b.thread(1, 7);
  b.event(ChunkBuilder::tWallClock, [](test::JfrWriter& w) {
    w.i64(10);
    w.i64(1);
    w.i64(20 * ms);
  });
  auto t = decode(b.build());
  Resolver r(t.pools());
  EXPECT_TRUE(decodePolls(t, r).empty());
}

TEST(ExtractorTest, TimestampsFollowTheTickRate) {
  ChunkBuilder b(true, 1000);
  b.thread(1, 7);
  b.wallClock(2500, 1, 1, 1);
  auto t = decode(b.build());
  Resolver r(t.pools());
  const auto events = decodePolls(t, r);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].timestamp, 2500000000u);
  EXPECT_EQ(sinks::formatTimestamp(events[0].timestamp), "2.500000");
}

TEST(ExtractorTest, DurationsFromPollRecords) {
  std::string records;
  const auto push = [&](auto write, const auto& rec, std::size_t size) {
    std::string buf(size, '\0');
    write(buf.data(), &rec);
    records += buf;
  };
  fmt_pollrec_calibration_t cal = {0, 0, 1, 0};
  push(fmt_pollrec_calibration_write, cal, FMT_POLLREC_SZ_Calibration);
  fmt_pollrec_poll_t poll = {1000, 3000, 50000, 7};
  push(fmt_pollrec_poll_write, poll, FMT_POLLREC_SZ_Poll);
  std::istringstream rin(records);
  PollRecords pr(rin);

  ChunkBuilder b;
  b.thread(1, 7).thread(2, 8);
  b.execution(48500, 1, 1);  // Monotonic, 500ns into the poll
  b.execution(48500, 2, 1);  // Other thread
  b.setting("clock", "tsc");
  b.execution(2500, 1, 1);   // TSC, 1500 ticks into the poll
  b.execution(3000, 1, 1);   // TSC, just past the end
  b.wallClock(1100, 1, 1, 0);  // No appword, 100 ticks into the poll
  auto t = decode(b.build());
  Resolver r(t.pools());
  const auto events = decodePolls(t, r, &pr);
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].duration, 500u);
  EXPECT_EQ(events[1].duration, 1500u);
  EXPECT_EQ(events[2].duration, 100u);
}
