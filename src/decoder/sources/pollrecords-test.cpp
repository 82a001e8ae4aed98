// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "pollrecords.hpp"

#include "../../common/lean/formats/pollrecords.h"

#include <gtest/gtest.h>

#include <sstream>

using namespace pollcatch;
using namespace sources;

namespace {

std::string poll(std::uint64_t start, std::uint64_t end, std::uint64_t clockEnd,
                 std::uint32_t tid) {
  std::string buf(FMT_POLLREC_SZ_Poll, '\0');
  fmt_pollrec_poll_t rec = {start, end, clockEnd, tid};
  fmt_pollrec_poll_write(buf.data(), &rec);
  return buf;
}

std::string calibration(std::uint64_t srcEpoch, std::uint64_t refEpoch, std::uint64_t mul,
                        std::uint32_t shift) {
  std::string buf(FMT_POLLREC_SZ_Calibration, '\0');
  fmt_pollrec_calibration_t rec = {srcEpoch, refEpoch, mul, shift};
  fmt_pollrec_calibration_write(buf.data(), &rec);
  return buf;
}

std::string header(std::uint32_t size, std::uint32_t kind) {
  std::string buf(FMT_POLLREC_SZ_Hdr, '\0');
  fmt_pollrec_hdr_t hdr = {size, kind};
  fmt_pollrec_hdr_write(buf.data(), &hdr);
  return buf;
}

PollRecords parse(const std::string& bytes) {
  std::istringstream in(bytes);
  return PollRecords(in);
}

}

TEST(PollRecordsReaderTest, Layout) {
  const std::string bytes = {
    36, 0, 0, 0, 0, 0, 0, 0,
    1, 0, 0, 0, 0, 0, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0,
    3, 0, 0, 0, 0, 0, 0, 0, 4, 0, 0, 0,
    36, 0, 0, 0, 1, 0, 0, 0,
    1, 0, 0, 0, 0, 0, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0,
    3, 0, 0, 0, 0, 0, 0, 0, 4, 0, 0, 0,
  };
  EXPECT_EQ(bytes, poll(1, 2, 3, 4) + calibration(1, 2, 3, 4));
  auto pr = parse(bytes);
  EXPECT_EQ(pr.size(), 1u);
  EXPECT_EQ(pr.skipped(), 0u);
}

TEST(PollRecordsReaderTest, Lookup) {
  auto pr = parse(poll(100, 200, 0, 7) + poll(300, 400, 0, 7) + poll(150, 500, 0, 8));
  EXPECT_EQ(pr.lookup(ClockSource::tsc, 7, 150).value_or(0), 50u);
  EXPECT_EQ(pr.lookup(ClockSource::tsc, 7, 350).value_or(0), 50u);
  EXPECT_EQ(pr.lookup(ClockSource::tsc, 8, 350).value_or(0), 200u);
  EXPECT_FALSE(pr.lookup(ClockSource::tsc, 7, 100));  // Exactly at the start
  EXPECT_FALSE(pr.lookup(ClockSource::tsc, 7, 200));  // Exactly at the end
  EXPECT_FALSE(pr.lookup(ClockSource::tsc, 7, 250));
  EXPECT_FALSE(pr.lookup(ClockSource::tsc, 7, 50));
  EXPECT_FALSE(pr.lookup(ClockSource::tsc, 9, 150));
}

TEST(PollRecordsReaderTest, CalibratedMonotonic) {
  // Two source ticks per nanosecond
  auto pr = parse(calibration(0, 0, 1, 1) + poll(1000, 3000, 10000, 7));
  EXPECT_EQ(pr.lookup(ClockSource::monotonic, 7, 9500).value_or(0), 500u);
  EXPECT_FALSE(pr.lookup(ClockSource::monotonic, 7, 8999));
  EXPECT_EQ(pr.lookup(ClockSource::tsc, 7, 2000).value_or(0), 1000u);
}

TEST(PollRecordsReaderTest, UncalibratedMonotonic) {
  auto pr = parse(poll(1000, 3000, 10000, 7));
  EXPECT_EQ(pr.lookup(ClockSource::monotonic, 7, 8500).value_or(0), 500u);
}

TEST(PollRecordsReaderTest, OversizedAndUnknownRecords) {
  std::string big = poll(100, 200, 0, 7);
  big[0] = 40;
  big += "pad!";
  auto pr = parse(header(12, 9) + "skip" + big + poll(300, 400, 0, 7));
  EXPECT_EQ(pr.size(), 2u);
  EXPECT_EQ(pr.skipped(), 1u);
  EXPECT_EQ(pr.lookup(ClockSource::tsc, 7, 150).value_or(0), 50u);
}

TEST(PollRecordsReaderTest, SizeTooSmall) {
  std::string small = poll(100, 200, 0, 7);
  small[0] = 20;
  EXPECT_THROW(parse(small), CorruptRecords);
}

TEST(PollRecordsReaderTest, Truncated) {
  const auto bytes = poll(100, 200, 0, 7);
  EXPECT_THROW(parse(bytes.substr(0, 20)), CorruptRecords);
  EXPECT_THROW(parse(bytes.substr(0, 4)), CorruptRecords);
  EXPECT_THROW(parse(header(64, 9) + "short"), CorruptRecords);
}
