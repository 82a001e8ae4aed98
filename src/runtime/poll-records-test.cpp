// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "poll-records.hpp"

#include "poll-timer.hpp"
#include "../common/lean/formats/pollrecords.h"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <sys/syscall.h>

using namespace pollcatch;

namespace {

std::filesystem::path scratch(const std::string& name) {
  return std::filesystem::temp_directory_path()
         / ("pollcatch-" + std::to_string(getpid()) + "-" + name);
}

std::vector<char> slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios_base::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

}

TEST(PollRecordsTest, Layout) {
  const auto path = scratch("layout");
  {
    PollRecordWriter w(path);
    w.push(PollRecord{1, 2, 3, 4});
    w.push(Calibration{1, 2, 3, 4});
    w.flush();
    EXPECT_TRUE(w.good());
  }
  const std::vector<char> expected = {
    36, 0, 0, 0, 0, 0, 0, 0,
    1, 0, 0, 0, 0, 0, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0,
    3, 0, 0, 0, 0, 0, 0, 0, 4, 0, 0, 0,
    36, 0, 0, 0, 1, 0, 0, 0,
    1, 0, 0, 0, 0, 0, 0, 0, 2, 0, 0, 0, 0, 0, 0, 0,
    3, 0, 0, 0, 0, 0, 0, 0, 4, 0, 0, 0,
  };
  EXPECT_EQ(slurp(path), expected);
  std::filesystem::remove(path);
}

TEST(PollRecordsTest, WrittenOnDestruction) {
  const auto path = scratch("dtor");
  {
    PollRecordWriter w(path, std::chrono::hours(1));
    for(std::uint32_t i = 0; i < 100; i++) w.push(PollRecord{i, i + 1, i + 2, i});
  }
  auto data = slurp(path);
  ASSERT_EQ(data.size(), 100u * FMT_POLLREC_SZ_Poll);
  fmt_pollrec_poll_t rec;
  fmt_pollrec_poll_read(&rec, data.data() + 99 * FMT_POLLREC_SZ_Poll);
  EXPECT_EQ(rec.start, 99u);
  EXPECT_EQ(rec.tid, 99u);
  std::filesystem::remove(path);
}

TEST(PollRecordsTest, OnlySampledPollsAreRecorded) {
  const auto path = scratch("sampled");
  {
    PollRecordWriter w(path);
    PollTimer::record(&w);
    PollTimer::enter();
    PollTimer::exit();
    PollTimer::enter();
    PollTimer::mark_sampled();
    PollTimer::exit();
    PollTimer::enter();
    PollTimer::exit();
    PollTimer::record(nullptr);
    w.flush();
  }
  auto data = slurp(path);
  ASSERT_EQ(data.size(), (std::size_t)FMT_POLLREC_SZ_Poll);
  fmt_pollrec_hdr_t hdr;
  fmt_pollrec_hdr_read(&hdr, data.data());
  EXPECT_EQ(hdr.kind, (std::uint32_t)fmt_pollrec_kind_poll);
  fmt_pollrec_poll_t rec;
  fmt_pollrec_poll_read(&rec, data.data());
  EXPECT_LE(rec.start, rec.end);
  EXPECT_EQ(rec.end, rec.clockEnd);
  EXPECT_EQ(rec.tid, (std::uint32_t)syscall(SYS_gettid));
  std::filesystem::remove(path);
}

TEST(PollRecordsTest, UnopenableFile) {
  EXPECT_THROW(PollRecordWriter(std::filesystem::path("/nonexistent/dir/records")),
               std::runtime_error);
}
