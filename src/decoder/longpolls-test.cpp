// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "longpolls.hpp"

#include "test/jfr-builder.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace pollcatch;
using test::ChunkBuilder;

namespace {

constexpr std::int64_t ms = 1000000;

std::filesystem::path scratch(const std::string& name) {
  return std::filesystem::temp_directory_path()
         / ("pollcatch-" + std::to_string(getpid()) + "-" + name);
}

std::filesystem::path writeFile(const std::string& name, const std::string& bytes) {
  auto path = scratch(name);
  std::ofstream out(path, std::ios_base::binary);
  out << bytes;
  return path;
}

std::string trace(std::int64_t tid, std::vector<std::int64_t> lengths) {
  ChunkBuilder b;
  b.thread(1, tid).symbol(1, "Worker").symbol(2, "poll");
  b.javaClass(1, 1).method(1, 1, 2).stack(1, {1});
  std::int64_t t = 0;
  for(auto l: lengths) b.wallClock(t += 1000000, 1, 1, l * ms);
  return b.build();
}

DecoderArgs args(std::vector<std::string> argv) {
  argv.insert(argv.begin(), "pollcatch-decoder");
  std::vector<char*> ptrs;
  for(auto& a: argv) ptrs.push_back(a.data());
  ptrs.push_back(nullptr);
  return DecoderArgs(argv.size(), ptrs.data());
}

}

TEST(LongpollsTest, Report) {
  const auto path = writeFile("report.jfr", trace(7, {2, 6, 11}));
  std::ostringstream out;
  EXPECT_EQ(longpolls(args({"longpolls", path.string(), "5ms"}), out), 0);
  EXPECT_EQ(out.str(),
            "[0.002000] thread 7 - poll of 6000us\n"
            " -   1: Worker.poll\n"
            "\n"
            "[0.003000] thread 7 - poll of 11000us\n"
            " -   1: Worker.poll\n"
            "\n");
  std::filesystem::remove(path);
}

TEST(LongpollsTest, NothingLongEnough) {
  const auto path = writeFile("short.jfr", trace(7, {1, 2}));
  std::ostringstream out;
  EXPECT_EQ(longpolls(args({"longpolls", path.string(), "1h"}), out), 0);
  EXPECT_EQ(out.str(), "");
  std::filesystem::remove(path);
}

TEST(LongpollsTest, CorruptTraceIsIsolated) {
  auto bad = trace(7, {20});
  bad.resize(bad.size() - 3);
  const auto badPath = writeFile("bad.jfr", bad);
  const auto goodPath = writeFile("good.jfr", trace(9, {20}));
  std::ostringstream out;
  EXPECT_EQ(longpolls(args({"longpolls", badPath.string(), goodPath.string(), "5ms"}), out), 1);
  EXPECT_EQ(out.str().find("thread 7"), std::string::npos);
  EXPECT_NE(out.str().find("thread 9"), std::string::npos);
  std::filesystem::remove(badPath);
  std::filesystem::remove(goodPath);
}

TEST(LongpollsTest, CorruptTraceAlone) {
  auto bad = trace(7, {20});
  bad.resize(bad.size() / 2);
  const auto path = writeFile("half.jfr", bad);
  std::ostringstream out;
  EXPECT_EQ(longpolls(args({"longpolls", path.string(), "5ms"}), out), 1);
  EXPECT_EQ(out.str(), "");
  std::filesystem::remove(path);
}

TEST(LongpollsTest, MissingTrace) {
  std::ostringstream out;
  EXPECT_EQ(longpolls(args({"longpolls", "/nonexistent/pollcatch.jfr", "5ms"}), out), 1);
}

TEST(LongpollsTest, ExportAndDump) {
  const auto first = writeFile("first.jfr", trace(7, {2, 6}));
  const auto second = writeFile("second.jfr", trace(8, {12}));
  const auto db = scratch("export.db");
  std::ostringstream report;
  EXPECT_EQ(longpolls(args({"longpolls", "--export", db.string(), first.string(),
                            second.string(), "5ms"}), report), 0);
  std::ostringstream dumped;
  EXPECT_EQ(dump(args({"dump", db.string()}), dumped), 0);
  EXPECT_EQ(dumped.str(),
            "[0.002000] thread 7 - poll of 6000us, stack 1\n"
            "[0.001000] thread 8 - poll of 12000us, stack 1\n");
  for(const auto& p: {first, second, db}) std::filesystem::remove(p);
}

TEST(LongpollsTest, UnwritableExport) {
  const auto path = writeFile("unwritable.jfr", trace(7, {6}));
  std::ostringstream out;
  EXPECT_EQ(longpolls(args({"longpolls", "--export", "/nonexistent/polls.db", path.string(),
                            "5ms"}), out), 1);
  // The report itself is unaffected
  EXPECT_NE(out.str().find("poll of 6000us"), std::string::npos);
  std::filesystem::remove(path);
}

TEST(LongpollsTest, DumpCorrupt) {
  const auto path = writeFile("notadb.db", "this is not a polls.db file at all, sorry");
  std::ostringstream out;
  EXPECT_EQ(dump(args({"dump", path.string()}), out), 1);
  EXPECT_EQ(out.str(), "");
  std::filesystem::remove(path);
}

TEST(LongpollsTest, DumpUnopenable) {
  std::ostringstream out;
  EXPECT_EQ(dump(args({"dump", "/nonexistent/polls.db"}), out), 1);
  // Opens fine but cannot be read as a file
  const auto dir = scratch("dir.db");
  std::filesystem::create_directory(dir);
  EXPECT_EQ(dump(args({"dump", dir.string()}), out), 1);
  EXPECT_EQ(out.str(), "");
  std::filesystem::remove(dir);
}
