// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "jfr.hpp"

#include "../test/jfr-builder.hpp"

#include <gtest/gtest.h>

#include <lzma.h>

#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace pollcatch;
using namespace sources;
using test::ChunkBuilder;

namespace {

JfrTrace decode(const std::string& bytes) {
  std::istringstream in(bytes);
  return JfrTrace(in);
}

const std::string* symbolText(const JfrTrace& t, std::int64_t key) {
  auto type = t.pools().type("jdk.types.Symbol");
  if(!type) return nullptr;
  const auto* v = t.pools().find(*type, key);
  if(v == nullptr) return nullptr;
  const auto* o = std::get_if<Object>(v);
  if(o == nullptr) return nullptr;
  const auto* s = o->field("string");
  return s == nullptr ? nullptr : std::get_if<std::string>(s);
}

ChunkBuilder oneSample(bool compressed) {
  ChunkBuilder b(compressed);
  b.thread(1, 7).symbol(2, "run").stack(3, {});
  b.wallClock(1500, 1, 3, 6000000);
  return b;
}

}

TEST(JfrTest, CompressedIntegers) {
  auto t = decode(oneSample(true).build());
  EXPECT_EQ(t.chunks(), 1u);
  ASSERT_EQ(t.events().size(), 1u);
  const auto& s = std::get<RawSample>(t.events()[0]);
  EXPECT_EQ(s.ticks, 1500);
  EXPECT_EQ(s.ticksPerSecond, 1000000000);
  ASSERT_TRUE(s.appword);
  EXPECT_EQ(*s.appword, 6000000);
  ASSERT_TRUE(s.stackId);
  EXPECT_EQ(*s.stackId, 3);
  ASSERT_NE(symbolText(t, 2), nullptr);
  EXPECT_EQ(*symbolText(t, 2), "run");
}

TEST(JfrTest, FixedWidthIntegers) {
  auto t = decode(oneSample(false).build());
  ASSERT_EQ(t.events().size(), 1u);
  const auto& s = std::get<RawSample>(t.events()[0]);
  EXPECT_EQ(s.ticks, 1500);
  EXPECT_EQ(*s.appword, 6000000);
  EXPECT_EQ(*symbolText(t, 2), "run");
}

TEST(JfrTest, EmptyFile) {
  auto t = decode("");
  EXPECT_EQ(t.chunks(), 0u);
  EXPECT_TRUE(t.events().empty());
}

TEST(JfrTest, ExecutionSamplesHaveNoAppword) {
  ChunkBuilder b;
  b.thread(1, 7).stack(3, {});
  b.execution(10, 1, 3);
  auto t = decode(b.build());
  ASSERT_EQ(t.events().size(), 1u);
  EXPECT_FALSE(std::get<RawSample>(t.events()[0]).appword);
}

TEST(JfrTest, SettingsKeepTheirPlace) {
  ChunkBuilder b;
  b.thread(1, 7).stack(3, {});
  b.wallClock(10, 1, 3, 1);
  b.setting("clock", "tsc");
  b.wallClock(20, 1, 3, 1);
  auto t = decode(b.build());
  ASSERT_EQ(t.events().size(), 3u);
  EXPECT_TRUE(std::holds_alternative<RawSample>(t.events()[0]));
  ASSERT_TRUE(std::holds_alternative<RawSetting>(t.events()[1]));
  const auto& st = std::get<RawSetting>(t.events()[1]);
  EXPECT_EQ(std::get<std::string>(st.name), "clock");
  EXPECT_EQ(std::get<std::string>(st.value), "tsc");
}

TEST(JfrTest, PoolsAccumulateAcrossChunks) {
  ChunkBuilder first;
  first.symbol(1, "first").symbol(2, "kept");
  ChunkBuilder second;
  second.symbol(1, "second").symbol(3, "added");
  auto t = decode(first.build() + second.build());
  EXPECT_EQ(t.chunks(), 2u);
  EXPECT_EQ(*symbolText(t, 1), "first");
  EXPECT_EQ(*symbolText(t, 2), "kept");
  EXPECT_EQ(*symbolText(t, 3), "added");
}

TEST(JfrTest, TruncatedChunk) {
  auto bytes = oneSample(true).build();
  bytes.resize(bytes.size() - 10);
  EXPECT_THROW(decode(bytes), CorruptTrace);
}

TEST(JfrTest, TruncatedHeader) {
  auto bytes = oneSample(true).build();
  EXPECT_THROW(decode(bytes + bytes.substr(0, 20)), CorruptTrace);
}

TEST(JfrTest, BadMagic) {
  auto bytes = oneSample(true).build();
  bytes[0] = 'X';
  EXPECT_THROW(decode(bytes), CorruptTrace);
}

TEST(JfrTest, UnsupportedVersion) {
  auto bytes = oneSample(true).build();
  bytes[5] = 9;
  EXPECT_THROW(decode(bytes), CorruptTrace);
}

TEST(JfrTest, EventPastTheChunk) {
  ChunkBuilder b;
  b.event(ChunkBuilder::tWallClock, [](test::JfrWriter& w) { w.i64(1); });
  auto bytes = b.build();
  // First event size, padded varint right after the header
  bytes[formats::jfr::SZ_ChunkHeader + 2] = (char)0xff;
  EXPECT_THROW(decode(bytes), CorruptTrace);
}

TEST(JfrTest, XzCompressed) {
  const auto raw = oneSample(true).build();
  std::vector<std::uint8_t> xz(raw.size() + 1024);
  std::size_t xzSize = 0;
  ASSERT_EQ(lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                    (const std::uint8_t*)raw.data(), raw.size(),
                                    xz.data(), &xzSize, xz.size()),
            LZMA_OK);

  const auto path = std::filesystem::temp_directory_path()
                    / ("pollcatch-" + std::to_string(getpid()) + "-trace.jfr.xz");
  {
    std::ofstream out(path, std::ios_base::binary);
    out.write((const char*)xz.data(), xzSize);
  }
  auto t = JfrTrace::open(path);
  std::filesystem::remove(path);
  ASSERT_EQ(t.events().size(), 1u);
  EXPECT_EQ(*std::get<RawSample>(t.events()[0]).appword, 6000000);
}

TEST(JfrTest, XzMissingFooter) {
  const auto raw = oneSample(true).build();
  std::vector<std::uint8_t> xz(raw.size() + 1024);
  std::size_t xzSize = 0;
  ASSERT_EQ(lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                    (const std::uint8_t*)raw.data(), raw.size(),
                                    xz.data(), &xzSize, xz.size()),
            LZMA_OK);

  // Cut off the 12-byte stream footer, the chunk itself is intact
  const auto path = std::filesystem::temp_directory_path()
                    / ("pollcatch-" + std::to_string(getpid()) + "-nofooter.jfr.xz");
  {
    std::ofstream out(path, std::ios_base::binary);
    out.write((const char*)xz.data(), xzSize - 12);
  }
  EXPECT_THROW(JfrTrace::open(path), CorruptTrace);
  std::filesystem::remove(path);
}

TEST(JfrTest, MissingFile) {
  EXPECT_THROW(JfrTrace::open("/nonexistent/pollcatch/trace.jfr"), std::system_error);
}
