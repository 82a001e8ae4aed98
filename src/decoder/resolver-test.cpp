// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "resolver.hpp"

#include "test/jfr-builder.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace pollcatch;
using namespace sources;
using test::ChunkBuilder;

static JfrTrace decode(const std::string& bytes) {
  std::istringstream in(bytes);
  return JfrTrace(in);
}

TEST(ResolverTest, LeafFirst) {
  ChunkBuilder b;
  b.symbol(1, "com/example/Server").symbol(2, "handle").symbol(3, "run");
  b.javaClass(10, 1);
  b.method(20, 10, 2).method(21, 10, 3);
  b.stack(30, {20, 21});
  auto t = decode(b.build());
  Resolver r(t.pools());
  const auto& s = r.stack(30);
  EXPECT_TRUE(s.resolved);
  ASSERT_EQ(s.frames.size(), 2u);
  EXPECT_EQ(s.frames[0].symbol, "com/example/Server.handle");
  EXPECT_EQ(s.frames[1].symbol, "com/example/Server.run");
  EXPECT_EQ(s.frames[0].id, 20);
  EXPECT_TRUE(s.frames[1].resolved);
  EXPECT_EQ(&r.stack(30), &s);
}

TEST(ResolverTest, NativeFrames) {
  ChunkBuilder b;
  b.symbol(1, "").symbol(2, "epoll_wait");
  b.javaClass(10, 1).method(20, 10, 2).stack(30, {20});
  auto t = decode(b.build());
  Resolver r(t.pools());
  ASSERT_EQ(r.stack(30).frames.size(), 1u);
  EXPECT_EQ(r.stack(30).frames[0].symbol, "epoll_wait");
}

TEST(ResolverTest, UnresolvableStack) {
  ChunkBuilder b;
  b.stack(30, {});
  auto t = decode(b.build());
  Resolver r(t.pools());
  const auto& s = r.stack(99);
  EXPECT_FALSE(s.resolved);
  EXPECT_EQ(s.id, 99);
  EXPECT_TRUE(s.frames.empty());
  EXPECT_FALSE(r.stack(std::nullopt).resolved);
  EXPECT_TRUE(r.stack(30).resolved);
}

TEST(ResolverTest, UnresolvableFrame) {
  ChunkBuilder b;
  b.symbol(2, "run").javaClass(10, 1).method(20, 10, 2);
  b.stack(30, {42, 20});
  auto t = decode(b.build());
  Resolver r(t.pools());
  const auto& s = r.stack(30);
  EXPECT_TRUE(s.resolved);
  ASSERT_EQ(s.frames.size(), 2u);
  EXPECT_FALSE(s.frames[0].resolved);
  EXPECT_EQ(s.frames[0].symbol, "0x2a");
  // The class name is missing but the method name is not
  EXPECT_TRUE(s.frames[1].resolved);
  EXPECT_EQ(s.frames[1].symbol, "run");
}

TEST(ResolverTest, ForwardReferenceAcrossChunks) {
  ChunkBuilder first;
  first.thread(1, 7);
  first.wallClock(10, 1, 30, 5);
  ChunkBuilder second;
  second.symbol(2, "later").javaClass(10, 2).method(20, 10, 2).stack(30, {20});
  auto t = decode(first.build() + second.build());
  Resolver r(t.pools());
  const auto& sample = std::get<RawSample>(t.events().at(0));
  const auto& s = r.stack(sample.stackId);
  ASSERT_TRUE(s.resolved);
  EXPECT_EQ(s.frames.at(0).symbol, "later.later");
}

TEST(ResolverTest, Threads) {
  ChunkBuilder b;
  b.thread(1, 7, 3);
  auto t = decode(b.build());
  Resolver r(t.pools());
  const auto type = *t.pools().type("java.lang.Thread");
  EXPECT_EQ(r.thread(Value(Ref{type, 1})), 7);
  EXPECT_EQ(r.thread(Value(Ref{type, 5})), 5);
  EXPECT_EQ(r.thread(Value()), -1);
}

TEST(ResolverTest, JavaThreadIdFallback) {
  ChunkBuilder b;
  b.defineClass(ChunkBuilder::tThread, "java.lang.Thread",
                {{"javaName", ChunkBuilder::tString}, {"javaThreadId", ChunkBuilder::tLong}});
  b.entry(ChunkBuilder::tThread, 1, [](test::JfrWriter& w) {
    w.nullString();
    w.i64(12);
  });
  auto t = decode(b.build());
  Resolver r(t.pools());
  EXPECT_EQ(r.thread(Value(Ref{*t.pools().type("java.lang.Thread"), 1})), 12);
}
