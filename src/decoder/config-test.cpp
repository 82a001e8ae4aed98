// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "config.hpp"

#include <gtest/gtest.h>

using namespace pollcatch;

TEST(ConfigTest, AllKeys) {
  auto cfg = DecoderConfig::parse(R"(
stack-depth: 12
skip-frames:
  - park_timeout
  - epoll_wait
pr-file: /tmp/polls.bin
export: out/polls.db
)");
  ASSERT_TRUE(cfg.stackDepth);
  EXPECT_EQ(*cfg.stackDepth, 12u);
  EXPECT_EQ(cfg.skipFrames, (std::vector<std::string>{"park_timeout", "epoll_wait"}));
  ASSERT_TRUE(cfg.prFile);
  EXPECT_EQ(cfg.prFile->string(), "/tmp/polls.bin");
  ASSERT_TRUE(cfg.exportPath);
  EXPECT_EQ(cfg.exportPath->string(), "out/polls.db");
}

TEST(ConfigTest, Empty) {
  auto cfg = DecoderConfig::parse("");
  EXPECT_FALSE(cfg.stackDepth);
  EXPECT_TRUE(cfg.skipFrames.empty());
  EXPECT_FALSE(cfg.prFile);
  EXPECT_FALSE(cfg.exportPath);
}

TEST(ConfigTest, SingleSkipFrame) {
  auto cfg = DecoderConfig::parse("skip-frames: park_timeout\nunknown-key: 1\n");
  EXPECT_EQ(cfg.skipFrames, std::vector<std::string>{"park_timeout"});
}

TEST(ConfigTest, Malformed) {
  EXPECT_THROW(DecoderConfig::parse("stack-depth: [1, 2"), std::runtime_error);
  EXPECT_THROW(DecoderConfig::parse("stack-depth: deep"), std::runtime_error);
  EXPECT_THROW(DecoderConfig::parse("stack-depth: -1"), std::runtime_error);
  EXPECT_THROW(DecoderConfig::parse("- a list\n- at the top\n"), std::runtime_error);
  EXPECT_THROW(DecoderConfig::parse("skip-frames: {a: b}"), std::runtime_error);
}

TEST(ConfigTest, MissingFile) {
  EXPECT_THROW(DecoderConfig::load("/nonexistent/pollcatch.yaml"), std::runtime_error);
}
