// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "args.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <unistd.h>

using namespace pollcatch;
using namespace std::literals::chrono_literals;

namespace {

DecoderArgs parse(std::vector<std::string> argv) {
  argv.insert(argv.begin(), "pollcatch-decoder");
  std::vector<char*> ptrs;
  for(auto& a: argv) ptrs.push_back(a.data());
  ptrs.push_back(nullptr);
  return DecoderArgs(argv.size(), ptrs.data());
}

}

TEST(ArgsTest, Longpolls) {
  auto args = parse({"longpolls", "a.jfr", "b.jfr.xz", "5ms"});
  EXPECT_EQ(args.mode, DecoderArgs::Mode::longpolls);
  ASSERT_EQ(args.traces.size(), 2u);
  EXPECT_EQ(args.traces[0].string(), "a.jfr");
  EXPECT_EQ(args.traces[1].string(), "b.jfr.xz");
  EXPECT_EQ(args.minLength, 5ms);
  EXPECT_EQ(args.stackDepth, 5u);
  EXPECT_FALSE(args.exportPath);
  EXPECT_FALSE(args.prFile);
  EXPECT_TRUE(args.skipFrames.empty());
}

TEST(ArgsTest, Options) {
  auto args = parse({"longpolls", "--stack-depth", "60", "-e", "out.db", "--pr-file=pr.bin",
                     "-s", "park", "--skip-frame", "sleep", "-v", "t.jfr", "1s 500ms"});
  EXPECT_EQ(args.stackDepth, 60u);
  EXPECT_EQ(args.exportPath->string(), "out.db");
  EXPECT_EQ(args.prFile->string(), "pr.bin");
  EXPECT_EQ(args.skipFrames, (std::vector<std::string>{"park", "sleep"}));
  EXPECT_EQ(args.minLength, 1500ms);
  EXPECT_TRUE(args.logSettings().info());
  EXPECT_FALSE(args.logSettings().debug());
}

TEST(ArgsTest, Verbosity) {
  EXPECT_FALSE(parse({"longpolls", "t", "1ms"}).logSettings().info());
  EXPECT_TRUE(parse({"longpolls", "-vv", "t", "1ms"}).logSettings().debug());
  auto quiet = parse({"longpolls", "-q", "t", "1ms"}).logSettings();
  EXPECT_TRUE(quiet.error());
  EXPECT_FALSE(quiet.warning());
}

TEST(ArgsTest, Dump) {
  auto args = parse({"dump", "polls.db"});
  EXPECT_EQ(args.mode, DecoderArgs::Mode::dump);
  EXPECT_EQ(args.pollsdb.string(), "polls.db");
}

TEST(ArgsTest, ConfigUnderCommandLine) {
  const auto path = std::filesystem::temp_directory_path()
                    / ("pollcatch-" + std::to_string(getpid()) + "-config.yaml");
  {
    std::ofstream out(path);
    out << "stack-depth: 12\nskip-frames: [park]\npr-file: cfg.bin\nexport: cfg.db\n";
  }
  auto args = parse({"longpolls", "-c", path.string(), "-d", "3", "-p", "cli.bin", "t", "1ms"});
  EXPECT_EQ(args.stackDepth, 3u);
  EXPECT_EQ(args.prFile->string(), "cli.bin");
  EXPECT_EQ(args.exportPath->string(), "cfg.db");
  EXPECT_EQ(args.skipFrames, std::vector<std::string>{"park"});
  std::filesystem::remove(path);
}

TEST(ArgsDeathTest, UsageErrors) {
  const auto usage = ::testing::ExitedWithCode(2);
  EXPECT_EXIT(parse({}), usage, "missing subcommand");
  EXPECT_EXIT(parse({"frobnicate"}), usage, "unknown subcommand");
  EXPECT_EXIT(parse({"longpolls", "t.jfr"}), usage, "at least one TRACE");
  EXPECT_EXIT(parse({"longpolls", "t.jfr", "5"}), usage, "time unit");
  EXPECT_EXIT(parse({"longpolls", "t.jfr", "fast"}), usage, "invalid duration");
  EXPECT_EXIT(parse({"longpolls", "-d", "x", "t.jfr", "5ms"}), usage, "invalid stack depth");
  EXPECT_EXIT(parse({"longpolls", "--bogus", "t.jfr", "5ms"}), usage, "unrecognized option");
  EXPECT_EXIT(parse({"longpolls", "-d"}), usage, "requires an argument");
  EXPECT_EXIT(parse({"longpolls", "-c", "/nonexistent/c.yaml", "t.jfr", "5ms"}), usage,
              "configuration");
  EXPECT_EXIT(parse({"dump"}), usage, "exactly one");
  EXPECT_EXIT(parse({"dump", "-d", "3", "x.db"}), usage, "no longpolls options");
}

TEST(ArgsDeathTest, HelpAndVersion) {
  EXPECT_EXIT(parse({"-h"}), ::testing::ExitedWithCode(0), "");
  EXPECT_EXIT(parse({"longpolls", "--help"}), ::testing::ExitedWithCode(0), "");
  EXPECT_EXIT(parse({"-V"}), ::testing::ExitedWithCode(0), "");
}
