// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

#include "pollsdb.hpp"

#include "../sources/pollsdb.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <system_error>
#include <unistd.h>

using namespace pollcatch;

static std::filesystem::path scratch(const std::string& name) {
  return std::filesystem::temp_directory_path()
         / ("pollcatch-" + std::to_string(getpid()) + "-" + name);
}

TEST(PollsDBTest, RoundTrip) {
  const auto path = scratch("roundtrip.db");
  const std::vector<PollEvent> polls = {
    {1000000000, 7, 6000000, 1},
    {2000000000, 7, 11000000, 1},
    {2000000500, 8, 5000001, 42},
  };
  const Stack none{0, {}, false};
  {
    sinks::PollsDB db(path);
    for(const auto& p: polls) db.notifyLongPoll(p, none);
    EXPECT_EQ(db.size(), 3u);
    db.write();
  }
  EXPECT_EQ(std::filesystem::file_size(path), 0x20u + 3 * 0x20u + 8);
  const auto back = sources::readPollsDB(path);
  ASSERT_EQ(back.size(), polls.size());
  for(std::size_t i = 0; i < polls.size(); i++) {
    EXPECT_EQ(back[i].timestamp, polls[i].timestamp);
    EXPECT_EQ(back[i].thread, polls[i].thread);
    EXPECT_EQ(back[i].duration, polls[i].duration);
    EXPECT_EQ(back[i].stackId, polls[i].stackId);
  }
  std::filesystem::remove(path);
}

TEST(PollsDBTest, Empty) {
  const auto path = scratch("empty.db");
  sinks::PollsDB(path).write();
  EXPECT_TRUE(sources::readPollsDB(path).empty());
  std::filesystem::remove(path);
}

TEST(PollsDBTest, Corrupt) {
  const auto path = scratch("corrupt.db");
  {
    sinks::PollsDB db(path);
    db.notifyLongPoll({1, 2, 3, 4}, Stack{4, {}, false});
    db.write();
  }
  std::filesystem::resize_file(path, std::filesystem::file_size(path) - 1);
  EXPECT_THROW(sources::readPollsDB(path), sources::CorruptPollsDB);
  {
    std::ofstream out(path, std::ios_base::binary | std::ios_base::trunc);
    out << "definitely not a polls.db file, but long enough";
  }
  EXPECT_THROW(sources::readPollsDB(path), sources::CorruptPollsDB);
  std::filesystem::remove(path);
  EXPECT_THROW(sources::readPollsDB(path), std::system_error);
}
