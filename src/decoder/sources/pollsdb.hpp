// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_SOURCES_POLLSDB_H
#define POLLCATCH_DECODER_SOURCES_POLLSDB_H

#include "../poll.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

namespace pollcatch::sources {

/// The polls.db file is not one, or is damaged.
class CorruptPollsDB : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Read back every record of a polls.db export.
/// Throws CorruptPollsDB, or std::system_error if the file cannot be opened
/// or read.
std::vector<PollEvent> readPollsDB(const std::filesystem::path&);

}

#endif  // POLLCATCH_DECODER_SOURCES_POLLSDB_H
