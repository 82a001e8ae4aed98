// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_DECODER_SINKS_POLLSDB_H
#define POLLCATCH_DECODER_SINKS_POLLSDB_H

#include "../sink.hpp"

#include "../../common/util/file.hpp"

#include <vector>

namespace pollcatch::sinks {

/// ReportSink exporting the long polls of every trace into a single polls.db
/// file. Records are held until write().
class PollsDB final : public ReportSink {
public:
  explicit PollsDB(std::filesystem::path);
  ~PollsDB() = default;

  void notifyLongPoll(const PollEvent&, const Stack&) override;
  /// Throws std::system_error if the file cannot be created or written.
  void write() override;

  std::size_t size() const noexcept { return polls.size(); }

private:
  util::File file;
  std::vector<PollEvent> polls;
};

}

#endif  // POLLCATCH_DECODER_SINKS_POLLSDB_H
