// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "pollcatch.h"

#include "poll-records.hpp"
#include "poll-timer.hpp"
#include "publisher.hpp"

#include "../common/util/log.hpp"

#include <cerrno>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>

using namespace pollcatch;

namespace {
std::mutex lock;
AppwordAnnotator annotator;
std::unique_ptr<SignalChain> chain;

// Never destroyed: polls may still be exiting on other threads at shutdown
PollRecordWriter* recorder = nullptr;
}

extern "C" int pollcatch_enable(int signo) {
  std::unique_lock<std::mutex> l(lock);
  if(chain) {
    if(chain->signal() == signo) return 0;
    errno = EBUSY;
    return -1;
  }
  try {
    chain = std::make_unique<SignalChain>(signo, annotator);
  } catch(std::system_error& e) {
    util::log::error{} << "Unable to chain onto signal " << signo << ": " << e.what();
    errno = e.code().value();
    return -1;
  } catch(std::logic_error& e) {
    util::log::error{} << "Unable to chain onto signal " << signo << ": " << e.what();
    errno = EBUSY;
    return -1;
  }
  util::log::info{} << "Publishing poll timings on signal " << signo;
  return 0;
}

extern "C" void pollcatch_disable(void) {
  std::unique_lock<std::mutex> l(lock);
  chain.reset();
}

extern "C" uint64_t pollcatch_asprof_helper(void) {
  return AppwordAnnotator::take();
}

extern "C" int pollcatch_record_polls(const char* path) {
  std::unique_lock<std::mutex> l(lock);
  if(recorder != nullptr) {
    errno = EBUSY;
    return -1;
  }
  try {
    recorder = new PollRecordWriter(path);
  } catch(std::runtime_error& e) {
    util::log::error{} << e.what();
    return -1;
  }
  // Polls are timed on CLOCK_MONOTONIC directly, so the calibration is 1:1
  recorder->push(Calibration{0, 0, 1, 0});
  PollTimer::record(recorder);
  return 0;
}
