// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "args.hpp"
#include "longpolls.hpp"

#include "../common/util/log.hpp"

#include <iostream>

using namespace pollcatch;

int main(int argc, char* const argv[]) {
  // Read in the arguments.
  DecoderArgs args(argc, argv);
  util::log::Settings::set(args.logSettings());

  switch(args.mode) {
  case DecoderArgs::Mode::longpolls:
    return longpolls(args, std::cout);
  case DecoderArgs::Mode::dump:
    return dump(args, std::cout);
  }
  return 2;
}
