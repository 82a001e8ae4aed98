// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "textreport.hpp"

#include <iomanip>
#include <sstream>

using namespace pollcatch;
using namespace sinks;

std::string sinks::formatTimestamp(std::uint64_t nanos) {
  std::ostringstream ss;
  ss << nanos / 1000000000u << '.' << std::setw(6) << std::setfill('0')
     << (nanos % 1000000000u) / 1000u;
  return ss.str();
}

TextReport::TextReport(std::ostream& os, std::size_t d) : out(os), depth(d) {};

void TextReport::notifyLongPoll(const PollEvent& ev, const Stack& stack) {
  out << '[' << formatTimestamp(ev.timestamp) << "] thread " << ev.thread
      << " - poll of " << ev.duration / 1000u << "us\n";
  if(!stack.resolved) {
    out << " - (unresolvable stack " << stack.id << ")\n\n";
    return;
  }
  const auto& frames = stack.frames;
  for(std::size_t i = 0; i < frames.size(); i++) {
    if(i == depth) {
      out << " - " << std::setw(3) << frames.size() - depth
          << " more frame(s) (pass --stack-depth=" << frames.size() << " to show)\n";
      break;
    }
    out << " - " << std::setw(3) << i + 1 << ": " << frames[i].symbol << '\n';
  }
  out << '\n';
}

void TextReport::write() {
  out.flush();
}
