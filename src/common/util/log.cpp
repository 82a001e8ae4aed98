// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "log.hpp"

#include <atomic>
#include <cstdlib>
#include <unistd.h>

using namespace pollcatch::util::log;
using namespace detail;

const Settings Settings::standard = Settings(true, true, false, false, false);

// The runtime logs from its writer thread while the host may reconfigure
static std::atomic<Settings> current{Settings::standard};

Settings Settings::get() noexcept {
  return current.load(std::memory_order_relaxed);
}
void Settings::set(Settings s) noexcept {
  current.store(s, std::memory_order_relaxed);
}

MessageBuffer::MessageBuffer(bool en, const char* tag)
  : std::ostream(), enabled(en), sbuf(std::ios_base::out) {
  if(!enabled) return;
  this->init(&sbuf);
  // Messages may come out of somebody else's process, say who we are
  *this << "pollcatch: " << tag << ": ";
  tagLength = sbuf.str().size();
}
MessageBuffer::MessageBuffer(MessageBuffer&& o)
  : std::ostream(std::move(o)), enabled(o.enabled), sbuf(std::move(o.sbuf)),
    tagLength(o.tagLength) {
  if(enabled) this->init(&sbuf);
}
MessageBuffer& MessageBuffer::operator=(MessageBuffer&& o) {
  std::ostream::operator=(std::move(o));
  enabled = o.enabled;
  sbuf = std::move(o.sbuf);
  tagLength = o.tagLength;
  if(enabled) this->init(&sbuf);
  return *this;
}

void MessageBuffer::emit() noexcept {
  if(!enabled) return;
  std::string line = sbuf.str();
  if(line.size() <= tagLength) return;
  line += '\n';
  // One write(2), so lines from different threads never interleave
  const char* p = line.data();
  std::size_t left = line.size();
  while(left > 0) {
    const auto n = ::write(STDERR_FILENO, p, left);
    if(n <= 0) return;
    p += n;
    left -= n;
  }
}

fatal::fatal() : MessageBuffer(true, "FATAL") {}
fatal::~fatal() {
  emit();
  std::abort();
}

error::error() : MessageBuffer(Settings::get().error(), "ERROR") {}
error::~error() { emit(); }

warning::warning() : MessageBuffer(Settings::get().warning(), "WARNING") {}
warning::~warning() { emit(); }

vwarning::vwarning() : MessageBuffer(Settings::get().verbose(), "WARNING") {}
vwarning::~vwarning() { emit(); }

info::info() : MessageBuffer(Settings::get().info(), "INFO") {}
info::~info() { emit(); }

debug::debug() : MessageBuffer(Settings::get().debug(), "DEBUG") {}
debug::~debug() { emit(); }
