// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_UTIL_LOG_H
#define POLLCATCH_UTIL_LOG_H

#include <sstream>
#include <string>

namespace pollcatch::util::log {

/// Which message categories end up on stderr.
class Settings {
public:
  Settings() = default;
  Settings(bool error, bool warning, bool info, bool verbose, bool debug)
    : bits((error ? fError : 0u) | (warning ? fWarning : 0u) | (info ? fInfo : 0u)
           | (verbose ? fVerbose : 0u) | (debug ? fDebug : 0u)) {};

  bool error() const noexcept { return bits & fError; }
  bool warning() const noexcept { return bits & fWarning; }
  bool info() const noexcept { return bits & fInfo; }
  bool verbose() const noexcept { return bits & fVerbose; }
  bool debug() const noexcept { return bits & fDebug; }

  /// Get the current process-wide Settings.
  // MT: Internally Synchronized
  static Settings get() noexcept;

  /// Replace the process-wide Settings. Until this is called, errors and
  /// warnings are enabled and everything else is disabled.
  // MT: Internally Synchronized
  static void set(Settings) noexcept;

  /// Errors and warnings only.
  static const Settings standard;

private:
  enum : unsigned int {
    fError = 1 << 0, fWarning = 1 << 1, fInfo = 1 << 2, fVerbose = 1 << 3, fDebug = 1 << 4,
  };
  unsigned int bits = 0;
};

namespace detail {
class MessageBuffer : public std::ostream {
public:
  MessageBuffer(MessageBuffer&&);
  MessageBuffer(const MessageBuffer&) = delete;
  MessageBuffer& operator=(MessageBuffer&&);
  MessageBuffer& operator=(const MessageBuffer&) = delete;

  // Disabled messages swallow everything without formatting it
  template<class A>
  std::ostream& operator<<(A&& a) {
    return enabled ? (*(std::ostream*)this << std::forward<A>(a)) : *this;
  }

protected:
  /// Start a message with the given category tag, if enabled.
  MessageBuffer(bool enabled, const char* tag);
  ~MessageBuffer() = default;

  /// Write the message to stderr as a single line, unless nothing beyond the
  /// tag was ever written to it.
  void emit() noexcept;

  bool enabled;
  std::stringbuf sbuf;
  std::size_t tagLength = 0;
};
}

// Each message type below is a stream that collects one line of text and
// writes it to stderr when it goes out of scope, if its category is enabled.
// Typical use: `util::log::warning{} << "skipping " << path;`

/// Unrecoverable problem. The process aborts once the message is out.
struct fatal final : public detail::MessageBuffer {
  fatal();
  fatal(fatal&&) = default;
  [[noreturn]] ~fatal();
};

/// Something failed and results are incomplete, but work continues.
struct error final : public detail::MessageBuffer {
  error();
  error(error&&) = default;
  ~error();
};

/// Something unexpected that the user should know about.
struct warning final : public detail::MessageBuffer {
  warning();
  warning(warning&&) = default;
  ~warning();
};

/// Like warning, but only of interest with -v.
struct vwarning final : public detail::MessageBuffer {
  vwarning();
  vwarning(vwarning&&) = default;
  ~vwarning();
};

/// Progress report for the user.
struct info final : public detail::MessageBuffer {
  info();
  info(info&&) = default;
  ~info();
};

/// Internal detail for whoever is debugging pollcatch itself.
struct debug final : public detail::MessageBuffer {
  debug();
  debug(debug&&) = default;
  ~debug();
};

}

#endif  // POLLCATCH_UTIL_LOG_H
