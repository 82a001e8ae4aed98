// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "duration.hpp"

#include <array>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <utility>

using namespace pollcatch;

namespace {
struct Unit {
  std::string_view name;
  std::uint64_t nanos;
};

constexpr std::uint64_t ns = 1;
constexpr std::uint64_t us = 1000 * ns;
constexpr std::uint64_t ms = 1000 * us;
constexpr std::uint64_t sec = 1000 * ms;
constexpr std::uint64_t day = 86400 * sec;

constexpr std::uint64_t month = 2630016 * sec;
constexpr std::uint64_t year = 31557600 * sec;

// Matched case-sensitively: "m" is minutes, "M" months
constexpr std::array<Unit, 37> units = {{
  {"nanoseconds", ns}, {"nanosecond", ns}, {"nsec", ns}, {"ns", ns},
  {"microseconds", us}, {"microsecond", us}, {"usec", us}, {"us", us}, {"\xC2\xB5s", us},
  {"milliseconds", ms}, {"millisecond", ms}, {"msec", ms}, {"ms", ms},
  {"seconds", sec}, {"second", sec}, {"sec", sec}, {"s", sec},
  {"minutes", 60 * sec}, {"minute", 60 * sec}, {"min", 60 * sec}, {"m", 60 * sec},
  {"hours", 3600 * sec}, {"hour", 3600 * sec}, {"hr", 3600 * sec}, {"h", 3600 * sec},
  {"days", day}, {"day", day}, {"d", day},
  {"weeks", 7 * day}, {"week", 7 * day}, {"w", 7 * day},
  {"months", month}, {"month", month}, {"M", month},
  {"years", year}, {"year", year}, {"y", year},
}};

bool isDigit(char c) { return c >= '0' && c <= '9'; }
bool isSpace(char c) { return c == ' ' || c == '\t'; }

std::uint64_t unitNanos(std::string_view u) {
  for(const auto& x: units) if(x.name == u) return x.nanos;
  return 0;
}
}

std::chrono::nanoseconds pollcatch::parseDuration(std::string_view text) {
  const auto bad = [&](const char* why) {
    return std::invalid_argument("invalid duration '" + std::string(text) + "': " + why);
  };
  constexpr auto max = (std::uint64_t)std::numeric_limits<std::chrono::nanoseconds::rep>::max();

  std::size_t i = 0;
  while(i < text.size() && isSpace(text[i])) ++i;
  if(i == text.size()) throw bad("value is empty");

  std::uint64_t total = 0;
  while(i < text.size()) {
    if(!isDigit(text[i])) throw bad("expected a number");
    std::uint64_t n = 0;
    for(; i < text.size() && isDigit(text[i]); ++i) {
      if(n > (max - (text[i] - '0')) / 10) throw bad("number is too large");
      n = n * 10 + (text[i] - '0');
    }
    while(i < text.size() && isSpace(text[i])) ++i;

    std::size_t start = i;
    while(i < text.size() && !isDigit(text[i]) && !isSpace(text[i])) ++i;
    if(start == i) throw bad("time unit needed, for example 5ms");
    const std::uint64_t unit = unitNanos(text.substr(start, i - start));
    if(unit == 0)
      throw bad(("unknown time unit '" + std::string(text.substr(start, i - start)) + "'").c_str());

    if(n > (max - total) / unit) throw bad("duration is too large");
    total += n * unit;
    while(i < text.size() && isSpace(text[i])) ++i;
  }
  return std::chrono::nanoseconds((std::chrono::nanoseconds::rep)total);
}

std::string pollcatch::formatDuration(std::chrono::nanoseconds d) {
  static constexpr std::pair<std::uint64_t, const char*> parts[] = {
    {day, "d"}, {3600 * sec, "h"}, {60 * sec, "m"}, {sec, "s"}, {ms, "ms"}, {us, "us"}, {ns, "ns"},
  };
  auto left = (std::uint64_t)d.count();
  if(left == 0) return "0s";
  std::string out;
  for(const auto& [n, name]: parts) {
    if(left < n) continue;
    if(!out.empty()) out += ' ';
    out += std::to_string(left / n) + name;
    left %= n;
  }
  return out;
}
