// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_UTIL_LZMASTREAM_H
#define POLLCATCH_UTIL_LZMASTREAM_H

#include <lzma.h>

#include <istream>
#include <streambuf>
#include <vector>

namespace pollcatch::util {

/// Input streambuf decompressing XZ data (one or more concatenated streams)
/// read from another streambuf. Damaged input makes reads throw
/// std::ios_base::failure.
class lzmastreambuf final : public std::streambuf {
public:
  explicit lzmastreambuf(std::streambuf& compressed);
  ~lzmastreambuf();

  lzmastreambuf(const lzmastreambuf&) = delete;
  lzmastreambuf& operator=(const lzmastreambuf&) = delete;

protected:
  int_type underflow() override;

private:
  std::streambuf& source;
  lzma_stream lz = LZMA_STREAM_INIT;
  std::vector<char> packed;
  std::vector<char> unpacked;
  bool sourceDone = false;
  bool finished = false;
};

/// std::istream over an lzmastreambuf.
class ilzmastream final : public std::istream {
public:
  explicit ilzmastream(std::streambuf& compressed)
    : std::istream(&buf), buf(compressed) {};

private:
  lzmastreambuf buf;
};

/// True if the bytes start like an XZ stream.
bool isXz(const char* data, std::size_t size) noexcept;

}

#endif  // POLLCATCH_UTIL_LZMASTREAM_H
