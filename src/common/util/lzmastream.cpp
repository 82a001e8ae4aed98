// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#include "lzmastream.hpp"

#include <cstdint>
#include <cstring>
#include <ios>
#include <string>

using namespace pollcatch::util;

static constexpr std::size_t chunkSize = 64 * 1024;

bool pollcatch::util::isXz(const char* data, std::size_t size) noexcept {
  static constexpr unsigned char magic[] = {0xFD, '7', 'z', 'X', 'Z', 0x00};
  return size >= sizeof magic && std::memcmp(data, magic, sizeof magic) == 0;
}

lzmastreambuf::lzmastreambuf(std::streambuf& compressed)
  : source(compressed), packed(chunkSize), unpacked(chunkSize) {
  const auto ret = lzma_stream_decoder(&lz, UINT64_MAX, LZMA_CONCATENATED);
  if(ret != LZMA_OK)
    throw std::ios_base::failure("XZ decoder setup failed, liblzma code "
                                 + std::to_string(ret));
  setg(unpacked.data(), unpacked.data(), unpacked.data());
}

lzmastreambuf::~lzmastreambuf() {
  lzma_end(&lz);
}

lzmastreambuf::int_type lzmastreambuf::underflow() {
  if(gptr() < egptr()) return traits_type::to_int_type(*gptr());
  if(finished) return traits_type::eof();

  lz.next_out = reinterpret_cast<std::uint8_t*>(unpacked.data());
  lz.avail_out = unpacked.size();
  // Keep feeding until at least one byte comes out or the data ends
  while(lz.avail_out == unpacked.size() && !finished) {
    if(lz.avail_in == 0 && !sourceDone) {
      const auto got = source.sgetn(packed.data(), packed.size());
      lz.next_in = reinterpret_cast<const std::uint8_t*>(packed.data());
      lz.avail_in = got;
      sourceDone = got == 0;
    }
    const auto ret = lzma_code(&lz, sourceDone ? LZMA_FINISH : LZMA_RUN);
    if(ret == LZMA_STREAM_END) finished = true;
    else if(ret != LZMA_OK)
      throw std::ios_base::failure("damaged XZ data, liblzma code " + std::to_string(ret));
  }

  const std::size_t got = unpacked.size() - lz.avail_out;
  setg(unpacked.data(), unpacked.data(), unpacked.data() + got);
  return got == 0 ? traits_type::eof() : traits_type::to_int_type(*gptr());
}
