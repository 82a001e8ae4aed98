// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#define _FILE_OFFSET_BITS 64

#include "file.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>

namespace pollcatch::util::detail {
struct FileImpl {
  FileImpl(std::filesystem::path p, bool c) : path(std::move(p)), create(c) {};
  ~FileImpl() {
    if(fd >= 0) ::close(fd);
  }

  [[noreturn]] void fail(const char* what) const {
    throw std::system_error(errno, std::generic_category(),
                            std::string(what) + " " + path.string());
  }

  std::filesystem::path path;
  bool create;
  int fd = -1;
};
}

using namespace pollcatch::util;

File::File(std::filesystem::path path, bool create) noexcept
  : impl(std::make_unique<detail::FileImpl>(std::move(path), create)) {}
File::~File() = default;

File::File(File&&) = default;
File& File::operator=(File&&) = default;

void File::initialize() {
  if(impl->fd >= 0)
    throw std::logic_error("File::initialize called twice on " + impl->path.string());
  const int flags = impl->create ? O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC
                                 : O_RDONLY | O_CLOEXEC;
  // Permissions beyond the umask are the user's business
  impl->fd = ::open(impl->path.c_str(), flags, 0666);
  if(impl->fd < 0) impl->fail("unable to open");
}

std::uint_fast64_t File::size() const {
  struct stat st;
  if(::fstat(impl->fd, &st) != 0) impl->fail("unable to stat");
  return st.st_size;
}

const std::filesystem::path& File::path() const noexcept {
  return impl->path;
}

void File::Instance::readat(std::uint_fast64_t offset, std::size_t size, char* data) {
  std::size_t done = 0;
  while(done < size) {
    const auto n = ::pread(file->fd, data + done, size - done, offset + done);
    if(n < 0 && errno == EINTR) continue;
    if(n < 0) file->fail("unable to read");
    if(n == 0) {
      errno = ENODATA;
      file->fail("unexpected end of file in");
    }
    done += n;
  }
}

void File::Instance::writeat(std::uint_fast64_t offset, std::size_t size, const char* data) {
  std::size_t done = 0;
  while(done < size) {
    const auto n = ::pwrite(file->fd, data + done, size - done, offset + done);
    if(n < 0 && errno == EINTR) continue;
    if(n < 0) file->fail("unable to write");
    if(n == 0) {
      errno = EIO;
      file->fail("no progress writing");
    }
    done += n;
  }
}
