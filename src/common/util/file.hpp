// SPDX-FileCopyrightText: 2002-2024 Rice University
// SPDX-FileCopyrightText: 2024 Contributors to the HPCToolkit Project
//
// SPDX-License-Identifier: BSD-3-Clause

// -*-Mode: C++;-*-

#ifndef POLLCATCH_UTIL_FILE_H
#define POLLCATCH_UTIL_FILE_H

#include <cstdint>
#include <filesystem>
#include <memory>

namespace pollcatch::util {

namespace detail {
struct FileImpl;
}

/// A file on disk accessed by absolute offsets. Nothing happens on the
/// filesystem until initialize() is called; every failure after that is
/// reported as a std::system_error naming the path.
class File final {
public:
  class Instance;

  /// `create` truncates or creates the file and allows writes, otherwise the
  /// file must exist and is opened read-only.
  File(std::filesystem::path, bool create) noexcept;
  ~File();

  File(File&&);
  File& operator=(File&&);
  File(const File&) = delete;
  File& operator=(const File&) = delete;

  /// Open the file. Must be called exactly once.
  // MT: Externally Synchronized
  void initialize();

  /// Size on disk in bytes.
  std::uint_fast64_t size() const;

  const std::filesystem::path& path() const noexcept;

  /// Get a handle for positioned access. Handles must not outlive the File.
  // MT: Internally Synchronized
  Instance open() const noexcept { return Instance(*this); }

  // MT: Externally Synchronized
  class Instance final {
  public:
    Instance() = default;
    Instance(Instance&&) = default;
    Instance& operator=(Instance&&) = default;

    /// Fill `data` with `size` bytes starting at `offset`. Reading past the
    /// end of the file is an error.
    void readat(std::uint_fast64_t offset, std::size_t size, char* data);

    /// Store `size` bytes from `data` at `offset`.
    void writeat(std::uint_fast64_t offset, std::size_t size, const char* data);

    /// Store a whole contiguous container (std::array, std::vector...).
    template<class C>
    void writeat(std::uint_fast64_t offset, const C& c) {
      writeat(offset, c.size(), c.data());
    }

  private:
    friend class File;
    explicit Instance(const File& f) noexcept : file(f.impl.get()) {};

    const detail::FileImpl* file = nullptr;
  };

private:
  std::unique_ptr<detail::FileImpl> impl;
};

}

#endif  // POLLCATCH_UTIL_FILE_H
