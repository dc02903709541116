// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <filesystem>
#include <span>

namespace sig {

// Owns a POSIX file descriptor and closes it on destruction.
// The checked operations throw FileSystemError naming the path the descriptor was opened with.
class FileDescriptor {
public:
  FileDescriptor() noexcept;

  FileDescriptor(const FileDescriptor&) = delete;
  auto operator=(const FileDescriptor&) -> FileDescriptor& = delete;

  FileDescriptor(FileDescriptor&& other) noexcept;
  auto operator=(FileDescriptor&& other) noexcept -> FileDescriptor&;

  ~FileDescriptor();

  static auto open(std::filesystem::path const& path, int flags, int mode = 0644)
      -> FileDescriptor;

  auto native_handle() const noexcept -> int;
  auto path() const noexcept -> std::filesystem::path const&;
  auto is_open() const noexcept -> bool;

  // Retries on EINTR and short writes.
  auto write_all(std::span<std::uint8_t const> bytes) -> void;

  auto sync() -> void;

  // Unlike the destructor this reports close failures, which may surface deferred write errors.
  auto close() -> void;

  auto reset() noexcept -> void;

private:
  FileDescriptor(int handle, std::filesystem::path path) noexcept;

  int mNativeHandle;
  std::filesystem::path mPath;
};

} // namespace sig
