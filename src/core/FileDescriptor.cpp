// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "FileDescriptor.hpp"
#include "Errors.hpp"

#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace sig {

namespace {

auto errno_reason(int error) -> std::string {
  return std::error_code(error, std::generic_category()).message();
}

} // namespace

FileDescriptor::FileDescriptor() noexcept : mNativeHandle(-1) {}

FileDescriptor::FileDescriptor(int handle, std::filesystem::path path) noexcept
    : mNativeHandle(handle), mPath(std::move(path)) {}

FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept
    : mNativeHandle(std::exchange(other.mNativeHandle, -1)), mPath(std::move(other.mPath)) {}

auto FileDescriptor::operator=(FileDescriptor&& other) noexcept -> FileDescriptor& {
  if (this != &other) {
    this->reset();
    mNativeHandle = std::exchange(other.mNativeHandle, -1);
    mPath = std::move(other.mPath);
  }
  return *this;
}

FileDescriptor::~FileDescriptor() { this->reset(); }

auto FileDescriptor::open(std::filesystem::path const& path, int flags, int mode)
    -> FileDescriptor {
  int handle = ::open(path.c_str(), flags | O_CLOEXEC, mode);
  if (handle < 0) {
    throw FileSystemError("open", path, errno_reason(errno));
  }
  return FileDescriptor(handle, path);
}

auto FileDescriptor::native_handle() const noexcept -> int { return mNativeHandle; }

auto FileDescriptor::path() const noexcept -> std::filesystem::path const& { return mPath; }

auto FileDescriptor::is_open() const noexcept -> bool { return mNativeHandle != -1; }

auto FileDescriptor::write_all(std::span<std::uint8_t const> bytes) -> void {
  std::size_t written = 0;
  while (written < bytes.size()) {
    ::ssize_t n = ::write(mNativeHandle, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw FileSystemError("write", mPath, errno_reason(errno));
    }
    written += static_cast<std::size_t>(n);
  }
}

auto FileDescriptor::sync() -> void {
  if (::fsync(mNativeHandle) != 0) {
    throw FileSystemError("flush", mPath, errno_reason(errno));
  }
}

auto FileDescriptor::close() -> void {
  int handle = std::exchange(mNativeHandle, -1);
  if (handle != -1 && ::close(handle) != 0) {
    throw FileSystemError("close", mPath, errno_reason(errno));
  }
}

auto FileDescriptor::reset() noexcept -> void {
  if (mNativeHandle != -1) {
    ::close(mNativeHandle);
    mNativeHandle = -1;
  }
}

} // namespace sig
