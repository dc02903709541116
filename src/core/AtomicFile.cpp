// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "AtomicFile.hpp"
#include "Errors.hpp"
#include "FileDescriptor.hpp"
#include "Logging.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace sig {

namespace {

auto errno_reason(int error) -> std::string {
  return std::error_code(error, std::generic_category()).message();
}

auto make_temporary_path(std::filesystem::path const& target) -> std::filesystem::path {
  std::filesystem::path tmp = target;
  tmp += ".tmp-" + std::to_string(::getpid());
  return tmp;
}

} // namespace

auto write_file_atomically(std::filesystem::path const& path, std::span<std::uint8_t const> bytes)
    -> void {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw FileSystemError("create directory for", path, ec.message());
    }
  }

  const std::filesystem::path tmpPath = make_temporary_path(path);
  FileDescriptor fd = FileDescriptor::open(tmpPath, O_WRONLY | O_CREAT | O_TRUNC);
  try {
    fd.write_all(bytes);
    fd.sync();
    fd.close();
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
      throw FileSystemError("replace", path, ec.message());
    }
  } catch (FileSystemError const&) {
    fd.reset();
    std::filesystem::remove(tmpPath, ec);
    throw;
  }
  Log::d("Wrote {} bytes to {}", bytes.size(), path.string());
}

auto write_file_atomically(std::filesystem::path const& path, std::string_view text) -> void {
  write_file_atomically(
      path, std::span<std::uint8_t const>(reinterpret_cast<std::uint8_t const*>(text.data()),
                                          text.size()));
}

auto read_full_file(std::filesystem::path const& path) -> std::string {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw FileSystemError("open", path, errno_reason(errno));
  }
  std::string content{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
  if (file.bad()) {
    throw FileSystemError("read", path, "stream error");
  }
  return content;
}

} // namespace sig
