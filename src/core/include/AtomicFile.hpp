// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace sig {

// Writes `bytes` to `path` through a temporary file in the same directory that is flushed
// and then renamed over the target. Missing parent directories are created.
// Throws FileSystemError on any failure; the target is left untouched in that case.
auto write_file_atomically(std::filesystem::path const& path, std::span<std::uint8_t const> bytes)
    -> void;

auto write_file_atomically(std::filesystem::path const& path, std::string_view text) -> void;

// Reads a whole file. Throws FileSystemError if it cannot be opened or read.
auto read_full_file(std::filesystem::path const& path) -> std::string;

} // namespace sig
