// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <fmt/format.h>

#include <optional>
#include <source_location>
#include <string_view>

namespace sig {

struct Log {
  enum class Level { Debug, Info, Warning, Error };

  // Messages below this level are discarded. Defaults to Info.
  static void set_level(Level level) noexcept;
  static auto level() noexcept -> Level;

  // Accepts "debug", "info", "warning" (or "warn") and "error", case-insensitive.
  static auto parse_level(std::string_view name) -> std::optional<Level>;

  // Reads SIGNET_LOG_LEVEL and applies it if it names a valid level.
  static void apply_environment();

  static void vlog(Level, const std::source_location& location, std::string_view format,
                   fmt::format_args args);

  template <typename... Args>
  static void log(Level level, const std::source_location& location, std::string_view format,
                  Args&&... args) {
    if (level < Log::level()) {
      return;
    }
    vlog(level, location, format, fmt::make_format_args(args...));
  }

  template <typename... Args> struct d {
    d(std::string_view format, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Debug, location, format, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> d(std::string_view, Args&&...) -> d<Args...>;

  template <typename... Args> struct i {
    i(std::string_view format, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Info, location, format, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> i(std::string_view, Args&&...) -> i<Args...>;

  template <typename... Args> struct w {
    w(std::string_view format, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Warning, location, format, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> w(std::string_view, Args&&...) -> w<Args...>;

  template <typename... Args> struct e {
    e(std::string_view format, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Error, location, format, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> e(std::string_view, Args&&...) -> e<Args...>;
};

} // namespace sig
