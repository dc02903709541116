// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace sig {

namespace {
std::atomic<Log::Level> gLevel{Log::Level::Info};
}

char levelToChar(Log::Level level) {
  switch (level) {
  case Log::Level::Debug:
    return 'D';
  case Log::Level::Error:
    return 'E';
  case Log::Level::Info:
    return 'I';
  case Log::Level::Warning:
    return 'W';
  }
  return 'U';
}

void Log::set_level(Level level) noexcept { gLevel.store(level, std::memory_order_relaxed); }

auto Log::level() noexcept -> Level { return gLevel.load(std::memory_order_relaxed); }

auto Log::parse_level(std::string_view name) -> std::optional<Level> {
  std::string lowered;
  lowered.reserve(name.size());
  for (char c : name) {
    lowered += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lowered == "debug") {
    return Level::Debug;
  }
  if (lowered == "info") {
    return Level::Info;
  }
  if (lowered == "warning" || lowered == "warn") {
    return Level::Warning;
  }
  if (lowered == "error") {
    return Level::Error;
  }
  return std::nullopt;
}

void Log::apply_environment() {
  const char* value = std::getenv("SIGNET_LOG_LEVEL");
  if (!value) {
    return;
  }
  if (auto parsed = parse_level(value)) {
    set_level(*parsed);
  } else {
    Log::w("Ignoring unknown SIGNET_LOG_LEVEL '{}'", value);
  }
}

void Log::vlog(Level level, const std::source_location& location, std::string_view format,
               fmt::format_args args) {
  std::string message = fmt::vformat(format, args);
  std::filesystem::path file = location.file_name();
  std::string file_name = file.filename();
  int pid = ::getpid();
  int tid = ::gettid();
  std::fprintf(stderr, "[%s:%u] %c %d-%d %s\n", file_name.c_str(), location.line(),
               levelToChar(level), pid, tid, message.c_str());
}

} // namespace sig
