// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <cassert>
#include <cstdlib>
#include <string>

void test_parse_level() {
  assert(sig::Log::parse_level("debug") == sig::Log::Level::Debug);
  assert(sig::Log::parse_level("INFO") == sig::Log::Level::Info);
  assert(sig::Log::parse_level("Warn") == sig::Log::Level::Warning);
  assert(sig::Log::parse_level("warning") == sig::Log::Level::Warning);
  assert(sig::Log::parse_level("error") == sig::Log::Level::Error);
  assert(!sig::Log::parse_level("verbose"));
}

void test_environment_sets_level() {
  sig::Log::set_level(sig::Log::Level::Info);
  ::setenv("SIGNET_LOG_LEVEL", "error", 1);
  sig::Log::apply_environment();
  assert(sig::Log::level() == sig::Log::Level::Error);

  ::setenv("SIGNET_LOG_LEVEL", "nonsense", 1);
  sig::Log::apply_environment();
  assert(sig::Log::level() == sig::Log::Level::Error);
  ::unsetenv("SIGNET_LOG_LEVEL");
}

void test_messages_format_arguments() {
  sig::Log::set_level(sig::Log::Level::Debug);
  const std::string path = "out.png";
  sig::Log::d("debug {} {}", 1, path);
  sig::Log::i("wrote {} bytes to {}", std::size_t{42}, path);
  sig::Log::w("plain warning");
  sig::Log::e("error {:>4}", 7);
  sig::Log::set_level(sig::Log::Level::Info);
}

int main() {
  test_parse_level();
  test_environment_sets_level();
  test_messages_format_arguments();
}
