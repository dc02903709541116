// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2025 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <concepts>
#include <stdexcept>
#include <type_traits>

namespace sig {

struct NarrowError : public std::runtime_error {
  NarrowError() : std::runtime_error("narrowing error") {}
};

/**
 * @brief Converts an integer to another integer type, throwing if the value does not fit.
 *
 * Pixel dimensions travel as int in the layout math and as std::size_t or std::uint32_t at
 * the buffer and codec boundaries; every such crossing goes through here.
 */
template <class T, class U>
  requires std::integral<T> && std::integral<U>
auto narrow(U u) -> T {
  static constexpr bool isDifferentSignedness = std::is_signed_v<T> != std::is_signed_v<U>;
  T t = static_cast<T>(u);
  if (static_cast<U>(t) != u || (isDifferentSignedness && ((t < T{}) != (u < U{})))) {
    throw NarrowError();
  }
  return t;
}

} // namespace sig
