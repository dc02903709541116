// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "Errors.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sig {

// One JSON file per profile, `<directory>/<name>.json`.
class ProfileStore {
public:
  explicit ProfileStore(std::filesystem::path directory);

  auto directory() const noexcept -> std::filesystem::path const& { return mDirectory; }

  // Creates the directory if needed and replaces any existing profile of the same name.
  auto save(ProfileRecord const& record) const -> void;

  // Throws ProfileError if the profile does not exist or cannot be parsed.
  auto load(std::string_view name) const -> ProfileRecord;

  // Sorted profile names. Empty if the directory does not exist.
  auto list() const -> std::vector<std::string>;

  auto exists(std::string_view name) const -> bool;

  // Throws ProfileError if the profile does not exist.
  auto remove(std::string_view name) const -> void;

  static auto to_json(ProfileRecord const& record) -> std::string;
  static auto from_json(std::string_view json, std::string_view source) -> ProfileRecord;

private:
  auto path_for(std::string_view name) const -> std::filesystem::path;
  auto missing_profile(std::string const& name) const -> ProfileError;

  std::filesystem::path mDirectory;
};

} // namespace sig
