// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "SignatureData.hpp"

#include <string>
#include <string_view>

namespace sig {

// Persisted form of a signature: the raw field values plus the profile's own name.
struct ProfileRecord {
  std::string profile;
  SignatureFields fields;

  bool operator==(const ProfileRecord&) const = default;
};

// Throws ValidationError (field "profile") unless `name` can be used as a single file name
// segment. Returns the trimmed name.
auto validate_profile_name(std::string_view name) -> std::string;

auto to_profile(SignatureData const& data, std::string_view profileName) -> ProfileRecord;

// Validates the stored fields exactly like interactive input.
auto from_profile(ProfileRecord const& record) -> SignatureData;

} // namespace sig
