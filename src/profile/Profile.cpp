// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Profile.hpp"
#include "Errors.hpp"
#include "Validators.hpp"

namespace sig {

namespace {

constexpr std::size_t MaxProfileNameLength = 100;
constexpr std::string_view ReservedCharacters = "/\\:*?\"<>|";

} // namespace

auto validate_profile_name(std::string_view name) -> std::string {
  std::string_view trimmed = trim(name);
  if (trimmed.empty()) {
    throw ValidationError("profile", "profile name must not be empty");
  }
  if (trimmed.size() > MaxProfileNameLength) {
    throw ValidationError("profile", "profile name must be at most 100 bytes");
  }
  if (trimmed == "." || trimmed == "..") {
    throw ValidationError("profile", "profile name must not be '.' or '..'");
  }
  for (char c : trimmed) {
    if (ReservedCharacters.find(c) != std::string_view::npos) {
      throw ValidationError("profile", std::string("profile name must not contain '") + c + "'");
    }
    if (static_cast<unsigned char>(c) < 0x20 || c == 0x7F) {
      throw ValidationError("profile", "profile name must not contain control characters");
    }
  }
  return std::string(trimmed);
}

auto to_profile(SignatureData const& data, std::string_view profileName) -> ProfileRecord {
  return ProfileRecord{.profile = validate_profile_name(profileName), .fields = data.to_fields()};
}

auto from_profile(ProfileRecord const& record) -> SignatureData {
  validate_profile_name(record.profile);
  return SignatureData::create(record.fields);
}

} // namespace sig
