// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Errors.hpp"

#include <fmt/format.h>

namespace sig {

ValidationError::ValidationError(std::string_view field, std::string_view reason)
    : SignetError(fmt::format("Invalid {}: {}", field, reason)), mField(field), mReason(reason) {}

RenderError::RenderError(std::string_view operation, std::string_view reason)
    : SignetError(fmt::format("Rendering failed during {}: {}", operation, reason)),
      mOperation(operation), mReason(reason) {}

ConfigError::ConfigError(std::string_view key, std::string_view reason)
    : SignetError(fmt::format("Configuration error at '{}': {}", key, reason)), mKey(key),
      mReason(reason) {}

ProfileError::ProfileError(std::string_view profile, std::string_view reason)
    : SignetError(fmt::format("Profile '{}': {}", profile, reason)), mProfile(profile),
      mReason(reason) {}

FileSystemError::FileSystemError(std::string_view operation, std::filesystem::path path,
                                 std::string_view reason)
    : SignetError(fmt::format("Failed to {} '{}': {}", operation, path.string(), reason)),
      mOperation(operation), mPath(std::move(path)), mReason(reason) {}

} // namespace sig
