// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sig {

// Unvalidated field values as typed by the user or read from a profile.
struct SignatureFields {
  std::string name;
  std::string position;
  std::string address;
  std::string phone;
  std::string mobile;
  std::string email;
  std::string website;
  std::string logo_path;

  auto operator==(SignatureFields const&) const -> bool = default;
};

// Everything needed to render one signature. Instances only exist with every field
// validated; there are no setters.
class SignatureData {
public:
  // Validates every field and throws ValidationError on the first failure. Nothing is
  // constructed in that case.
  static auto create(SignatureFields const& fields) -> SignatureData;

  auto name() const noexcept -> std::string const& { return mName; }
  auto position() const noexcept -> std::string const& { return mPosition; }
  auto address() const noexcept -> std::string const& { return mAddress; }
  auto phone() const noexcept -> std::string const& { return mPhone; }
  auto mobile() const noexcept -> std::string const& { return mMobile; }
  auto email() const noexcept -> std::string const& { return mEmail; }

  // Empty when the configured default should be used.
  auto website() const noexcept -> std::string const& { return mWebsite; }
  auto website_or(std::string_view fallback) const -> std::string;

  auto logo_path() const noexcept -> std::optional<std::filesystem::path> const& {
    return mLogoPath;
  }

  // Back to raw fields, e.g. for editing or persisting.
  auto to_fields() const -> SignatureFields;

  auto operator==(SignatureData const&) const -> bool = default;

private:
  SignatureData() = default;

  std::string mName;
  std::string mPosition;
  std::string mAddress;
  std::string mPhone;
  std::string mMobile;
  std::string mEmail;
  std::string mWebsite;
  std::optional<std::filesystem::path> mLogoPath;
};

} // namespace sig
