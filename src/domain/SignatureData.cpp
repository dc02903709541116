// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "SignatureData.hpp"
#include "Validators.hpp"

namespace sig {

auto SignatureData::create(SignatureFields const& fields) -> SignatureData {
  SignatureData data;
  data.mName = validate_name(fields.name);
  data.mPosition = validate_required("position", fields.position);
  data.mAddress = validate_required("address", fields.address);
  data.mPhone = validate_phone(fields.phone, "phone");
  data.mMobile = validate_phone(fields.mobile, "mobile");
  data.mEmail = validate_email(fields.email);
  data.mWebsite = validate_url(fields.website);
  data.mLogoPath = validate_path(fields.logo_path);
  return data;
}

auto SignatureData::website_or(std::string_view fallback) const -> std::string {
  return mWebsite.empty() ? std::string(fallback) : mWebsite;
}

auto SignatureData::to_fields() const -> SignatureFields {
  return SignatureFields{.name = mName,
                         .position = mPosition,
                         .address = mAddress,
                         .phone = mPhone,
                         .mobile = mMobile,
                         .email = mEmail,
                         .website = mWebsite,
                         .logo_path = mLogoPath ? mLogoPath->string() : std::string{}};
}

} // namespace sig
