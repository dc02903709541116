// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Errors.hpp"
#include "SignatureData.hpp"

#include <cassert>

namespace {

auto john_doe() -> sig::SignatureFields {
  return sig::SignatureFields{.name = " John Doe ",
                              .position = "Software Engineer",
                              .address = "Anytown, USA",
                              .phone = "+1 555 0100",
                              .mobile = "",
                              .email = "john.doe@example.com",
                              .website = "",
                              .logo_path = ""};
}

} // namespace

void test_create_normalizes_fields() {
  sig::SignatureData data = sig::SignatureData::create(john_doe());
  assert(data.name() == "John Doe");
  assert(data.phone() == "+1 555 0100");
  assert(data.mobile().empty());
  assert(data.website().empty());
  assert(data.website_or("www.example.com") == "www.example.com");
  assert(!data.logo_path().has_value());
}

void test_create_fails_atomically() {
  sig::SignatureFields fields = john_doe();
  fields.email = "not-an-email";
  bool thrown = false;
  try {
    [[maybe_unused]] auto data = sig::SignatureData::create(fields);
  } catch (sig::ValidationError const& error) {
    thrown = true;
    assert(error.field() == "email");
  }
  assert(thrown);
}

void test_missing_required_field_names_the_field() {
  sig::SignatureFields fields = john_doe();
  fields.position = "   ";
  try {
    [[maybe_unused]] auto data = sig::SignatureData::create(fields);
    assert(false);
  } catch (sig::ValidationError const& error) {
    assert(error.field() == "position");
  }
}

void test_fields_round_trip() {
  sig::SignatureData data = sig::SignatureData::create(john_doe());
  sig::SignatureData again = sig::SignatureData::create(data.to_fields());
  assert(data == again);
}

int main() {
  test_create_normalizes_fields();
  test_create_fails_atomically();
  test_missing_required_field_names_the_field();
  test_fields_round_trip();
}
