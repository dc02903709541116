// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Validators.hpp"
#include "Errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace sig {

namespace {

constexpr std::array<std::string_view, 3> kSupportedImageExtensions = {".png", ".jpg", ".jpeg"};

auto is_space(char c) -> bool { return std::isspace(static_cast<unsigned char>(c)) != 0; }

auto is_digit(char c) -> bool { return c >= '0' && c <= '9'; }

auto is_alpha(char c) -> bool { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

auto contains_space(std::string_view value) -> bool {
  return std::any_of(value.begin(), value.end(), is_space);
}

// C0 controls, DEL and the UTF-8 encoded C1 range U+0080..U+009F. Tab and line breaks count
// as controls too: every field renders on a single line.
auto reject_control_characters(std::string_view field, std::string_view value) -> void {
  for (std::size_t i = 0; i < value.size(); ++i) {
    const auto byte = static_cast<unsigned char>(value[i]);
    const bool c1 = byte == 0xC2 && i + 1 < value.size() &&
                    static_cast<unsigned char>(value[i + 1]) >= 0x80 &&
                    static_cast<unsigned char>(value[i + 1]) <= 0x9F;
    if (byte < 0x20 || byte == 0x7F || c1) {
      throw ValidationError(field, "must not contain control characters");
    }
  }
}

// Letters, digits and '-' in each dot-separated label; no empty labels; labels do not start
// or end with '-'. Non-ASCII bytes are accepted so internationalized names pass through.
auto is_host_name(std::string_view host) -> bool {
  if (host.empty() || host.size() > 253) {
    return false;
  }
  std::size_t start = 0;
  while (start <= host.size()) {
    std::size_t end = host.find('.', start);
    if (end == std::string_view::npos) {
      end = host.size();
    }
    std::string_view label = host.substr(start, end - start);
    if (label.empty() || label.size() > 63 || label.front() == '-' || label.back() == '-') {
      return false;
    }
    for (char c : label) {
      auto uc = static_cast<unsigned char>(c);
      if (!(std::isalnum(uc) || c == '-' || uc >= 0x80)) {
        return false;
      }
    }
    start = end + 1;
  }
  return true;
}

} // namespace

auto trim(std::string_view value) -> std::string_view {
  while (!value.empty() && is_space(value.front())) {
    value.remove_prefix(1);
  }
  while (!value.empty() && is_space(value.back())) {
    value.remove_suffix(1);
  }
  return value;
}

auto validate_required(std::string_view field, std::string_view value) -> std::string {
  std::string_view trimmed = trim(value);
  if (trimmed.empty()) {
    throw ValidationError(field, "is required and cannot be empty or whitespace only");
  }
  reject_control_characters(field, trimmed);
  return std::string(trimmed);
}

auto validate_name(std::string_view value) -> std::string {
  return validate_required("name", value);
}

auto validate_email(std::string_view value) -> std::string {
  std::string_view email = trim(value);
  if (email.empty()) {
    throw ValidationError("email", "is required and cannot be empty");
  }
  reject_control_characters("email", email);
  if (contains_space(email)) {
    throw ValidationError("email", "must not contain whitespace");
  }
  const std::size_t at = email.find('@');
  if (at == std::string_view::npos) {
    throw ValidationError("email",
                          "is missing the '@' separator (expected a form like user@example.com)");
  }
  if (email.find('@', at + 1) != std::string_view::npos) {
    throw ValidationError("email", "must contain exactly one '@'");
  }
  std::string_view local = email.substr(0, at);
  std::string_view domain = email.substr(at + 1);
  if (local.empty()) {
    throw ValidationError("email", "is missing the part before '@'");
  }
  if (domain.empty()) {
    throw ValidationError("email", "is missing the domain after '@'");
  }
  if (domain.find('.') == std::string_view::npos) {
    throw ValidationError("email", "domain must contain at least one '.' (e.g. example.com)");
  }
  if (domain.front() == '.' || domain.back() == '.' ||
      domain.find("..") != std::string_view::npos) {
    throw ValidationError("email", "domain contains an empty label");
  }
  return std::string(email);
}

auto validate_phone(std::string_view value, std::string_view field) -> std::string {
  std::string_view phone = trim(value);
  if (phone.empty()) {
    return {};
  }
  reject_control_characters(field, phone);
  std::size_t digits = 0;
  for (std::size_t i = 0; i < phone.size(); ++i) {
    char c = phone[i];
    if (is_digit(c)) {
      ++digits;
    } else if (c == '+') {
      if (i != 0) {
        throw ValidationError(field, "'+' is only allowed at the start of the number");
      }
    } else if (is_alpha(c)) {
      throw ValidationError(field, "must not contain letters");
    } else if (c != ' ' && c != '-' && c != '.' && c != '(' && c != ')') {
      throw ValidationError(field, std::string("contains an unsupported character '") + c + "'");
    }
  }
  if (digits < 7) {
    throw ValidationError(field, "must contain at least 7 digits");
  }
  return std::string(phone);
}

auto validate_url(std::string_view value) -> std::string {
  std::string_view url = trim(value);
  if (url.empty()) {
    return {};
  }
  reject_control_characters("website", url);
  if (contains_space(url)) {
    throw ValidationError("website", "must not contain whitespace");
  }

  std::string_view rest = url;
  if (std::size_t scheme = rest.find("://"); scheme != std::string_view::npos) {
    std::string_view name = rest.substr(0, scheme);
    bool validScheme = !name.empty() && is_alpha(name.front()) &&
                       std::all_of(name.begin(), name.end(), [](char c) {
                         return std::isalnum(static_cast<unsigned char>(c)) || c == '+' ||
                                c == '-' || c == '.';
                       });
    if (!validScheme) {
      throw ValidationError("website", "has an invalid scheme");
    }
    rest.remove_prefix(scheme + 3);
  }

  std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));
  std::string_view host = authority;
  if (std::size_t colon = authority.rfind(':'); colon != std::string_view::npos) {
    std::string_view port = authority.substr(colon + 1);
    if (port.empty() || port.size() > 5 || !std::all_of(port.begin(), port.end(), is_digit)) {
      throw ValidationError("website", "has an invalid port");
    }
    host = authority.substr(0, colon);
  }
  if (host.empty()) {
    throw ValidationError("website", "is missing a host name");
  }
  if (host != "localhost" && host.find('.') == std::string_view::npos) {
    throw ValidationError("website", "host name must contain a '.' (e.g. www.example.com)");
  }
  if (!is_host_name(host)) {
    throw ValidationError("website", "is not a valid host name");
  }
  return std::string(url);
}

auto is_supported_image_extension(std::filesystem::path const& path) -> bool {
  std::string extension = path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return std::find(kSupportedImageExtensions.begin(), kSupportedImageExtensions.end(),
                   extension) != kSupportedImageExtensions.end();
}

auto validate_path(std::string_view value) -> std::optional<std::filesystem::path> {
  std::string_view raw = trim(value);
  if (raw.empty()) {
    return std::nullopt;
  }
  reject_control_characters("logo", raw);
  std::filesystem::path path{std::string(raw)};
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw ValidationError("logo", "file '" + path.string() + "' does not exist");
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ValidationError("logo", "'" + path.string() + "' is not a regular file");
  }
  if (!is_supported_image_extension(path)) {
    throw ValidationError("logo", "'" + path.string() +
                                      "' is not a supported image (expected .png, .jpg or .jpeg)");
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw ValidationError("logo", "file '" + path.string() + "' is not readable");
  }
  return path;
}

} // namespace sig
