// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace sig {

// Field checks applied to raw user input before it may reach the renderer.
// Each returns the accepted, normalized value or throws ValidationError carrying the field
// name and a readable reason. Empty optional input is never an error.

// Required text field (name, position, address). Returns the trimmed value.
auto validate_required(std::string_view field, std::string_view value) -> std::string;

auto validate_name(std::string_view value) -> std::string;

// local@domain with at least one '.' in the domain and no whitespace. Case is preserved.
auto validate_email(std::string_view value) -> std::string;

// Optional. Digits with an optional leading '+' and the separators space, '-', '.', '(' and
// ')'. At least seven digits. Returns "" for empty input, otherwise the trimmed value.
auto validate_phone(std::string_view value, std::string_view field = "phone") -> std::string;

// Optional. A host name, optionally preceded by a scheme and followed by a port and path.
// Returns "" for empty input, which means "use the configured default".
auto validate_url(std::string_view value) -> std::string;

// Optional logo path: must name an existing, readable regular file with a supported image
// extension. Returns nullopt for empty input.
auto validate_path(std::string_view value) -> std::optional<std::filesystem::path>;

// Image file extensions the logo decoder understands, lower case with leading dot.
auto is_supported_image_extension(std::filesystem::path const& path) -> bool;

auto trim(std::string_view value) -> std::string_view;

} // namespace sig
