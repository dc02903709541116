// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "SignatureData.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

namespace sig {

enum class Command { Render, ListProfiles, DeleteProfile, WriteConfig, Help };

struct ProgramOptions {
  Command command = Command::Render;
  std::optional<std::filesystem::path> configPath;
  std::filesystem::path outputPath = "email_signature.png";
  std::filesystem::path profilesDirectory = "profiles";
  std::optional<std::string> profile;
  std::optional<std::string> saveProfile;
  std::string deleteProfile;
  std::filesystem::path writeConfigPath;
  bool noLogo = false;
  bool verbose = false;

  // Field values given on the command line; unset fields come from a profile or a prompt.
  std::optional<std::string> name;
  std::optional<std::string> position;
  std::optional<std::string> address;
  std::optional<std::string> phone;
  std::optional<std::string> mobile;
  std::optional<std::string> email;
  std::optional<std::string> website;
  std::optional<std::string> logo;
};

// Invalid command line usage. Reported with the usage text and exit code 2.
struct UsageError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions;

auto print_usage(std::ostream& out, const char* program) -> void;

// Where the configuration comes from: --config, else config/signet.yaml below `baseDirectory`
// if present, else built-in defaults.
auto resolve_config_path(ProgramOptions const& options,
                         std::filesystem::path const& baseDirectory = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Overlays the command line values on `fields`.
auto apply_field_options(ProgramOptions const& options, SignatureFields fields) -> SignatureFields;

auto has_required_fields(SignatureFields const& fields) -> bool;

// Asks for every field that is empty and was not given on the command line. Required fields
// are asked until they validate; optional ones accept an empty answer. Throws
// ValidationError naming the field if `in` ends first.
auto prompt_missing_fields(ProgramOptions const& options, SignatureFields fields,
                           std::istream& in, std::ostream& out) -> SignatureFields;

} // namespace sig
