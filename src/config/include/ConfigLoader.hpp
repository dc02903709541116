// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "SignatureConfig.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sig {

// Looks up an environment variable; returns nullptr when unset.
using EnvironmentLookup = std::function<const char*(const char*)>;

auto process_environment() -> EnvironmentLookup;

// Builds a SignatureConfig from defaults, a YAML document and environment overrides.
// Every failure is reported as ConfigError; a partially valid configuration is never returned.
class ConfigLoader {
public:
  // Without a path only defaults and the environment apply. A path that does not exist is an
  // error: it was asked for explicitly.
  static auto load(std::optional<std::filesystem::path> const& path,
                   EnvironmentLookup const& env = process_environment()) -> SignatureConfig;

  // Parses `document` on top of `base`. `source` names the document in error messages.
  static auto parse(std::string_view document, SignatureConfig base = {},
                    std::string_view source = "<string>") -> SignatureConfig;

  // Applies SIGNET_* overrides on top of `config`.
  static auto apply_environment(SignatureConfig config, EnvironmentLookup const& env)
      -> SignatureConfig;

  static auto to_yaml(SignatureConfig const& config) -> std::string;

  // Writes the configuration as YAML in the layout `parse` reads.
  static auto save(SignatureConfig const& config, std::filesystem::path const& path) -> void;
};

} // namespace sig
