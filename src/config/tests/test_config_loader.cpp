// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "ConfigLoader.hpp"
#include "Errors.hpp"

#include <cassert>
#include <filesystem>
#include <map>
#include <string>

namespace {

auto no_environment() -> sig::EnvironmentLookup {
  return [](const char*) -> const char* { return nullptr; };
}

auto fake_environment(std::map<std::string, std::string> values) -> sig::EnvironmentLookup {
  return [values = std::move(values)](const char* name) -> const char* {
    auto it = values.find(name);
    return it == values.end() ? nullptr : it->second.c_str();
  };
}

template <class Fn> auto expect_config_error(Fn&& fn) -> std::string {
  try {
    fn();
  } catch (sig::ConfigError const& error) {
    return error.key();
  }
  assert(false && "expected ConfigError");
  return {};
}

} // namespace

void test_defaults_without_document() {
  sig::SignatureConfig config = sig::ConfigLoader::load(std::nullopt, no_environment());
  assert(config == sig::SignatureConfig{});
  assert(config.logo_height == 70);
  assert(config.margin == 15);
  assert(config.logo_margin_right == 20);
  assert(config.line_height == 22);
  assert(config.font_sizes.name == 16);
  assert(config.font_sizes.details == 14);
  assert(config.font_sizes.confidentiality == 9);
  assert(config.colors.separator == (sig::Color{200, 0, 40, 200}));
  assert(config.default_website == "www.example.com");
  config.validate();
}

void test_empty_document_yields_defaults() {
  assert(sig::ConfigLoader::parse("") == sig::SignatureConfig{});
  assert(sig::ConfigLoader::parse("signature:\n") == sig::SignatureConfig{});
}

void test_partial_document_overrides_only_named_values() {
  sig::SignatureConfig config = sig::ConfigLoader::parse(R"(
signature:
  dimensions:
    margin: 10
    line_height: 24
  colors:
    name: [0, 0, 255]
    separator: [10, 20, 30, 40]
  font_sizes:
    name: 18
  text:
    default_website: "www.acme.test"
)");
  assert(config.margin == 10);
  assert(config.line_height == 24);
  assert(config.logo_height == 70);
  assert(config.colors.name == (sig::Color{0, 0, 255, 255}));
  assert(config.colors.separator == (sig::Color{10, 20, 30, 40}));
  assert(config.colors.details == sig::SignatureConfig{}.colors.details);
  assert(config.font_sizes.name == 18);
  assert(config.font_sizes.details == 14);
  assert(config.default_website == "www.acme.test");
}

void test_flat_font_list_splits_name_and_details() {
  sig::SignatureConfig config = sig::ConfigLoader::parse(R"(
signature:
  fonts:
    linux: ["/fonts/Bold.ttf", "/fonts/Regular.ttf"]
)");
  auto const& paths = config.fonts.at("linux");
  assert(paths.name.size() == 1 && paths.name[0] == "/fonts/Bold.ttf");
  assert(paths.details.size() == 1 && paths.details[0] == "/fonts/Regular.ttf");
  assert(paths.confidentiality == paths.details);
  assert(config.font_candidates(sig::TextRole::Name, "linux")[0] == "/fonts/Bold.ttf");
  assert(config.font_candidates(sig::TextRole::Name, "plan9").empty());
}

void test_invalid_values_name_their_key() {
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature:\n  dimensions:\n    margin: -1\n");
         }) == "signature.dimensions.margin");
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature:\n  dimensions:\n    margin: wide\n");
         }) == "signature.dimensions.margin");
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature:\n  colors:\n    name: [1, 2]\n");
         }) == "signature.colors.name");
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature:\n  colors:\n    name: [1, 2, 300]\n");
         }) == "signature.colors.name");
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature:\n  colors:\n    background: [1, 2, 3]\n");
         }) == "signature.colors.background");
  expect_config_error([] { sig::ConfigLoader::parse("signature: [unclosed\n"); });
}

void test_oversized_values_are_rejected() {
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature: {dimensions: {line_height: 1000000000}}");
         }) == "signature.dimensions.line_height");
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature: {dimensions: {logo_height: 2000000000}}");
         }) == "signature.dimensions.logo_height");
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature: {font_sizes: {name: 513}}");
         }) == "signature.font_sizes.name");
  assert(expect_config_error([] {
           sig::ConfigLoader::parse("signature: {outline: {name_width: 17}}");
         }) == "signature.outline.name_width");
  assert(expect_config_error([] {
           sig::ConfigLoader::apply_environment(
               sig::SignatureConfig{}, fake_environment({{"SIGNET_MARGIN", "4097"}}));
         }) == "signature.dimensions.margin");

  sig::SignatureConfig largest = sig::ConfigLoader::parse(
      "signature: {dimensions: {line_height: 4096, separator_thickness: 4096}}");
  assert(largest.line_height == sig::SignatureConfig::MaxDimension);
}

void test_missing_explicit_file_is_an_error() {
  expect_config_error([] {
    sig::ConfigLoader::load(std::filesystem::path("/nonexistent/signet.yaml"), no_environment());
  });
}

void test_environment_overrides_document() {
  sig::SignatureConfig config = sig::ConfigLoader::apply_environment(
      sig::SignatureConfig{}, fake_environment({{"SIGNET_MARGIN", "5"},
                                                {"SIGNET_DEFAULT_WEBSITE", "www.env.test"},
                                                {"SIGNET_COLOR_NAME", "1, 2, 3"}}));
  assert(config.margin == 5);
  assert(config.default_website == "www.env.test");
  assert(config.colors.name == (sig::Color{1, 2, 3}));

  assert(expect_config_error([] {
           sig::ConfigLoader::apply_environment(sig::SignatureConfig{},
                                                fake_environment({{"SIGNET_LINE_HEIGHT", "x"}}));
         }) == "SIGNET_LINE_HEIGHT");
}

void test_save_and_load_preserve_configuration() {
  sig::SignatureConfig config;
  config.margin = 12;
  config.colors.outline = sig::Color{1, 2, 3, 4};
  config.fallback_font_family = "Liberation Sans";

  const auto dir = std::filesystem::temp_directory_path() / "signet_test_config_loader";
  const auto path = dir / "signet.yaml";
  sig::ConfigLoader::save(config, path);
  assert(sig::ConfigLoader::load(path, no_environment()) == config);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

int main() {
  test_defaults_without_document();
  test_empty_document_yields_defaults();
  test_partial_document_overrides_only_named_values();
  test_flat_font_list_splits_name_and_details();
  test_invalid_values_name_their_key();
  test_oversized_values_are_rejected();
  test_missing_explicit_file_is_an_error();
  test_environment_overrides_document();
  test_save_and_load_preserve_configuration();
}
