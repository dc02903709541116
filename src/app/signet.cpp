// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "AtomicFile.hpp"
#include "CommandLine.hpp"
#include "ConfigLoader.hpp"
#include "Errors.hpp"
#include "Logging.hpp"
#include "PngCodec.hpp"
#include "ProfileStore.hpp"
#include "SignatureGenerator.hpp"

#include <iostream>

namespace sig {

constexpr int ExitSuccess = 0;
constexpr int ExitFailure = 1;
constexpr int ExitUsage = 2;

auto run(ProgramOptions const& options, SignatureConfig const& config) -> int;

} // namespace sig

int main(int argc, char** argv) {
  sig::Log::apply_environment();

  sig::ProgramOptions options;
  try {
    options = sig::parse_command_line_args(argc, argv);
  } catch (sig::UsageError const& error) {
    std::cerr << argv[0] << ": " << error.what() << "\n";
    sig::print_usage(std::cerr, argv[0]);
    return sig::ExitUsage;
  }

  if (options.command == sig::Command::Help) {
    sig::print_usage(std::cout, argv[0]);
    return sig::ExitSuccess;
  }
  if (options.verbose) {
    sig::Log::set_level(sig::Log::Level::Debug);
  }

  sig::SignatureConfig config;
  try {
    config = sig::ConfigLoader::load(sig::resolve_config_path(options));
  } catch (sig::ConfigError const& error) {
    sig::Log::e("{}", error.what());
    return sig::ExitUsage;
  }

  try {
    return sig::run(options, config);
  } catch (sig::ConfigError const& error) {
    sig::Log::e("{}", error.what());
    return sig::ExitUsage;
  } catch (sig::SignetError const& error) {
    sig::Log::e("{}", error.what());
  }
  return sig::ExitFailure;
}

namespace sig {

auto run(ProgramOptions const& options, SignatureConfig const& config) -> int {
  ProfileStore store(options.profilesDirectory);

  switch (options.command) {
  case Command::ListProfiles: {
    for (std::string const& name : store.list()) {
      std::cout << name << "\n";
    }
    return ExitSuccess;
  }
  case Command::DeleteProfile:
    store.remove(options.deleteProfile);
    std::cout << "Deleted profile " << options.deleteProfile << "\n";
    return ExitSuccess;
  case Command::WriteConfig:
    ConfigLoader::save(config, options.writeConfigPath);
    std::cout << "Configuration written to " << options.writeConfigPath.string() << "\n";
    return ExitSuccess;
  case Command::Help:
  case Command::Render:
    break;
  }

  SignatureFields fields;
  if (options.profile) {
    fields = store.load(*options.profile).fields;
  }
  fields = apply_field_options(options, std::move(fields));
  if (!has_required_fields(fields)) {
    fields = prompt_missing_fields(options, std::move(fields), std::cin, std::cout);
  }
  if (fields.logo_path.empty() && !options.noLogo) {
    if (auto logo = find_logo(config)) {
      fields.logo_path = logo->string();
    } else {
      Log::i("No logo found, rendering without one");
    }
  }

  SignatureData data = SignatureData::create(fields);
  if (options.saveProfile) {
    store.save(to_profile(data, *options.saveProfile));
  }

  SignatureGenerator generator(config);
  Canvas canvas = generator.render_canvas(data);
  write_file_atomically(options.outputPath, encode_png(canvas));
  std::cout << "Signature written to " << options.outputPath.string() << " (" << canvas.width()
            << "x" << canvas.height() << " px)\n";
  return ExitSuccess;
}

} // namespace sig
