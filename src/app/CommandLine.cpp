// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "CommandLine.hpp"
#include "Errors.hpp"
#include "Validators.hpp"

#include <functional>
#include <istream>
#include <ostream>
#include <vector>

#include <getopt.h>

namespace sig {

namespace {

enum LongOnlyOption : int {
  NoLogo = 256,
  SaveProfile,
  ListProfiles,
  DeleteProfile,
  ProfilesDir,
  WriteConfig,
  Name,
  Position,
  Address,
  Phone,
  Mobile,
  Email,
  Website,
};

struct FieldPrompt {
  const char* label;
  std::string SignatureFields::*member;
  std::optional<std::string> ProgramOptions::*option;
  bool required;
  std::function<void(std::string_view)> validate;
};

auto field_prompts() -> std::vector<FieldPrompt> {
  return {
      {"Name", &SignatureFields::name, &ProgramOptions::name, true,
       [](std::string_view v) { validate_name(v); }},
      {"Position", &SignatureFields::position, &ProgramOptions::position, true,
       [](std::string_view v) { validate_required("position", v); }},
      {"Address", &SignatureFields::address, &ProgramOptions::address, true,
       [](std::string_view v) { validate_required("address", v); }},
      {"Phone", &SignatureFields::phone, &ProgramOptions::phone, false,
       [](std::string_view v) { validate_phone(v, "phone"); }},
      {"Mobile", &SignatureFields::mobile, &ProgramOptions::mobile, false,
       [](std::string_view v) { validate_phone(v, "mobile"); }},
      {"Email", &SignatureFields::email, &ProgramOptions::email, true,
       [](std::string_view v) { validate_email(v); }},
      {"Website", &SignatureFields::website, &ProgramOptions::website, false,
       [](std::string_view v) { validate_url(v); }},
  };
}

auto field_name(const char* label) -> std::string {
  std::string name(label);
  name[0] = static_cast<char>(name[0] - 'A' + 'a');
  return name;
}

} // namespace

auto print_usage(std::ostream& out, const char* program) -> void {
  out << "Usage: " << program << " [options]\n"
      << "\n"
      << "Renders an email signature as a transparent PNG.\n"
      << "\n"
      << "  -c, --config FILE          YAML configuration (default: config/signet.yaml if present)\n"
      << "  -o, --output FILE          output PNG (default: email_signature.png)\n"
      << "  -l, --logo FILE            logo PNG\n"
      << "      --no-logo              render without a logo\n"
      << "  -p, --profile NAME         load field values from a saved profile\n"
      << "      --save-profile NAME    save the field values as a profile\n"
      << "      --list-profiles        list saved profiles and exit\n"
      << "      --delete-profile NAME  delete a saved profile and exit\n"
      << "      --profiles-dir DIR     profile directory (default: profiles)\n"
      << "      --write-config FILE    write the effective configuration and exit\n"
      << "      --name, --position, --address, --phone, --mobile, --email, --website VALUE\n"
      << "  -v, --verbose              debug logging\n"
      << "  -h, --help                 show this help\n"
      << "\n"
      << "Missing required fields are asked for on standard input.\n";
}

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions {
  ProgramOptions result{};
  static const ::option long_options[] = {
      ::option{"config", required_argument, nullptr, 'c'},
      ::option{"output", required_argument, nullptr, 'o'},
      ::option{"logo", required_argument, nullptr, 'l'},
      ::option{"no-logo", no_argument, nullptr, NoLogo},
      ::option{"profile", required_argument, nullptr, 'p'},
      ::option{"save-profile", required_argument, nullptr, SaveProfile},
      ::option{"list-profiles", no_argument, nullptr, ListProfiles},
      ::option{"delete-profile", required_argument, nullptr, DeleteProfile},
      ::option{"profiles-dir", required_argument, nullptr, ProfilesDir},
      ::option{"write-config", required_argument, nullptr, WriteConfig},
      ::option{"name", required_argument, nullptr, Name},
      ::option{"position", required_argument, nullptr, Position},
      ::option{"address", required_argument, nullptr, Address},
      ::option{"phone", required_argument, nullptr, Phone},
      ::option{"mobile", required_argument, nullptr, Mobile},
      ::option{"email", required_argument, nullptr, Email},
      ::option{"website", required_argument, nullptr, Website},
      ::option{"verbose", no_argument, nullptr, 'v'},
      ::option{"help", no_argument, nullptr, 'h'},
      ::option{}};
  const char* short_options = ":c:o:l:p:vh";

  // getopt keeps global state; start over for every parse.
  ::optind = 0;
  ::opterr = 0;
  int option_index = 0;
  int parsed = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  while (parsed != -1) {
    switch (parsed) {
    case 'c':
      result.configPath = ::optarg;
      break;
    case 'o':
      result.outputPath = ::optarg;
      break;
    case 'l':
      result.logo = ::optarg;
      break;
    case NoLogo:
      result.noLogo = true;
      break;
    case 'p':
      result.profile = ::optarg;
      break;
    case SaveProfile:
      result.saveProfile = ::optarg;
      break;
    case ListProfiles:
      result.command = Command::ListProfiles;
      break;
    case DeleteProfile:
      result.command = Command::DeleteProfile;
      result.deleteProfile = ::optarg;
      break;
    case ProfilesDir:
      result.profilesDirectory = ::optarg;
      break;
    case WriteConfig:
      result.command = Command::WriteConfig;
      result.writeConfigPath = ::optarg;
      break;
    case Name:
      result.name = ::optarg;
      break;
    case Position:
      result.position = ::optarg;
      break;
    case Address:
      result.address = ::optarg;
      break;
    case Phone:
      result.phone = ::optarg;
      break;
    case Mobile:
      result.mobile = ::optarg;
      break;
    case Email:
      result.email = ::optarg;
      break;
    case Website:
      result.website = ::optarg;
      break;
    case 'v':
      result.verbose = true;
      break;
    case 'h':
      result.command = Command::Help;
      break;
    case ':':
      throw UsageError(std::string("option '") + argv[::optind - 1] + "' requires an argument");
    default:
      throw UsageError(std::string("unknown option '") + argv[::optind - 1] + "'");
    }
    parsed = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  }

  if (::optind < argc) {
    throw UsageError(std::string("unexpected argument '") + argv[::optind] + "'");
  }
  if (result.logo && result.noLogo) {
    throw UsageError("--logo and --no-logo cannot be combined");
  }
  return result;
}

auto resolve_config_path(ProgramOptions const& options, std::filesystem::path const& baseDirectory)
    -> std::optional<std::filesystem::path> {
  if (options.configPath) {
    return options.configPath;
  }
  std::filesystem::path fallback = baseDirectory / "config" / "signet.yaml";
  std::error_code ec;
  if (std::filesystem::is_regular_file(fallback, ec)) {
    return fallback;
  }
  return std::nullopt;
}

auto apply_field_options(ProgramOptions const& options, SignatureFields fields)
    -> SignatureFields {
  for (FieldPrompt const& prompt : field_prompts()) {
    if (auto const& value = options.*prompt.option) {
      fields.*prompt.member = *value;
    }
  }
  if (options.noLogo) {
    fields.logo_path.clear();
  } else if (options.logo) {
    fields.logo_path = *options.logo;
  }
  return fields;
}

auto has_required_fields(SignatureFields const& fields) -> bool {
  for (FieldPrompt const& prompt : field_prompts()) {
    if (prompt.required && trim(fields.*prompt.member).empty()) {
      return false;
    }
  }
  return true;
}

auto prompt_missing_fields(ProgramOptions const& options, SignatureFields fields,
                           std::istream& in, std::ostream& out) -> SignatureFields {
  for (FieldPrompt const& prompt : field_prompts()) {
    std::string& value = fields.*prompt.member;
    if (!trim(value).empty() || (!prompt.required && (options.*prompt.option).has_value())) {
      continue;
    }
    while (true) {
      out << prompt.label << (prompt.required ? "" : " (optional)") << ": " << std::flush;
      std::string answer;
      if (!std::getline(in, answer)) {
        throw ValidationError(field_name(prompt.label), "input ended before a value was entered");
      }
      if (!prompt.required && trim(answer).empty()) {
        value.clear();
        break;
      }
      try {
        prompt.validate(answer);
      } catch (ValidationError const& error) {
        out << error.what() << "\n";
        continue;
      }
      value = std::string(trim(answer));
      break;
    }
  }
  return fields;
}

} // namespace sig
