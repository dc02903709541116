// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "ProfileStore.hpp"
#include "AtomicFile.hpp"
#include "Logging.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <utility>

namespace sig {

namespace {

constexpr std::string_view ProfileExtension = ".json";

struct FieldSlot {
  const char* key;
  std::string SignatureFields::*member;
};

constexpr FieldSlot FieldSlots[] = {
    {"name", &SignatureFields::name},       {"position", &SignatureFields::position},
    {"address", &SignatureFields::address}, {"phone", &SignatureFields::phone},
    {"mobile", &SignatureFields::mobile},   {"email", &SignatureFields::email},
    {"website", &SignatureFields::website}, {"logo_path", &SignatureFields::logo_path},
};

auto read_optional_string(YAML::Node const& object, const char* key, std::string_view source)
    -> std::string {
  YAML::Node node = object[key];
  if (!node || node.IsNull()) {
    return {};
  }
  if (!node.IsScalar()) {
    throw ProfileError(source, std::string("'") + key + "' must be a string");
  }
  return node.Scalar();
}

// The emitter writes C0 controls and U+0080..U+00A0 as YAML "\xNN" escapes, which JSON does
// not have. Rewrites each of them to the equivalent "\u00NN".
auto json_escapes(std::string_view emitted) -> std::string {
  std::string json;
  json.reserve(emitted.size());
  for (std::size_t i = 0; i < emitted.size(); ++i) {
    const char c = emitted[i];
    if (c != '\\' || i + 1 == emitted.size()) {
      json += c;
      continue;
    }
    const char kind = emitted[++i];
    if (kind == 'x') {
      json += "\\u00";
    } else {
      json += c;
      json += kind;
    }
  }
  return json;
}

} // namespace

ProfileStore::ProfileStore(std::filesystem::path directory) : mDirectory(std::move(directory)) {}

auto ProfileStore::to_json(ProfileRecord const& record) -> std::string {
  YAML::Emitter out;
  out.SetMapFormat(YAML::Flow);
  out.SetStringFormat(YAML::DoubleQuoted);
  out << YAML::BeginMap;
  out << YAML::Key << "profile" << YAML::Value << record.profile;
  for (auto const& slot : FieldSlots) {
    out << YAML::Key << slot.key << YAML::Value << record.fields.*slot.member;
  }
  out << YAML::EndMap;
  if (!out.good()) {
    throw ProfileError(record.profile, out.GetLastError());
  }
  std::string text = json_escapes(out.c_str());
  text += '\n';
  return text;
}

auto ProfileStore::from_json(std::string_view json, std::string_view source) -> ProfileRecord {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(json));
  } catch (YAML::Exception const& e) {
    throw ProfileError(source, std::string("malformed profile: ") + e.what());
  }
  if (!root.IsMap()) {
    throw ProfileError(source, "malformed profile: expected a JSON object");
  }

  ProfileRecord record;
  record.profile = read_optional_string(root, "profile", source);
  if (record.profile.empty()) {
    record.profile = std::string(source);
  }
  for (auto const& slot : FieldSlots) {
    record.fields.*slot.member = read_optional_string(root, slot.key, source);
  }
  return record;
}

auto ProfileStore::path_for(std::string_view name) const -> std::filesystem::path {
  std::string fileName = validate_profile_name(name);
  fileName += ProfileExtension;
  return mDirectory / fileName;
}

auto ProfileStore::missing_profile(std::string const& name) const -> ProfileError {
  std::vector<std::string> available = list();
  std::string reason = "no such profile";
  if (available.empty()) {
    reason += "; no profiles are saved";
  } else {
    reason += "; available:";
    for (auto const& entry : available) {
      reason += ' ';
      reason += entry;
    }
  }
  return ProfileError(name, reason);
}

auto ProfileStore::save(ProfileRecord const& record) const -> void {
  const std::filesystem::path path = path_for(record.profile);
  write_file_atomically(path, to_json(record));
  Log::i("Saved profile '{}' to {}", record.profile, path.string());
}

auto ProfileStore::load(std::string_view name) const -> ProfileRecord {
  const std::string profileName = validate_profile_name(name);
  const std::filesystem::path path = path_for(profileName);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw missing_profile(profileName);
  }
  ProfileRecord record = from_json(read_full_file(path), profileName);
  if (record.profile != profileName) {
    Log::w("Profile file {} names itself '{}'", path.string(), record.profile);
    record.profile = profileName;
  }
  Log::d("Loaded profile '{}'", profileName);
  return record;
}

auto ProfileStore::list() const -> std::vector<std::string> {
  std::vector<std::string> names;
  std::error_code ec;
  if (!std::filesystem::is_directory(mDirectory, ec)) {
    return names;
  }
  for (auto const& entry : std::filesystem::directory_iterator(mDirectory, ec)) {
    const std::filesystem::path& path = entry.path();
    std::error_code typeError;
    if (!entry.is_regular_file(typeError) ||
        path.extension() != std::filesystem::path(ProfileExtension)) {
      continue;
    }
    names.push_back(path.stem().string());
  }
  if (ec) {
    throw FileSystemError("list", mDirectory, ec.message());
  }
  std::sort(names.begin(), names.end());
  return names;
}

auto ProfileStore::exists(std::string_view name) const -> bool {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for(name), ec);
}

auto ProfileStore::remove(std::string_view name) const -> void {
  const std::string profileName = validate_profile_name(name);
  std::error_code ec;
  if (!std::filesystem::remove(path_for(profileName), ec)) {
    if (ec) {
      throw FileSystemError("remove", path_for(profileName), ec.message());
    }
    throw missing_profile(profileName);
  }
  Log::i("Deleted profile '{}'", profileName);
}

} // namespace sig
