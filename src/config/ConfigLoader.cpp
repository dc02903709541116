// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "ConfigLoader.hpp"
#include "AtomicFile.hpp"
#include "Errors.hpp"
#include "Logging.hpp"

#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <utility>
#include <vector>

namespace sig {

namespace {

auto join_key(std::string_view parent, std::string_view child) -> std::string {
  std::string key(parent);
  key += '.';
  key += child;
  return key;
}

auto read_int(YAML::Node const& node, std::string_view key) -> int {
  if (!node.IsScalar()) {
    throw ConfigError(key, "expected an integer");
  }
  try {
    return node.as<int>();
  } catch (YAML::BadConversion const&) {
    throw ConfigError(key, "expected an integer, got '" + node.Scalar() + "'");
  }
}

auto read_string(YAML::Node const& node, std::string_view key) -> std::string {
  if (!node.IsScalar()) {
    throw ConfigError(key, "expected a string");
  }
  return node.Scalar();
}

auto read_string_list(YAML::Node const& node, std::string_view key) -> std::vector<std::string> {
  if (!node.IsSequence()) {
    throw ConfigError(key, "expected a list of strings");
  }
  std::vector<std::string> result;
  for (std::size_t i = 0; i < node.size(); ++i) {
    result.push_back(read_string(node[i], std::string(key) + "[" + std::to_string(i) + "]"));
  }
  return result;
}

auto make_color(std::vector<int> const& components, std::string_view key) -> Color {
  if (components.size() != 3 && components.size() != 4) {
    throw ConfigError(key, "a color needs 3 or 4 components, got " +
                               std::to_string(components.size()));
  }
  for (int component : components) {
    if (component < 0 || component > 255) {
      throw ConfigError(key, "color component " + std::to_string(component) +
                                 " is outside 0..255");
    }
  }
  auto channel = [&](std::size_t i) { return static_cast<std::uint8_t>(components[i]); };
  return Color{channel(0), channel(1), channel(2),
               components.size() == 4 ? channel(3) : std::uint8_t{255}};
}

auto read_color(YAML::Node const& node, std::string_view key) -> Color {
  if (!node.IsSequence()) {
    throw ConfigError(key, "expected a list like [r, g, b] or [r, g, b, a]");
  }
  std::vector<int> components;
  for (std::size_t i = 0; i < node.size(); ++i) {
    components.push_back(read_int(node[i], key));
  }
  return make_color(components, key);
}

// "r,g,b" or "r,g,b,a"
auto parse_color_text(std::string_view text, std::string_view key) -> Color {
  std::vector<int> components;
  while (!text.empty()) {
    std::size_t comma = text.find(',');
    std::string_view part = text.substr(0, comma);
    while (!part.empty() && part.front() == ' ') {
      part.remove_prefix(1);
    }
    while (!part.empty() && part.back() == ' ') {
      part.remove_suffix(1);
    }
    int value = 0;
    auto [end, error] = std::from_chars(part.data(), part.data() + part.size(), value);
    if (part.empty() || error != std::errc{} || end != part.data() + part.size()) {
      throw ConfigError(key, "expected comma separated integers, got '" + std::string(part) + "'");
    }
    components.push_back(value);
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return make_color(components, key);
}

auto parse_int_text(std::string_view text, std::string_view key) -> int {
  int value = 0;
  auto [end, error] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (text.empty() || error != std::errc{} || end != text.data() + text.size()) {
    throw ConfigError(key, "expected an integer, got '" + std::string(text) + "'");
  }
  return value;
}

auto color_slot(ColorScheme& colors, std::string_view role) -> Color* {
  if (role == "outline") {
    return &colors.outline;
  }
  if (role == "name") {
    return &colors.name;
  }
  if (role == "details") {
    return &colors.details;
  }
  if (role == "separator") {
    return &colors.separator;
  }
  if (role == "confidentiality") {
    return &colors.confidentiality;
  }
  return nullptr;
}

void read_dimensions(YAML::Node const& node, SignatureConfig& config) {
  const std::pair<const char*, int*> fields[] = {
      {"logo_height", &config.logo_height},
      {"margin", &config.margin},
      {"logo_margin_right", &config.logo_margin_right},
      {"line_height", &config.line_height},
      {"separator_thickness", &config.separator_thickness},
  };
  for (auto [name, target] : fields) {
    if (node[name]) {
      *target = read_int(node[name], join_key("signature.dimensions", name));
    }
  }
}

void read_outline(YAML::Node const& node, SignatureConfig& config) {
  if (node["name_width"]) {
    config.outline_width_name = read_int(node["name_width"], "signature.outline.name_width");
  }
  if (node["text_width"]) {
    config.outline_width_text = read_int(node["text_width"], "signature.outline.text_width");
  }
}

void read_colors(YAML::Node const& node, SignatureConfig& config) {
  for (auto const& entry : node) {
    const std::string role = entry.first.as<std::string>();
    const std::string key = join_key("signature.colors", role);
    Color* slot = color_slot(config.colors, role);
    if (!slot) {
      throw ConfigError(key, "unknown color role");
    }
    *slot = read_color(entry.second, key);
  }
}

void read_font_sizes(YAML::Node const& node, SignatureConfig& config) {
  const std::pair<const char*, int*> fields[] = {
      {"name", &config.font_sizes.name},
      {"details", &config.font_sizes.details},
      {"confidentiality", &config.font_sizes.confidentiality},
  };
  for (auto [name, target] : fields) {
    if (node[name]) {
      *target = read_int(node[name], join_key("signature.font_sizes", name));
    }
  }
}

// A flat list keeps the historical meaning: the first entry is the bold face used for the
// name, the remaining entries serve the other roles.
auto read_platform_fonts(YAML::Node const& node, std::string const& key) -> RoleFontPaths {
  RoleFontPaths paths;
  if (node.IsSequence()) {
    std::vector<std::string> list = read_string_list(node, key);
    if (list.empty()) {
      throw ConfigError(key, "font list is empty");
    }
    paths.name = {list.front()};
    paths.details.assign(list.size() > 1 ? list.begin() + 1 : list.begin(), list.end());
    paths.confidentiality = paths.details;
    return paths;
  }
  if (!node.IsMap()) {
    throw ConfigError(key, "expected a list of font files or a map of role to font files");
  }
  for (auto const& entry : node) {
    const std::string role = entry.first.as<std::string>();
    const std::string roleKey = join_key(key, role);
    if (role == "name") {
      paths.name = read_string_list(entry.second, roleKey);
    } else if (role == "details") {
      paths.details = read_string_list(entry.second, roleKey);
    } else if (role == "confidentiality") {
      paths.confidentiality = read_string_list(entry.second, roleKey);
    } else {
      throw ConfigError(roleKey, "unknown text role");
    }
  }
  if (paths.confidentiality.empty()) {
    paths.confidentiality = paths.details;
  }
  return paths;
}

void read_fonts(YAML::Node const& node, SignatureConfig& config) {
  for (auto const& entry : node) {
    const std::string platform = entry.first.as<std::string>();
    config.fonts[platform] = read_platform_fonts(entry.second, join_key("signature.fonts", platform));
  }
}

void read_text(YAML::Node const& node, SignatureConfig& config) {
  const std::pair<const char*, std::string*> fields[] = {
      {"confidentiality", &config.confidentiality_text},
      {"default_website", &config.default_website},
      {"phone_prefix", &config.phone_prefix},
      {"mobile_prefix", &config.mobile_prefix},
  };
  for (auto [name, target] : fields) {
    if (node[name]) {
      *target = read_string(node[name], join_key("signature.text", name));
    }
  }
}

void require_map(YAML::Node const& node, std::string_view key) {
  if (!node.IsMap()) {
    throw ConfigError(key, "expected a mapping");
  }
}

void emit_color(YAML::Emitter& out, const char* name, Color color) {
  out << YAML::Key << name << YAML::Value << YAML::Flow << YAML::BeginSeq
      << static_cast<int>(color.r) << static_cast<int>(color.g) << static_cast<int>(color.b);
  if (color.a != 255) {
    out << static_cast<int>(color.a);
  }
  out << YAML::EndSeq;
}

} // namespace

auto process_environment() -> EnvironmentLookup {
  return [](const char* name) -> const char* { return std::getenv(name); };
}

auto ConfigLoader::load(std::optional<std::filesystem::path> const& path,
                        EnvironmentLookup const& env) -> SignatureConfig {
  SignatureConfig config;
  if (path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*path, ec)) {
      throw ConfigError(path->string(), "configuration file does not exist");
    }
    std::string document;
    try {
      document = read_full_file(*path);
    } catch (FileSystemError const& error) {
      throw ConfigError(path->string(), error.reason());
    }
    config = parse(document, std::move(config), path->string());
    Log::i("Configuration loaded from {}", path->string());
  } else {
    Log::i("Using built-in default configuration");
  }
  return apply_environment(std::move(config), env);
}

auto ConfigLoader::parse(std::string_view document, SignatureConfig base, std::string_view source)
    -> SignatureConfig {
  YAML::Node root;
  try {
    root = YAML::Load(std::string(document));
  } catch (YAML::Exception const& e) {
    throw ConfigError(source, std::string("YAML parse error: ") + e.what());
  }

  if (!root || root.IsNull()) {
    return base;
  }
  require_map(root, "<root>");

  YAML::Node signature = root["signature"];
  if (!signature || signature.IsNull()) {
    return base;
  }
  require_map(signature, "signature");

  SignatureConfig config = std::move(base);
  try {
    for (auto const& entry : signature) {
      const std::string section = entry.first.as<std::string>();
      const YAML::Node& value = entry.second;
      const std::string key = join_key("signature", section);
      if (section == "dimensions") {
        require_map(value, key);
        read_dimensions(value, config);
      } else if (section == "outline") {
        require_map(value, key);
        read_outline(value, config);
      } else if (section == "colors") {
        require_map(value, key);
        read_colors(value, config);
      } else if (section == "font_sizes") {
        require_map(value, key);
        read_font_sizes(value, config);
      } else if (section == "fonts") {
        require_map(value, key);
        read_fonts(value, config);
      } else if (section == "fallback_font_family") {
        config.fallback_font_family = read_string(value, key);
      } else if (section == "logo") {
        require_map(value, key);
        if (value["search_paths"]) {
          config.logo_search_paths = read_string_list(value["search_paths"], key + ".search_paths");
        }
      } else if (section == "text") {
        require_map(value, key);
        read_text(value, config);
      } else {
        Log::w("Ignoring unknown configuration section '{}' in {}", key, std::string(source));
      }
    }
  } catch (YAML::Exception const& e) {
    throw ConfigError(source, e.what());
  }

  config.validate();
  return config;
}

auto ConfigLoader::apply_environment(SignatureConfig config, EnvironmentLookup const& env)
    -> SignatureConfig {
  const std::pair<const char*, int*> integers[] = {
      {"SIGNET_LOGO_HEIGHT", &config.logo_height},
      {"SIGNET_MARGIN", &config.margin},
      {"SIGNET_LOGO_MARGIN_RIGHT", &config.logo_margin_right},
      {"SIGNET_LINE_HEIGHT", &config.line_height},
      {"SIGNET_SEPARATOR_THICKNESS", &config.separator_thickness},
  };
  for (auto [name, target] : integers) {
    if (const char* value = env(name)) {
      *target = parse_int_text(value, name);
      Log::d("Override {}={}", name, *target);
    }
  }

  const std::pair<const char*, std::string*> strings[] = {
      {"SIGNET_DEFAULT_WEBSITE", &config.default_website},
      {"SIGNET_CONFIDENTIALITY_TEXT", &config.confidentiality_text},
      {"SIGNET_FALLBACK_FONT", &config.fallback_font_family},
  };
  for (auto [name, target] : strings) {
    if (const char* value = env(name)) {
      *target = value;
      Log::d("Override {}", name);
    }
  }

  const std::pair<const char*, const char*> colorRoles[] = {
      {"SIGNET_COLOR_OUTLINE", "outline"},
      {"SIGNET_COLOR_NAME", "name"},
      {"SIGNET_COLOR_DETAILS", "details"},
      {"SIGNET_COLOR_SEPARATOR", "separator"},
      {"SIGNET_COLOR_CONFIDENTIALITY", "confidentiality"},
  };
  for (auto [name, role] : colorRoles) {
    if (const char* value = env(name)) {
      *color_slot(config.colors, role) = parse_color_text(value, name);
      Log::d("Override {}", name);
    }
  }

  config.validate();
  return config;
}

auto ConfigLoader::to_yaml(SignatureConfig const& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap << YAML::Key << "signature" << YAML::Value << YAML::BeginMap;

  out << YAML::Key << "dimensions" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "logo_height" << YAML::Value << config.logo_height;
  out << YAML::Key << "margin" << YAML::Value << config.margin;
  out << YAML::Key << "logo_margin_right" << YAML::Value << config.logo_margin_right;
  out << YAML::Key << "line_height" << YAML::Value << config.line_height;
  out << YAML::Key << "separator_thickness" << YAML::Value << config.separator_thickness;
  out << YAML::EndMap;

  out << YAML::Key << "outline" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name_width" << YAML::Value << config.outline_width_name;
  out << YAML::Key << "text_width" << YAML::Value << config.outline_width_text;
  out << YAML::EndMap;

  out << YAML::Key << "colors" << YAML::Value << YAML::BeginMap;
  emit_color(out, "outline", config.colors.outline);
  emit_color(out, "name", config.colors.name);
  emit_color(out, "details", config.colors.details);
  emit_color(out, "separator", config.colors.separator);
  emit_color(out, "confidentiality", config.colors.confidentiality);
  out << YAML::EndMap;

  out << YAML::Key << "font_sizes" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << config.font_sizes.name;
  out << YAML::Key << "details" << YAML::Value << config.font_sizes.details;
  out << YAML::Key << "confidentiality" << YAML::Value << config.font_sizes.confidentiality;
  out << YAML::EndMap;

  out << YAML::Key << "fonts" << YAML::Value << YAML::BeginMap;
  for (auto const& [platform, paths] : config.fonts) {
    out << YAML::Key << platform << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << paths.name;
    out << YAML::Key << "details" << YAML::Value << paths.details;
    out << YAML::Key << "confidentiality" << YAML::Value << paths.confidentiality;
    out << YAML::EndMap;
  }
  out << YAML::EndMap;

  out << YAML::Key << "fallback_font_family" << YAML::Value << config.fallback_font_family;

  out << YAML::Key << "logo" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "search_paths" << YAML::Value << config.logo_search_paths;
  out << YAML::EndMap;

  out << YAML::Key << "text" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "confidentiality" << YAML::Value << config.confidentiality_text;
  out << YAML::Key << "default_website" << YAML::Value << config.default_website;
  out << YAML::Key << "phone_prefix" << YAML::Value << YAML::DoubleQuoted << config.phone_prefix;
  out << YAML::Key << "mobile_prefix" << YAML::Value << YAML::DoubleQuoted << config.mobile_prefix;
  out << YAML::EndMap;

  out << YAML::EndMap << YAML::EndMap;
  if (!out.good()) {
    throw ConfigError("<emit>", out.GetLastError());
  }
  std::string text = out.c_str();
  text += '\n';
  return text;
}

auto ConfigLoader::save(SignatureConfig const& config, std::filesystem::path const& path) -> void {
  config.validate();
  write_file_atomically(path, to_yaml(config));
  Log::i("Configuration written to {}", path.string());
}

} // namespace sig
