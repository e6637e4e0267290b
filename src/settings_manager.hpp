#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Every option ftr understands. "commands" lists the subcommands an option is
// shown for in usage; options without it apply everywhere.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","name"},              {"aliases", {"n"}},             {"type","string"}, {"default",""},        {"description","Name advertised on the network (defaults to the host name)"}, {"commands", {"join"}}},
  {{"key","port"},              {"aliases", {"p"}},             {"type","int"},    {"default",8844},      {"description","TCP port the receiver listens on"}, {"commands", {"join"}}},
  {{"key","dropdir"},           {"aliases", {"d","drop_dir"}},  {"type","string"}, {"default",""},        {"description","Directory incoming files land in (defaults to ~/Downloads)"}, {"commands", {"join"}}},
  {{"key","key"},               {"aliases", {"k","psk"}},       {"type","string"}, {"default",""},        {"description","Pre-shared passkey (join generates one when empty)"}, {"commands", {"join","send"}}},
  {{"key","listen_ip"},         {"aliases", {"li"}},            {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP the receiver binds"}, {"commands", {"join"}}},
  {{"key","list_timeout_ms"},   {"aliases", {"lt"}},            {"type","int"},    {"default",3000},      {"description","How long list browses for peers"}, {"commands", {"list"}}},
  {{"key","lookup_timeout_ms"}, {"aliases", {"lkt"}},           {"type","int"},    {"default",1000},      {"description","How long send looks for the named peer"}, {"commands", {"send"}}},
  {{"key","verbose"},           {"aliases", {"v"}},             {"type","bool"},   {"default",false},     {"description","Enable debug logging"}},
  {{"key","config"},            {"aliases", {"c"}},             {"type","string"}, {"default",""},        {"description","JSON settings file (default ~/.config/ftr/settings.json)"}, {"file", false}},
  {{"key","help"},              {"aliases", {"h","?"}},         {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"file", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Merges a JSON object of settings; keys that may not come from a file are
  // skipped. Throws std::runtime_error when the file exists but cannot be read.
  bool load_from_file(const std::filesystem::path& path);

  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  nlohmann::json get_json() const;
  static std::filesystem::path default_settings_path();
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    bool from_file = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.from_file = entry.value("file", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::filesystem::path SettingsManager::default_settings_path() {
  if(const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "ftr" / "settings.json";
  }
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "ftr" / "settings.json";
  }
  return {};
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    throw std::runtime_error("Failed to parse " + path.string() + ": " + e.what());
  }
  if(!doc.is_object()) {
    throw std::runtime_error(path.string() + " must contain a JSON object");
  }
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      print_err(nullptr, "Ignoring unknown setting '{}' in {}", item.key(), path.string());
      continue;
    }
    if(!spec->from_file) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
      continue;
    }
  }
  return true;
}

inline nlohmann::json SettingsManager::get_json() const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(spec.key == "key") {
      // never echo the passkey
      doc[spec.key] = settings_.at(spec.key).get<std::string>().empty() ? "" : "<set>";
      continue;
    }
    doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                               const nlohmann::json& value,
                                               std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  if(spec.type == "bool") {
    std::string v = to_lower(trim_copy(value));
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    std::string clean = trim_copy(value);
    try {
      std::size_t used = 0;
      int parsed = std::stoi(clean, &used);
      if(used != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    // names and paths keep their inner and outer spacing
    return value;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return convert_and_store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
