#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// key, aliases, type (int|bool|string), default, description, persistent,
// optional inclusive min/max for ints.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","share_dir"},            {"aliases", {"dir","sd"}},        {"type","string"}, {"default","share"},           {"description","Shared directory, relative to the workspace"}, {"persistent", true}},
  {{"key","listen_ip"},            {"aliases", {"li"}},              {"type","string"}, {"default","0.0.0.0"},         {"description","Interface/IP to bind the transfer port"}, {"persistent", true}},
  {{"key","listen_port"},          {"aliases", {"lp","port"}},       {"type","int"},    {"default",5005},              {"description","TCP port for catalog and file requests (0 = any)"}, {"persistent", true}, {"min",0}, {"max",65535}},
  {{"key","multicast_group"},      {"aliases", {"mg","group"}},      {"type","string"}, {"default","239.255.255.250"}, {"description","Multicast group used for discovery"}, {"persistent", true}},
  {{"key","multicast_port"},       {"aliases", {"mp"}},              {"type","int"},    {"default",5007},              {"description","Multicast port used for discovery"}, {"persistent", true}, {"min",1}, {"max",65535}},
  {{"key","multicast_ttl"},        {"aliases", {"ttl"}},             {"type","int"},    {"default",2},                 {"description","Hop limit for announcements"}, {"persistent", true}, {"min",1}, {"max",255}},
  {{"key","multicast_loopback"},   {"aliases", {"loopback"}},        {"type","bool"},   {"default",true},              {"description","Deliver announcements to nodes on this host"}, {"persistent", true}},
  {{"key","announce_interval_ms"}, {"aliases", {"announce","ai"}},   {"type","int"},    {"default",5000},              {"description","Milliseconds between announcements and expiry sweeps"}, {"persistent", true}, {"min",50}},
  {{"key","expiry_window_ms"},     {"aliases", {"expiry"}},          {"type","int"},    {"default",0},                 {"description","Silence before a peer is not-alive (0 = 3x announce interval)"}, {"persistent", true}, {"min",0}},
  {{"key","removal_window_ms"},    {"aliases", {"removal"}},         {"type","int"},    {"default",60000},             {"description","Time a not-alive peer is kept before removal"}, {"persistent", true}, {"min",0}},
  {{"key","sync_interval_ms"},     {"aliases", {"interval","si"}},   {"type","int"},    {"default",30000},             {"description","Cooldown between sync cycles"}, {"persistent", true}, {"min",10}},
  {{"key","chunk_size"},           {"aliases", {"cs"}},              {"type","int"},    {"default",65536},             {"description","Bytes per transfer chunk"}, {"persistent", true}, {"min",1024}, {"max",16777216}},
  {{"key","io_timeout_ms"},        {"aliases", {"timeout"}},         {"type","int"},    {"default",5000},              {"description","Timeout for every network connect/read/write"}, {"persistent", true}, {"min",10}},
  {{"key","catalog_cache_ms"},     {"aliases", {"cache"}},           {"type","int"},    {"default",5000},              {"description","Reuse the served catalog for this long (0 = always rescan)"}, {"persistent", true}, {"min",0}},
  {{"key","transfer_log_size"},    {"aliases", {"tls"}},             {"type","int"},    {"default",256},               {"description","Number of transfer outcomes retained"}, {"persistent", true}, {"min",1}},
  {{"key","verbose"},              {"aliases", {"v"}},               {"type","bool"},   {"default",false},             {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},             {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},         {"type","bool"},   {"default",false},             {"description","Persist current settings to disk"}, {"persistent", false}}
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

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;
  const nlohmann::json& specification() const { return specification_; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
    std::optional<long long> min;
    std::optional<long long> max;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    if(spec.type != "int" && spec.type != "bool" && spec.type != "string") {
      throw std::invalid_argument("setting '" + spec.key + "' has unsupported type '" + spec.type + "'");
    }
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    if(entry.contains("max")) spec.max = entry.at("max").get<long long>();
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specification_(specification),
    setting_specs_(build_setting_specs(specification)) {
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
    if(lowered == to_lower(spec.key)) return &spec;
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

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) {
    return settings_path_override_;
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err("Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err("Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) {
      print_err("Ignoring unknown setting '{}'", item.key());
      continue;
    }
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err("Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
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
      settings_[spec.key] = (value.get<long long>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    auto number = value.get<long long>();
    if(spec.min && number < *spec.min) {
      error = "must be >= " + std::to_string(*spec.min);
      return false;
    }
    if(spec.max && number > *spec.max) {
      error = "must be <= " + std::to_string(*spec.max);
      return false;
    }
    if(number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
      error = "out of range";
      return false;
    }
    settings_[spec.key] = static_cast<int>(number);
    return true;
  }
  if(value.is_string()) {
    settings_[spec.key] = value.get<std::string>();
    return true;
  }
  error = "expected string";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                          const std::string& value,
                                                          std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      long long number = std::stoll(clean, &consumed);
      if(consumed != clean.size()) {
        error = "trailing characters in integer";
        return {};
      }
      return number;
    } catch(const std::exception& e) {
      error = std::string("not an integer (") + e.what() + ")";
      return {};
    }
  }
  return clean;
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
