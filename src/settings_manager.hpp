#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Every option the audit understands. Non-persistent keys are never written
// to the settings file.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","directory"},   {"aliases", nlohmann::json::array()}, {"type","string"}, {"default",""},        {"description","Directory containing files to check"}, {"persistent", false}},
  {{"key","algorithm"},   {"aliases", {"a"}},                   {"type","string"}, {"default","sha512"},  {"description","Checksum algorithm: md5, sha1, sha224, sha256, sha384, sha512"}, {"persistent", true}},
  {{"key","backend"},     {"aliases", {"b"}},                   {"type","string"}, {"default","auto"},    {"description","Checksum backend: auto, native (<algorithm>sum), openssl"}, {"persistent", true}},
  {{"key","recursive"},   {"aliases", {"r"}},                   {"type","bool"},   {"default",false},     {"description","Check files in all subdirectories"}, {"persistent", true}},
  {{"key","max_depth"},   {"aliases", {"m"}},                   {"type","int"},    {"default",-1},        {"description","Max number of subdirectory levels to check, implies recursive (-1 = unbounded)"}, {"persistent", true}},
  {{"key","hidden"},      {"aliases", {"d"}},                   {"type","bool"},   {"default",false},     {"description","Check hidden files and files in hidden directories"}, {"persistent", true}},
  {{"key","threads"},     {"aliases", {"t"}},                   {"type","int"},    {"default",1},         {"description","Number of worker threads"}, {"persistent", true}},
  {{"key","log"},         {"aliases", {"l"}},                   {"type","string"}, {"default","syslog"},  {"description","Log destination: syslog, console or a file path"}, {"persistent", true}},
  {{"key","log_level"},   {"aliases", {"o"}},                   {"type","string"}, {"default","info"},    {"description","Minimum level to log: debug, info, warning, error, critical"}, {"persistent", true}},
  {{"key","include"},     {"aliases", {"i"}},                   {"type","list"},   {"default",nlohmann::json::array()}, {"description","Only audit paths matching these rsync-style patterns"}, {"persistent", true}},
  {{"key","exclude"},     {"aliases", {"e"}},                   {"type","list"},   {"default",nlohmann::json::array()}, {"description","Skip paths matching these rsync-style patterns"}, {"persistent", true}},
  {{"key","read_only"},   {"aliases", {"ro"}},                  {"type","bool"},   {"default",false},     {"description","Compare only; never create or rewrite checksum files"}, {"persistent", true}},
  {{"key","config"},      {"aliases", {"c"}},                   {"type","string"}, {"default",""},        {"description","Settings file to load"}, {"persistent", false}},
  {{"key","help"},        {"aliases", {"h","?"}},               {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},        {"aliases", {"persist"}},             {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, String, List };

struct SettingDefinition {
  std::string key;
  std::vector<std::string> aliases;
  SettingType type = SettingType::String;
  nlohmann::json default_value;
  std::string description;
  bool persistent = true;
};

namespace settings_text {

inline std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string trim(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

// true|false, on|off, yes|no, 1|0
inline std::optional<bool> parse_bool(const std::string& text) {
  const auto v = to_lower(trim(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

inline SettingType parse_type(const std::string& name) {
  if(name == "bool") return SettingType::Bool;
  if(name == "int") return SettingType::Int;
  if(name == "string") return SettingType::String;
  if(name == "list") return SettingType::List;
  throw std::invalid_argument("unknown setting type '" + name + "'");
}

} // namespace settings_text

class SettingsManager {
public:
  SettingsManager() : SettingsManager(SETTINGS_SPECIFICATION) {}
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) {
      throw std::out_of_range("Unknown setting: " + key);
    }
    return values_.at(key).get<T>();
  }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  bool help_requested() const { return get<bool>("help"); }
  bool save_requested() const { return get<bool>("save"); }

  const std::vector<SettingDefinition>& definitions() const { return definitions_; }
  const SettingDefinition* lookup(const std::string& token) const;
  std::vector<std::string> keys() const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const { return is_type(key, SettingType::Bool); }
  bool is_list_setting(const std::string& key) const { return is_type(key, SettingType::List); }
  std::string value_as_string(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { settings_path_override_ = path; }

  nlohmann::json get_json(bool persistent_only = true) const;

private:
  bool is_type(const std::string& key, SettingType type) const {
    const auto* def = lookup(key);
    return def && def->type == type;
  }
  bool store(const SettingDefinition& def, const nlohmann::json& value, std::string& error);

  std::vector<SettingDefinition> definitions_;
  std::map<std::string, std::size_t> index_;  // lowercase key or alias -> definition
  nlohmann::json values_;
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : values_(nlohmann::json::object()) {
  for(const auto& entry : specification) {
    SettingDefinition def;
    def.key = entry.at("key").get<std::string>();
    def.type = settings_text::parse_type(entry.at("type").get<std::string>());
    def.default_value = entry.at("default");
    def.description = entry.value("description", "");
    def.persistent = entry.value("persistent", true);
    if(entry.contains("aliases")) {
      def.aliases = entry.at("aliases").get<std::vector<std::string>>();
    }

    const auto slot = definitions_.size();
    index_[settings_text::to_lower(def.key)] = slot;
    for(const auto& alias : def.aliases) {
      index_.emplace(settings_text::to_lower(alias), slot);
    }
    values_[def.key] = def.default_value;
    definitions_.push_back(std::move(def));
  }
}

inline const SettingDefinition* SettingsManager::lookup(const std::string& token) const {
  auto it = index_.find(settings_text::to_lower(token));
  return it == index_.end() ? nullptr : &definitions_[it->second];
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* def = lookup(token)) return def->key;
  return std::nullopt;
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(definitions_.size());
  for(const auto& def : definitions_) out.push_back(def.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!values_.contains(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline bool SettingsManager::store(const SettingDefinition& def, const nlohmann::json& value, std::string& error) {
  auto& slot = values_[def.key];
  switch(def.type) {
    case SettingType::Bool:
      if(value.is_boolean()) { slot = value.get<bool>(); return true; }
      if(value.is_number_integer()) { slot = value.get<int>() != 0; return true; }
      error = "expected boolean";
      return false;
    case SettingType::Int:
      if(value.is_number_integer()) { slot = value.get<int>(); return true; }
      error = "expected integer";
      return false;
    case SettingType::String:
      if(value.is_string()) { slot = value.get<std::string>(); return true; }
      error = "expected string";
      return false;
    case SettingType::List:
      // a single string appends, so repeated command line values accumulate
      if(value.is_string()) {
        if(!slot.is_array()) slot = nlohmann::json::array();
        slot.push_back(value.get<std::string>());
        return true;
      }
      if(value.is_array() && std::all_of(value.begin(), value.end(),
                                         [](const nlohmann::json& item){ return item.is_string(); })) {
        slot = value;
        return true;
      }
      error = "expected string or list of strings";
      return false;
  }
  error = "unsupported type";
  return false;
}

inline bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* def = lookup(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  const auto clean = settings_text::trim(value);
  switch(def->type) {
    case SettingType::Bool: {
      auto flag = settings_text::parse_bool(clean);
      if(!flag) {
        error = "expected boolean (true|false|on|off|yes|no)";
        return false;
      }
      return store(*def, *flag, error);
    }
    case SettingType::Int: {
      std::size_t used = 0;
      int number = 0;
      try {
        number = std::stoi(clean, &used);
      } catch(const std::exception&) {
        used = 0;
      }
      if(used == 0 || used != clean.size()) {
        error = "expected integer, got '" + clean + "'";
        return false;
      }
      return store(*def, number, error);
    }
    case SettingType::String:
    case SettingType::List:
      return store(*def, clean, error);
  }
  error = "unsupported type";
  return false;
}

inline bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* def = lookup(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  return store(*def, value, error);
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  const char* home = std::getenv("HOME");
  std::filesystem::path base = (home && *home) ? std::filesystem::path(home) : std::filesystem::current_path();
  return base / ".config" / "integrity_audit" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

// Unknown keys are ignored and ill-typed values keep their previous value.
inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Settings file {} does not hold an object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* def = lookup(item.key());
    if(!def) continue;
    std::string error;
    if(!store(*def, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << '\n';
  return static_cast<bool>(out);
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& def : definitions_) {
    if(persistent_only && !def.persistent) continue;
    doc[def.key] = values_.at(def.key);
  }
  return doc;
}
