#pragma once

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

inline const char* const kDefaultPeers =
  "CR-HOLLAND|NEW,CR-ARUTHA|NEW,ARUTHA-BATCH|1080p,ARUTHA-BATCH|720p,ARUTHA-BATCH|SD";

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","anime"},             {"aliases", nlohmann::json::array()}, {"type","string"}, {"default",""},  {"description","Title to search for"}, {"persistent", false}},
  {{"key","episodes"},          {"aliases", {"e"}},              {"type","string"}, {"default",""},        {"description","Episodes to keep, e.g. 1,3,5-7"}, {"persistent", false}},
  {{"key","resolution"},        {"aliases", {"r","res"}},        {"type","string"}, {"default",""},        {"description","Resolution filter"}, {"choices", {"", "480p", "540p", "720p", "1080p", "SD"}}, {"persistent", false}},
  {{"key","group"},             {"aliases", {"g"}},              {"type","string"}, {"default",""},        {"description","Release group filter"}, {"persistent", false}},
  {{"key","bot"},               {"aliases", {"b"}},              {"type","string"}, {"default",""},        {"description","Only query this bot"}, {"persistent", false}},
  {{"key","cutoff"},            {"aliases", {"c"}},              {"type","float"},  {"default",0.6},       {"description","Title similarity cutoff in [0,1]"}, {"persistent", true}},
  {{"key","download"},          {"aliases", {"d"}},              {"type","bool"},   {"default",false},     {"description","Download every listed entry"}, {"persistent", false}},
  {{"key","verbose"},           {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","server"},            {"aliases", {"host"}},           {"type","string"}, {"default","irc.rizon.net"}, {"description","IRC server"}, {"persistent", true}},
  {{"key","port"},              {"aliases", {"p"}},              {"type","int"},    {"default",6670},      {"description","IRC server port"}, {"persistent", true}},
  {{"key","channel"},           {"aliases", {"chan"}},           {"type","string"}, {"default","#subsplease"}, {"description","Channel joined before requesting packs"}, {"persistent", true}},
  {{"key","nickname"},          {"aliases", {"nick"}},           {"type","string"}, {"default",""},        {"description","IRC nickname (random when empty)"}, {"persistent", true}},
  {{"key","peers"},             {"aliases", {"bots"}},           {"type","string"}, {"default",kDefaultPeers}, {"description","Comma separated list of bots"}, {"persistent", true}},
  {{"key","workers"},           {"aliases", {"w"}},              {"type","int"},    {"default",5},         {"description","Bots queried in parallel"}, {"persistent", true}},
  {{"key","cache_dir"},         {"aliases", {"cache"}},          {"type","string"}, {"default",""},        {"description","Listing cache directory (temp dir when empty)"}, {"persistent", true}},
  {{"key","download_dir"},      {"aliases", {"out","o"}},        {"type","string"}, {"default",""},        {"description","Download directory (working dir when empty)"}, {"persistent", true}},
  {{"key","connect_timeout"},   {"aliases", {"ct"}},             {"type","int"},    {"default",30},        {"description","Seconds to wait for the server welcome"}, {"persistent", true}},
  {{"key","request_timeout"},   {"aliases", {"rt"}},             {"type","int"},    {"default",60},        {"description","Seconds to wait for the client to become available"}, {"persistent", true}},
  {{"key","listing_timeout"},   {"aliases", {"lt"}},             {"type","int"},    {"default",0},         {"description","Seconds allowed for a pack listing (0 = unbounded)"}, {"persistent", true}},
  {{"key","transfer_progress"}, {"aliases", {"progress","tp"}}, {"type","bool"},   {"default",true},      {"description","Show ASCII progress meter during downloads"}, {"persistent", true}},
  {{"key","progress_meter_size"}, {"aliases", {"meter","pms"}}, {"type","int"},    {"default",40},        {"description","Number of characters used for the progress meter"}, {"persistent", true}},
  {{"key","help"},              {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},              {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  // Comma separated string setting, blanks dropped.
  std::vector<std::string> get_list(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static bool is_bool_literal(const std::string& value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::vector<std::string> choices;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

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
    spec.normalized_key = to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = to_lower(alias);
      }
    }
    if(entry.contains("choices")) {
      spec.choices = entry.at("choices").get<std::vector<std::string>>();
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.persistent = entry.value("persistent", true);
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

inline std::vector<std::string> SettingsManager::get_list(const std::string& key) const {
  std::vector<std::string> out;
  for(auto& item : split(get<std::string>(key), ',')) {
    item = trim_copy(item);
    if(!item.empty()) out.push_back(std::move(item));
  }
  return out;
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
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
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
  out << get_json(true).dump(2);
  return true;
}

// Unknown keys are ignored so that older settings files keep loading.
inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
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
  if(spec.type == "float") {
    if(value.is_number()) {
      settings_[spec.key] = value.get<double>();
      return true;
    }
    error = "expected number";
    return false;
  }
  if(spec.type == "string") {
    if(!value.is_string()) {
      error = "expected string";
      return false;
    }
    auto text = value.get<std::string>();
    if(!spec.choices.empty() &&
       std::find(spec.choices.begin(), spec.choices.end(), text) == spec.choices.end()) {
      error = "expected one of";
      for(const auto& choice : spec.choices) {
        if(!choice.empty()) error += " " + choice;
      }
      return false;
    }
    settings_[spec.key] = std::move(text);
    return true;
  }
  error = "unknown type";
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
  if(spec.type == "float") {
    try {
      std::size_t used = 0;
      double parsed = std::stod(clean, &used);
      if(used != clean.size()) {
        error = "expected number";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
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
