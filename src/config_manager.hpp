#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json CONFIG_SPECIFICATION = nlohmann::json::array({
  {{"key","username"},             {"aliases", {"name","u"}},         {"type","string"}, {"default",""},                {"description","Name announced to peers (empty = hostname)"}, {"persistent", true}},
  {{"key","broadcasting_enabled"}, {"aliases", {"broadcast","b"}},    {"type","bool"},   {"default",true},              {"description","Announce this machine on the network"}, {"persistent", true}},
  {{"key","broadcast_address"},    {"aliases", {"iface","ba"}},       {"type","string"}, {"default","255.255.255.255"}, {"description","Broadcast address (255.255.255.255 = all interfaces)"}, {"persistent", true}},
  {{"key","listen_ip"},            {"aliases", {"li"}},               {"type","string"}, {"default","0.0.0.0"},         {"description","IPv4 address both sockets bind to"}, {"persistent", true}},
  {{"key","discovery_port"},       {"aliases", {"dp"}},               {"type","int"},    {"default",5000},              {"description","UDP port for presence announcements"}, {"persistent", true}},
  {{"key","transfer_port"},        {"aliases", {"tp"}},               {"type","int"},    {"default",5001},              {"description","TCP port for file transfers"}, {"persistent", true}},
  {{"key","heartbeat_ms"},         {"aliases", {"hb"}},               {"type","int"},    {"default",1000},              {"description","Milliseconds between announcements"}, {"persistent", true}},
  {{"key","peer_timeout_ms"},      {"aliases", {"pt"}},               {"type","int"},    {"default",0},                 {"description","Milliseconds of silence before a peer is dropped (0 = twice heartbeat_ms)"}, {"persistent", true}},
  {{"key","download_dir"},         {"aliases", {"dl","downloads"}},   {"type","string"}, {"default",""},                {"description","Directory for received files (empty = ~/Downloads)"}, {"persistent", true}},
  {{"key","max_pending_offers"},   {"aliases", {"mpo"}},              {"type","int"},    {"default",16},                {"description","Offers awaiting a decision before new ones are refused (0 = no limit)"}, {"persistent", true}},
  {{"key","offer_timeout_s"},      {"aliases", {"ot"}},               {"type","int"},    {"default",0},                 {"description","Seconds before an unanswered offer is rejected (0 = wait forever)"}, {"persistent", true}},
  {{"key","io_threads"},           {"aliases", {"threads","j"}},      {"type","int"},    {"default",2},                 {"description","Threads running network I/O"}, {"persistent", true}},
  {{"key","verbose"},              {"aliases", {"v"}},                {"type","bool"},   {"default",false},             {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},             {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},          {"type","bool"},   {"default",false},             {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed key/value configuration described by a JSON table of
// {key, aliases, type, default, description, persistent} entries.
class ConfigManager {
public:
  ConfigManager() : ConfigManager(CONFIG_SPECIFICATION) {}
  explicit ConfigManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) throw std::runtime_error("Unknown setting: " + key);
    return values_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;

  bool help_requested() const { return has("help") && get<bool>("help"); }
  bool save_requested() const { return has("save") && get<bool>("save"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::string value_as_string(const std::string& key) const;
  const nlohmann::json& specification() const { return specification_; }

  std::filesystem::path config_path() const;
  void set_config_path(const std::filesystem::path& path) { path_override_ = path; }

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct Entry {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    bool persistent = true;
  };

  const Entry* find_entry(const std::string& token) const;
  bool store(const Entry& entry, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string(const Entry& entry, const std::string& text, std::string& error) const;

  nlohmann::json specification_;
  std::vector<Entry> entries_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
};

// ---- implementation -------------------------------------------------------

inline ConfigManager::ConfigManager(const nlohmann::json& specification)
  : specification_(specification) {
  for(const auto& item : specification_) {
    Entry entry;
    entry.key = item.at("key").get<std::string>();
    if(item.contains("aliases")) {
      for(const auto& alias : item.at("aliases")) {
        entry.aliases.push_back(to_lower(alias.get<std::string>()));
      }
    }
    entry.type = item.at("type").get<std::string>();
    entry.default_value = item.at("default");
    entry.persistent = item.value("persistent", true);
    values_[entry.key] = entry.default_value;
    entries_.push_back(std::move(entry));
  }
}

inline const ConfigManager::Entry* ConfigManager::find_entry(const std::string& token) const {
  auto lowered = to_lower(trim_copy(token));
  for(const auto& entry : entries_) {
    if(to_lower(entry.key) == lowered) return &entry;
    if(std::find(entry.aliases.begin(), entry.aliases.end(), lowered) != entry.aliases.end()) {
      return &entry;
    }
  }
  return nullptr;
}

inline std::optional<std::string> ConfigManager::resolve_key(const std::string& token) const {
  if(const auto* entry = find_entry(token)) return entry->key;
  return std::nullopt;
}

inline bool ConfigManager::is_bool_setting(const std::string& key) const {
  const auto* entry = find_entry(key);
  return entry && entry->type == "bool";
}

inline std::string ConfigManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::filesystem::path ConfigManager::config_path() const {
  if(!path_override_.empty()) return path_override_;
  if(const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".config" / "landrop" / "settings.json";
  }
  return std::filesystem::current_path() / ".config" / "settings.json";
}

inline bool ConfigManager::load() {
  auto path = config_path();
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const std::exception& e) {
    log_warn(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) return false;
  for(const auto& item : doc.items()) {
    const auto* entry = find_entry(item.key());
    if(!entry || !entry->persistent) continue;
    std::string error;
    if(!store(*entry, item.value(), error)) {
      log_warn(nullptr, "Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool ConfigManager::save() const {
  auto path = config_path();
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    log_error(nullptr, "Unable to write {}", path.string());
    return false;
  }
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& entry : entries_) {
    if(entry.persistent) doc[entry.key] = values_.at(entry.key);
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

inline bool ConfigManager::store(const Entry& entry, const nlohmann::json& value, std::string& error) {
  error.clear();
  if(entry.type == "bool") {
    if(value.is_boolean()) { values_[entry.key] = value.get<bool>(); return true; }
    if(value.is_number_integer()) { values_[entry.key] = value.get<int>() != 0; return true; }
    error = "expected boolean";
    return false;
  }
  if(entry.type == "int") {
    if(value.is_number_integer()) { values_[entry.key] = value.get<int>(); return true; }
    error = "expected integer";
    return false;
  }
  if(entry.type == "string") {
    if(value.is_string()) { values_[entry.key] = value.get<std::string>(); return true; }
    error = "expected string";
    return false;
  }
  error = "unknown type '" + entry.type + "'";
  return false;
}

inline nlohmann::json ConfigManager::parse_string(const Entry& entry,
                                                  const std::string& text,
                                                  std::string& error) const {
  error.clear();
  auto clean = trim_copy(text);
  if(entry.type == "bool") {
    auto v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(entry.type == "int") {
    try {
      std::size_t used = 0;
      int parsed = std::stoi(clean, &used);
      if(used != clean.size()) {
        error = "trailing characters in integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  return clean;
}

inline bool ConfigManager::set_from_string(const std::string& key,
                                           const std::string& value,
                                           std::string& error) {
  const auto* entry = find_entry(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string(*entry, value, error);
  if(!error.empty()) return false;
  return store(*entry, parsed, error);
}

inline bool ConfigManager::set_from_json(const std::string& key,
                                         const nlohmann::json& value,
                                         std::string& error) {
  const auto* entry = find_entry(key);
  if(!entry) {
    error = "unknown setting";
    return false;
  }
  return store(*entry, value, error);
}

inline std::string ConfigManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string ConfigManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline bool ConfigManager::is_bool_literal(const std::string& value) {
  auto lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}
