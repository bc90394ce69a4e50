#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

std::unordered_map<std::string, std::string> ConfigManager::cache_;
std::unordered_map<std::string, std::string> ConfigManager::overrides_;

static inline std::string TrimWhitespace(const std::string& input) {
  auto start = input.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return std::string();
  auto end = input.find_last_not_of(" \t\r\n");
  return input.substr(start, end - start + 1);
}

static inline std::string StripQuotes(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

void ConfigManager::Initialize(const std::string& env_path) {
  cache_.clear();
  LoadEnvFile(env_path);
}

void ConfigManager::LoadEnvFile(const std::string& env_path) {
  std::ifstream file(env_path);
  if (!file.is_open()) {
    BITRES_LOG_WARN(".env file not found: " + env_path);
    return;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = TrimWhitespace(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = TrimWhitespace(line.substr(7));
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = TrimWhitespace(line.substr(0, pos));
    std::string value = StripQuotes(TrimWhitespace(line.substr(pos + 1)));
    if (!key.empty()) cache_[key] = value;
  }
}

std::optional<std::string> ConfigManager::Get(const std::string& key) {
  auto ov = overrides_.find(key);
  if (ov != overrides_.end()) return ov->second;
  if (const char* env = std::getenv(key.c_str())) return std::string(env);
  auto it = cache_.find(key);
  if (it == cache_.end()) return std::nullopt;
  return it->second;
}

std::string ConfigManager::GetOrThrow(const std::string& key) {
  auto v = Get(key);
  if (!v) throw std::runtime_error("Missing required config: " + key);
  return *v;
}

int ConfigManager::GetIntOr(const std::string& key, int default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  try {
    return std::stoi(*v);
  } catch (const std::exception&) {
    BITRES_LOG_WARN("config " + key + "='" + *v + "' is not an integer, using default");
    return default_value;
  }
}

uint64_t ConfigManager::GetUint64Or(const std::string& key, uint64_t default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  if (v->empty() || !std::all_of(v->begin(), v->end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
    BITRES_LOG_WARN("config " + key + "='" + *v + "' is not an unsigned integer, using default");
    return default_value;
  }
  try {
    return std::stoull(*v);
  } catch (const std::out_of_range&) {
    BITRES_LOG_WARN("config " + key + " is out of range, using default");
    return default_value;
  }
}

double ConfigManager::GetDoubleOr(const std::string& key, double default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  try {
    return std::stod(*v);
  } catch (const std::exception&) {
    BITRES_LOG_WARN("config " + key + "='" + *v + "' is not a number, using default");
    return default_value;
  }
}

bool ConfigManager::GetBoolOr(const std::string& key, bool default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  std::string s = *v;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes") return true;
  if (s == "0" || s == "false" || s == "no") return false;
  return default_value;
}

U256 ConfigManager::GetDecimalOr(const std::string& key, const U256& default_value, unsigned decimals) {
  auto v = Get(key);
  if (!v) return default_value;
  try {
    return FixedPoint::ParseDecimal(*v, decimals);
  } catch (const std::invalid_argument& e) {
    throw std::invalid_argument("config " + key + ": " + e.what());
  }
}

std::vector<std::string> ConfigManager::GetListOr(const std::string& key, char separator, const std::vector<std::string>& default_value) {
  auto v = Get(key);
  if (!v) return default_value;
  std::vector<std::string> out;
  std::istringstream iss(*v);
  std::string item;
  while (std::getline(iss, item, separator)) {
    item = TrimWhitespace(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

void ConfigManager::Set(const std::string& key, const std::string& value) { overrides_[key] = value; }

void ConfigManager::Clear() {
  cache_.clear();
  overrides_.clear();
}
