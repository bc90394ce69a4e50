#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "math/fixed_point.hpp"

// .env key=value store. A variable set in the process environment wins over the file.
class ConfigManager {
public:
  static void Initialize(const std::string& env_path = ".env");
  static std::optional<std::string> Get(const std::string& key);
  static std::string GetOrThrow(const std::string& key);
  static int GetIntOr(const std::string& key, int default_value);
  static uint64_t GetUint64Or(const std::string& key, uint64_t default_value);
  static double GetDoubleOr(const std::string& key, double default_value);
  static bool GetBoolOr(const std::string& key, bool default_value);
  // Exact decimal parsing, e.g. "0.98" -> 980000000000000000 for 18 decimals
  static U256 GetDecimalOr(const std::string& key, const U256& default_value, unsigned decimals = FixedPoint::kWadDecimals);
  // Splits on the separator, dropping empty items
  static std::vector<std::string> GetListOr(const std::string& key, char separator, const std::vector<std::string>& default_value);
  // Test and replay hook; overrides both file and environment
  static void Set(const std::string& key, const std::string& value);
  static void Clear();
private:
  static std::unordered_map<std::string, std::string> cache_;
  static std::unordered_map<std::string, std::string> overrides_;
  static void LoadEnvFile(const std::string& env_path);
};
