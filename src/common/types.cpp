#include "common/types.hpp"
#include "utils/hex.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

const char* AssetName(Asset asset) {
  switch (asset) {
    case Asset::Reserve: return "RESERVE";
    case Asset::Stable: return "STABLE";
    case Asset::Bond: return "BOND";
    case Asset::Backstop: return "BACKSTOP";
    case Asset::UnitOfAccount: return "UNIT";
  }
  return "UNKNOWN";
}

Asset ParseAsset(const std::string& text) {
  std::string s = text;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  for (Asset a : AllAssets()) if (s == AssetName(a)) return a;
  throw std::invalid_argument("unknown asset: " + text);
}

const std::vector<Asset>& AllAssets() {
  static const std::vector<Asset> assets{Asset::Reserve, Asset::Stable, Asset::Bond, Asset::Backstop, Asset::UnitOfAccount};
  return assets;
}

Address NormalizeAddress(const std::string& text) {
  std::string digits = ToLowerHex(Strip0x(text));
  if (digits.size() != 40 || !IsHexDigits(digits)) throw std::invalid_argument("malformed address: " + text);
  return "0x" + digits;
}
