#pragma once
#include <string>
#include <vector>

// 0x-prefixed, lower-case, 20-byte hex account
using Address = std::string;

enum class Asset { Reserve, Stable, Bond, Backstop, UnitOfAccount };

const char* AssetName(Asset asset);
// Accepts RESERVE/STABLE/BOND/BACKSTOP/UNIT (any case); throws std::invalid_argument
Asset ParseAsset(const std::string& text);
const std::vector<Asset>& AllAssets();

// Lower-cases and 0x-prefixes; throws std::invalid_argument unless 40 hex digits follow
Address NormalizeAddress(const std::string& text);
