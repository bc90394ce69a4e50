#include "config/system_config.hpp"
#include "common/config_manager.hpp"
#include "wallet/signer.hpp"
#include <sstream>
#include <stdexcept>

static const char* kDefaultAdmin = "0x00000000000000000000000000000000000a11ce";
static const char* kDefaultEngine = "0x00000000000000000000000000000000000e0617";
static const char* kDefaultVault = "0x000000000000000000000000000000000000ba17";

FeedSpec ParseFeedSpec(const std::string& name, const std::string& text) {
  FeedSpec spec;
  spec.name = name;
  auto colon = text.find(':');
  if (colon == std::string::npos) throw std::invalid_argument("feed " + name + ": expected static:<price> or http:<url>|<pointer>");
  const std::string kind = text.substr(0, colon);
  const std::string rest = text.substr(colon + 1);
  if (kind == "static") {
    spec.kind = FeedSpec::Kind::Static;
    spec.static_price = FixedPoint::ParseDecimal(rest);
    return spec;
  }
  if (kind == "http" || kind == "https") {
    spec.kind = FeedSpec::Kind::Http;
    std::vector<std::string> parts;
    std::istringstream iss(rest);
    std::string part;
    while (std::getline(iss, part, '|')) parts.push_back(part);
    if (parts.size() < 2 || parts.size() > 3) throw std::invalid_argument("feed " + name + ": expected <url>|<pointer>[|<decimals>]");
    // the scheme was consumed as the kind
    spec.http.url = kind + ":" + parts[0];
    spec.http.json_pointer = parts[1];
    if (parts.size() == 3) spec.http.raw_decimals = static_cast<unsigned>(std::stoul(parts[2]));
    return spec;
  }
  throw std::invalid_argument("feed " + name + ": unknown kind '" + kind + "'");
}

static PoolSpec LoadPool(const std::string& key, const std::string& pair_id, PoolToken token0, PoolToken token1,
                         const std::string& default_reserves) {
  PoolSpec spec;
  spec.pair_id = pair_id;
  auto amounts = ConfigManager::GetListOr(key, ',', {});
  if (amounts.empty()) {
    std::istringstream iss(default_reserves);
    std::string a;
    while (std::getline(iss, a, ',')) amounts.push_back(a);
  }
  if (amounts.size() != 2) throw std::invalid_argument(key + ": expected <reserve0>,<reserve1>");
  spec.reserve0 = FixedPoint::ParseDecimal(amounts[0], token0.decimals);
  spec.reserve1 = FixedPoint::ParseDecimal(amounts[1], token1.decimals);
  spec.token0 = std::move(token0);
  spec.token1 = std::move(token1);
  return spec;
}

SystemConfig LoadSystemConfig() {
  SystemConfig cfg;
  cfg.log_file = ConfigManager::Get("LOG_FILE").value_or(cfg.log_file);
  cfg.log_level = ParseLogLevel(ConfigManager::Get("LOG_LEVEL").value_or("info"));
  cfg.log_stderr = ConfigManager::GetBoolOr("LOG_STDERR", cfg.log_stderr);
  cfg.events_file = ConfigManager::Get("EVENTS_FILE").value_or(cfg.events_file);
  cfg.request_csv = ConfigManager::Get("REQUEST_LOG_CSV").value_or(cfg.request_csv);
  cfg.state_file = ConfigManager::Get("STATE_FILE").value_or(cfg.state_file);

  cfg.keeper_interval_s = ConfigManager::GetUint64Or("KEEPER_INTERVAL_S", cfg.keeper_interval_s);
  const int threads = ConfigManager::GetIntOr("KEEPER_THREADS", static_cast<int>(cfg.keeper_threads));
  cfg.keeper_threads = threads > 0 ? static_cast<size_t>(threads) : 1;
  cfg.twap_period_s = ConfigManager::GetUint64Or("TWAP_PERIOD_S", cfg.twap_period_s);
  cfg.max_feed_staleness_s = ConfigManager::GetUint64Or("MAX_FEED_STALENESS_S", cfg.max_feed_staleness_s);
  cfg.verify_tls = ConfigManager::GetBoolOr("HTTP_VERIFY_TLS", cfg.verify_tls);

  cfg.admin_private_key = ConfigManager::Get("ADMIN_PRIVATE_KEY").value_or("");
  if (!cfg.admin_private_key.empty()) {
    cfg.admin_address = Signer(cfg.admin_private_key).GetAddress();
  } else {
    cfg.admin_address = NormalizeAddress(ConfigManager::Get("ADMIN_ADDRESS").value_or(kDefaultAdmin));
  }
  cfg.engine_address = NormalizeAddress(ConfigManager::Get("ENGINE_ADDRESS").value_or(kDefaultEngine));
  cfg.vault_address = NormalizeAddress(ConfigManager::Get("VAULT_ADDRESS").value_or(kDefaultVault));
  cfg.require_signed_requests = ConfigManager::GetBoolOr("REQUIRE_SIGNED_REQUESTS", cfg.require_signed_requests);

  GovernableParameters defaults;
  cfg.params.mint_fee_bps = ConfigManager::GetUint64Or("MINT_FEE_BPS", defaults.mint_fee_bps);
  cfg.params.redeem_fee_bps = ConfigManager::GetUint64Or("REDEEM_FEE_BPS", defaults.redeem_fee_bps);
  cfg.params.bond_floor_price = ConfigManager::GetDecimalOr("BOND_FLOOR_PRICE", defaults.bond_floor_price);
  cfg.params.max_bond_rate_bps = ConfigManager::GetUint64Or("MAX_BOND_RATE_BPS", defaults.max_bond_rate_bps);
  cfg.params.deviation_tolerance_bps = ConfigManager::GetUint64Or("DEVIATION_TOLERANCE_BPS", defaults.deviation_tolerance_bps);

  cfg.symbols[Asset::Reserve] = ConfigManager::Get("SYMBOL_RESERVE").value_or("WBTC");
  cfg.symbols[Asset::Stable] = ConfigManager::Get("SYMBOL_STABLE").value_or("BTD");
  cfg.symbols[Asset::Bond] = ConfigManager::Get("SYMBOL_BOND").value_or("BTB");
  cfg.symbols[Asset::Backstop] = ConfigManager::Get("SYMBOL_BACKSTOP").value_or("BRS");
  const std::string usd = ConfigManager::Get("SYMBOL_USD_QUOTE").value_or("USDC");
  const unsigned usd_decimals = static_cast<unsigned>(ConfigManager::GetIntOr("USD_QUOTE_DECIMALS", 6));
  cfg.reserve_decimals = static_cast<unsigned>(ConfigManager::GetIntOr("RESERVE_DECIMALS", 8));

  const PoolToken reserve_token{cfg.symbols[Asset::Reserve], cfg.reserve_decimals};
  const PoolToken stable_token{cfg.symbols[Asset::Stable], 18};
  const PoolToken usd_token{usd, usd_decimals};
  cfg.pools[Asset::Reserve] = LoadPool("POOL_RESERVE", reserve_token.symbol + "/" + usd, reserve_token, usd_token, "100,5000000");
  cfg.pools[Asset::Stable] = LoadPool("POOL_STABLE", stable_token.symbol + "/" + usd, stable_token, usd_token, "1000000,1000000");
  cfg.pools[Asset::Bond] = LoadPool("POOL_BOND", cfg.symbols[Asset::Bond] + "/" + stable_token.symbol,
                                    PoolToken{cfg.symbols[Asset::Bond], 18}, stable_token, "100000,100000");
  cfg.pools[Asset::Backstop] = LoadPool("POOL_BACKSTOP", cfg.symbols[Asset::Backstop] + "/" + stable_token.symbol,
                                        PoolToken{cfg.symbols[Asset::Backstop], 18}, stable_token, "100000,100000");

  for (Asset asset : {Asset::Reserve, Asset::Stable, Asset::Bond, Asset::Backstop}) {
    const std::string key = std::string("FEED_") + AssetName(asset);
    const std::vector<std::string> fallback = asset == Asset::Reserve ? std::vector<std::string>{"static:50000"} : std::vector<std::string>{};
    auto entries = ConfigManager::GetListOr(key, ';', fallback);
    for (size_t i = 0; i < entries.size(); ++i) {
      cfg.feeds[asset].push_back(ParseFeedSpec(std::string(AssetName(asset)) + "#" + std::to_string(i), entries[i]));
    }
  }
  cfg.pce_feed = ParseFeedSpec("PCE", ConfigManager::Get("FEED_PCE").value_or("static:1"));
  cfg.backstop_seed = ConfigManager::GetDecimalOr("VAULT_BACKSTOP_SEED", 0);

  ParameterStore::Validate(cfg.params);
  return cfg;
}
