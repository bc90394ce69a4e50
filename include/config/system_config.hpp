#pragma once
#include <map>
#include <string>
#include <vector>
#include "common/logger.hpp"
#include "common/types.hpp"
#include "governance/parameter_store.hpp"
#include "oracle/http_price_feed.hpp"
#include "pool/constant_product_pool.hpp"

struct FeedSpec {
  enum class Kind { Static, Http };
  Kind kind = Kind::Static;
  std::string name;
  U256 static_price = 0;  // WAD, Kind::Static
  HttpFeedSource http;    // Kind::Http
};

struct PoolSpec {
  std::string pair_id;
  PoolToken token0;
  PoolToken token1;
  U256 reserve0 = 0; // native units
  U256 reserve1 = 0;
};

struct SystemConfig {
  // files
  std::string log_file = "bitres.log";
  LogLevel log_level = LogLevel::INFO;
  bool log_stderr = false;
  std::string events_file = "bitres-events.jsonl";
  std::string request_csv = "bitres-requests.csv";
  std::string state_file = "bitres-state.json";

  // keeper
  uint64_t keeper_interval_s = 300;
  size_t keeper_threads = 2;
  uint64_t twap_period_s = 1800;
  uint64_t max_feed_staleness_s = 3600;
  bool verify_tls = true;

  // identity
  std::string admin_private_key;
  Address admin_address;
  Address engine_address;
  Address vault_address;
  bool require_signed_requests = false;

  // protocol
  GovernableParameters params;
  std::map<Asset, std::string> symbols;
  unsigned reserve_decimals = 8;
  std::map<Asset, PoolSpec> pools;                   // Reserve, Stable, Bond, Backstop
  std::map<Asset, std::vector<FeedSpec>> feeds;      // reference feeds per asset
  FeedSpec pce_feed;
  U256 backstop_seed = 0;                            // backstop tokens minted into the vault at start
};

// "static:<price>" or "http:<url>|<json-pointer>[|<raw-decimals>]"; throws std::invalid_argument
FeedSpec ParseFeedSpec(const std::string& name, const std::string& text);

// Reads every BITRES setting through ConfigManager; throws std::invalid_argument on bad values
SystemConfig LoadSystemConfig();
