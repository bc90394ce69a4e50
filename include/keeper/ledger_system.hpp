#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "config/system_config.hpp"
#include "engine/collateral_engine.hpp"
#include "governance/parameter_store.hpp"
#include "oracle/http_price_feed.hpp"
#include "oracle/price_validator.hpp"
#include "oracle/twap_oracle.hpp"
#include "oracle/unit_of_account_index.hpp"
#include "pool/constant_product_pool.hpp"
#include "protocols/in_memory_token_ledger.hpp"
#include "substrate/ledger_substrate.hpp"
#include "substrate/state_store.hpp"
#include "vault/reserve_vault.hpp"

class HttpClient;

// The whole ledger wired from a SystemConfig, with in-memory token ledgers and
// simulated pools. Every participant is registered with the substrate.
class LedgerSystem {
public:
  // http may be null when no feed is configured as http
  LedgerSystem(const SystemConfig& config, const Clock& clock, HttpClient* http);
  LedgerSystem(const LedgerSystem&) = delete;
  LedgerSystem& operator=(const LedgerSystem&) = delete;

  InMemoryTokenLedger& Ledger(Asset asset);
  ConstantProductPool& PoolFor(Asset asset);
  const std::string& PairFor(Asset asset) const;
  // throws std::invalid_argument for unknown names
  StaticPriceFeed& StaticFeed(const std::string& name);
  std::vector<std::string> StaticFeedNames() const;
  const std::vector<std::shared_ptr<HttpPriceFeed>>& HttpFeeds() const { return http_feeds_; }

  // "admin", "engine" and "vault" map to the wired accounts; anything else must be an address
  Address ResolveAccount(const std::string& name_or_address) const;

  PersistedState CaptureState() const;
  void ApplyState(const PersistedState& state);

  const SystemConfig& Config() const { return config_; }
  const Clock& GetClock() const { return clock_; }

private:
  std::shared_ptr<PushPriceFeed> BuildFeed(const FeedSpec& spec, HttpClient* http);

  SystemConfig config_;
  const Clock& clock_;
  std::map<std::string, std::shared_ptr<StaticPriceFeed>> static_feeds_;
  std::vector<std::shared_ptr<HttpPriceFeed>> http_feeds_;

public:
  InMemoryTokenLedger reserve;
  InMemoryTokenLedger stable;
  InMemoryTokenLedger bond;
  InMemoryTokenLedger backstop;
  std::map<Asset, std::shared_ptr<ConstantProductPool>> pools;
  TimeWeightedPriceOracle twap;
  ParameterStore params;
  std::unique_ptr<UnitOfAccountIndex> unit_index;
  PriceValidator validator;
  ReserveVault vault;
  CollateralEngine engine;
  LedgerSubstrate substrate;
};
