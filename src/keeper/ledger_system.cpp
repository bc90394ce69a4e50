#include "keeper/ledger_system.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "net/http_client.hpp"
#include <stdexcept>

LedgerSystem::LedgerSystem(const SystemConfig& config, const Clock& clock, HttpClient* http)
  : config_(config),
    clock_(clock),
    reserve(config.symbols.at(Asset::Reserve), config.reserve_decimals),
    stable(config.symbols.at(Asset::Stable), 18),
    bond(config.symbols.at(Asset::Bond), 18),
    backstop(config.symbols.at(Asset::Backstop), 18),
    twap(clock, config.twap_period_s),
    params(config.admin_address, config.params),
    validator(twap, params, clock),
    vault(config.vault_address, reserve, backstop, stable),
    engine(CollateralEngineWiring{config.engine_address, config.admin_address, reserve, stable, bond, vault,
                                  validator, params, clock}) {
  vault.BindEngine(engine.Account());

  for (const auto& kv : config_.pools) {
    const PoolSpec& spec = kv.second;
    auto pool = std::make_shared<ConstantProductPool>(spec.pair_id, spec.token0, spec.token1, clock_);
    pool->SetReserves(spec.reserve0, spec.reserve1);
    pools[kv.first] = pool;
    twap.TrackPair(pool);
  }

  auto pce = std::make_shared<PriceFeedAdapter>(BuildFeed(config_.pce_feed, http), clock_, config_.max_feed_staleness_s);
  unit_index.reset(new UnitOfAccountIndex(config_.admin_address, pce, clock_));
  validator.SetUnitOfAccountIndex(unit_index.get());

  for (Asset asset : {Asset::Reserve, Asset::Stable, Asset::Bond, Asset::Backstop}) {
    const PoolSpec& spec = config_.pools.at(asset);
    AssetRoute route;
    route.asset = asset;
    route.pool.pair_id = spec.pair_id;
    route.pool.side = PriceSide::Token0;
    route.pool.base_decimals = spec.token0.decimals;
    route.pool.quote_decimals = spec.token1.decimals;
    // bond and backstop trade against Stable, the others against the USD quote token
    if (asset == Asset::Bond || asset == Asset::Backstop) route.pool.quote_asset = Asset::Stable;
    auto feeds = config_.feeds.find(asset);
    if (feeds != config_.feeds.end()) {
      for (const FeedSpec& f : feeds->second) {
        route.references.push_back(std::make_shared<PriceFeedAdapter>(BuildFeed(f, http), clock_, config_.max_feed_staleness_s));
      }
    }
    // the reserve price always needs corroboration; the others only when feeds are configured
    route.require_corroboration = asset == Asset::Reserve || !route.references.empty();
    validator.SetRoute(std::move(route));
  }

  if (config_.backstop_seed != 0) backstop.Mint(vault.Account(), config_.backstop_seed);

  substrate.Register(reserve);
  substrate.Register(stable);
  substrate.Register(bond);
  substrate.Register(backstop);
  for (auto& kv : pools) substrate.Register(*kv.second);
  substrate.Register(twap);
  substrate.Register(params);
  substrate.Register(*unit_index);
  substrate.Register(engine);
  BITRES_LOG_INFO("ledger system wired with " + std::to_string(substrate.ParticipantCount()) + " state participants");
}

std::shared_ptr<PushPriceFeed> LedgerSystem::BuildFeed(const FeedSpec& spec, HttpClient* http) {
  if (spec.kind == FeedSpec::Kind::Static) {
    auto feed = std::make_shared<StaticPriceFeed>(spec.name, spec.static_price, FixedPoint::kWadDecimals, clock_);
    static_feeds_[spec.name] = feed;
    return feed;
  }
  if (!http) throw std::invalid_argument("feed " + spec.name + " needs an HTTP client");
  auto feed = std::make_shared<HttpPriceFeed>(spec.name, spec.http, *http, clock_);
  http_feeds_.push_back(feed);
  return feed;
}

InMemoryTokenLedger& LedgerSystem::Ledger(Asset asset) {
  switch (asset) {
    case Asset::Reserve: return reserve;
    case Asset::Stable: return stable;
    case Asset::Bond: return bond;
    case Asset::Backstop: return backstop;
    case Asset::UnitOfAccount: break;
  }
  throw std::invalid_argument(std::string("no token ledger for ") + AssetName(asset));
}

ConstantProductPool& LedgerSystem::PoolFor(Asset asset) {
  auto it = pools.find(asset);
  if (it == pools.end()) throw std::invalid_argument(std::string("no pool for ") + AssetName(asset));
  return *it->second;
}

const std::string& LedgerSystem::PairFor(Asset asset) const {
  auto it = pools.find(asset);
  if (it == pools.end()) throw std::invalid_argument(std::string("no pool for ") + AssetName(asset));
  return it->second->PairId();
}

StaticPriceFeed& LedgerSystem::StaticFeed(const std::string& name) {
  auto it = static_feeds_.find(name);
  if (it == static_feeds_.end()) throw std::invalid_argument("no static feed named " + name);
  return *it->second;
}

std::vector<std::string> LedgerSystem::StaticFeedNames() const {
  std::vector<std::string> names;
  for (const auto& kv : static_feeds_) names.push_back(kv.first);
  return names;
}

Address LedgerSystem::ResolveAccount(const std::string& name_or_address) const {
  if (name_or_address == "admin") return config_.admin_address;
  if (name_or_address == "engine") return engine.Account();
  if (name_or_address == "vault") return vault.Account();
  return NormalizeAddress(name_or_address);
}

PersistedState LedgerSystem::CaptureState() const {
  PersistedState state;
  state.position = engine.Position();
  state.observations = twap.Snapshot();
  for (const auto& kv : pools) state.pools[kv.second->PairId()] = kv.second->Snapshot();
  state.unit_index = unit_index->Snapshot();
  state.saved_at = clock_.Now();
  return state;
}

void LedgerSystem::ApplyState(const PersistedState& state) {
  for (auto& kv : pools) {
    auto it = state.pools.find(kv.second->PairId());
    if (it != state.pools.end()) kv.second->Restore(*it);
  }
  twap.Restore(state.observations);
  if (!state.unit_index.empty()) unit_index->Restore(state.unit_index);
  engine.LoadPosition(state.position);
  BITRES_LOG_INFO("restored state saved at " + std::to_string(state.saved_at));
}
