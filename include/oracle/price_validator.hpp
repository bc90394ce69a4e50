#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/clock.hpp"
#include "governance/parameter_store.hpp"
#include "oracle/price_feed_adapter.hpp"
#include "oracle/trusted_price.hpp"
#include "oracle/twap_oracle.hpp"

class UnitOfAccountIndex;

struct PoolRoute {
  std::string pair_id;
  PriceSide side = PriceSide::Token0;
  unsigned base_decimals = 18;
  unsigned quote_decimals = 18;
  // Set when the pool quotes in another tracked asset; the price is chained through it
  std::optional<Asset> quote_asset;
};

struct AssetRoute {
  Asset asset = Asset::Reserve;
  PoolRoute pool;
  std::vector<std::shared_ptr<PriceFeedAdapter>> references;
  // false for TWAP-only routes, which skip the cross-source check
  bool require_corroboration = true;
  bool scale_by_unit_index = false;
};

// Cross-checks the pool TWAP against the median of independent feeds and
// produces one trusted USD price per asset. Pure read.
class PriceValidator : public TrustedPriceSource {
public:
  PriceValidator(const TimeWeightedPriceOracle& twap, const ParameterSource& params, const Clock& clock);

  void SetRoute(AssetRoute route);
  bool HasRoute(Asset asset) const;
  void SetUnitOfAccountIndex(const UnitOfAccountIndex* index) { unit_index_ = index; }

  TrustedPrice GetTrustedPrice(Asset asset) const override;

  // Floor average of the two middle values for an even count; throws on empty input
  static U256 Median(std::vector<U256> values);
private:
  TrustedPrice Resolve(Asset asset, unsigned depth) const;

  const TimeWeightedPriceOracle& twap_;
  const ParameterSource& params_;
  const Clock& clock_;
  const UnitOfAccountIndex* unit_index_ = nullptr;
  std::map<Asset, AssetRoute> routes_;
};
