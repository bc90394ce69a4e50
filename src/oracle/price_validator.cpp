#include "oracle/price_validator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "oracle/unit_of_account_index.hpp"
#include <algorithm>
#include <stdexcept>

// longest legal chain is asset -> quote asset -> USD
static constexpr unsigned kMaxRouteDepth = 3;

PriceValidator::PriceValidator(const TimeWeightedPriceOracle& twap, const ParameterSource& params, const Clock& clock)
  : twap_(twap), params_(params), clock_(clock) {}

void PriceValidator::SetRoute(AssetRoute route) {
  if (route.asset == Asset::UnitOfAccount) throw std::invalid_argument("the unit of account is priced by its index, not a route");
  if (route.pool.quote_asset && *route.pool.quote_asset == route.asset) {
    throw std::invalid_argument(std::string("route for ") + AssetName(route.asset) + " quotes in itself");
  }
  const Asset asset = route.asset;
  routes_[asset] = std::move(route);
}

bool PriceValidator::HasRoute(Asset asset) const {
  return asset == Asset::UnitOfAccount ? unit_index_ != nullptr : routes_.count(asset) > 0;
}

U256 PriceValidator::Median(std::vector<U256> values) {
  if (values.empty()) throw std::invalid_argument("median of no values");
  std::sort(values.begin(), values.end());
  const size_t mid = values.size() / 2;
  if (values.size() % 2 == 1) return values[mid];
  return (values[mid - 1] + values[mid]) / 2;
}

TrustedPrice PriceValidator::GetTrustedPrice(Asset asset) const { return Resolve(asset, 0); }

TrustedPrice PriceValidator::Resolve(Asset asset, unsigned depth) const {
  if (depth >= kMaxRouteDepth) {
    throw LedgerError(ErrorCode::InvalidParameter, std::string("price route for ") + AssetName(asset) + " is circular");
  }
  const Timestamp now = clock_.Now();
  if (asset == Asset::UnitOfAccount) {
    if (!unit_index_) throw LedgerError(ErrorCode::FeedUnavailable, "no unit of account index configured");
    return TrustedPrice{asset, unit_index_->Current(), now};
  }

  auto it = routes_.find(asset);
  if (it == routes_.end()) throw LedgerError(ErrorCode::FeedUnavailable, std::string("no price route for ") + AssetName(asset));
  const AssetRoute& route = it->second;

  // reference first: missing or stale feeds fail before the pool is read
  std::optional<U256> reference;
  if (route.require_corroboration) {
    if (route.references.empty()) {
      throw LedgerError(ErrorCode::FeedUnavailable, std::string("no reference feeds for ") + AssetName(asset));
    }
    std::vector<U256> readings;
    readings.reserve(route.references.size());
    for (const auto& feed : route.references) readings.push_back(feed->Read().value);
    reference = Median(readings);
  }

  U256 pool_price = twap_.PriceInUnits(route.pool.pair_id, route.pool.base_decimals, route.pool.quote_decimals, route.pool.side);
  if (route.pool.quote_asset) {
    pool_price = FixedPoint::WadMul(pool_price, Resolve(*route.pool.quote_asset, depth + 1).value);
  }

  if (reference) {
    const U256 deviation = FixedPoint::DeviationBps(pool_price, *reference);
    const uint64_t tolerance = params_.Current().deviation_tolerance_bps;
    if (deviation > tolerance) {
      BITRES_LOG_WARN(std::string("price deviation on ") + AssetName(asset) + ": pool=" + FixedPoint::FormatDecimal(pool_price, 18, 6) +
                      " reference=" + FixedPoint::FormatDecimal(*reference, 18, 6) + " (" + deviation.str() + " bps)");
      throw LedgerError(ErrorCode::PriceDeviation, std::string(AssetName(asset)) + " pool price deviates " + deviation.str() +
                        " bps from reference, tolerance " + std::to_string(tolerance));
    }
  }

  if (route.scale_by_unit_index) {
    if (!unit_index_) throw LedgerError(ErrorCode::FeedUnavailable, "route needs the unit of account index");
    pool_price = FixedPoint::WadMul(pool_price, unit_index_->Current());
  }
  if (pool_price == 0) throw LedgerError(ErrorCode::FeedUnavailable, std::string("pool price for ") + AssetName(asset) + " is zero");
  return TrustedPrice{asset, pool_price, now};
}
