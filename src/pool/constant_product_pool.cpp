#include "pool/constant_product_pool.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

ConstantProductPool::ConstantProductPool(std::string pair_id, PoolToken token0, PoolToken token1, const Clock& clock)
  : pair_id_(std::move(pair_id)), token0_(std::move(token0)), token1_(std::move(token1)), clock_(clock), last_sync_(clock.Now()) {}

void ConstantProductPool::Update(const U256& reserve0, const U256& reserve1) {
  const Timestamp now = clock_.Now();
  const uint64_t elapsed = now > last_sync_ ? now - last_sync_ : 0;
  if (elapsed > 0 && reserves_.reserve0 != 0 && reserves_.reserve1 != 0) {
    cumulative_.price0 += FixedPoint::EncodeQ112(reserves_.reserve1, reserves_.reserve0) * elapsed;
    cumulative_.price1 += FixedPoint::EncodeQ112(reserves_.reserve0, reserves_.reserve1) * elapsed;
  }
  reserves_.reserve0 = reserve0;
  reserves_.reserve1 = reserve1;
  if (now > last_sync_) last_sync_ = now;
}

void ConstantProductPool::SetReserves(const U256& reserve0, const U256& reserve1) {
  Update(reserve0, reserve1);
  BITRES_LOG_DEBUG("pool " + pair_id_ + " reserves set to " + reserve0.str() + "/" + reserve1.str());
}

void ConstantProductPool::Sync() { Update(reserves_.reserve0, reserves_.reserve1); }

U256 ConstantProductPool::QuoteOut(bool zero_for_one, const U256& amount_in) const {
  const U256& reserve_in = zero_for_one ? reserves_.reserve0 : reserves_.reserve1;
  const U256& reserve_out = zero_for_one ? reserves_.reserve1 : reserves_.reserve0;
  if (reserve_in == 0 || reserve_out == 0 || amount_in == 0) return 0;
  // 0.3% fee
  U256 amount_in_with_fee = amount_in * 997;
  U256 denominator = reserve_in * 1000 + amount_in_with_fee;
  return FixedPoint::MulDiv(amount_in_with_fee, reserve_out, denominator);
}

U256 ConstantProductPool::Swap(bool zero_for_one, const U256& amount_in) {
  U256 amount_out = QuoteOut(zero_for_one, amount_in);
  if (amount_out == 0) throw LedgerError(ErrorCode::ZeroAmount, "swap on " + pair_id_ + " yields nothing");
  if (zero_for_one) {
    Update(reserves_.reserve0 + amount_in, reserves_.reserve1 - amount_out);
  } else {
    Update(reserves_.reserve0 - amount_out, reserves_.reserve1 + amount_in);
  }
  return amount_out;
}

U256 ConstantProductPool::SpotPrice0() const {
  if (reserves_.reserve0 == 0) return 0;
  return FixedPoint::RatioWad(reserves_.reserve1, FixedPoint::Pow10(token0_.decimals),
                              reserves_.reserve0, FixedPoint::Pow10(token1_.decimals));
}

nlohmann::json ConstantProductPool::Snapshot() const {
  return {
    {"reserve0", reserves_.reserve0.str()},
    {"reserve1", reserves_.reserve1.str()},
    {"price0_cumulative", cumulative_.price0.str()},
    {"price1_cumulative", cumulative_.price1.str()},
    {"last_sync", last_sync_}
  };
}

void ConstantProductPool::Restore(const nlohmann::json& snapshot) {
  reserves_.reserve0 = FixedPoint::ParseInteger(snapshot.at("reserve0").get<std::string>());
  reserves_.reserve1 = FixedPoint::ParseInteger(snapshot.at("reserve1").get<std::string>());
  cumulative_.price0 = FixedPoint::ParseInteger(snapshot.at("price0_cumulative").get<std::string>());
  cumulative_.price1 = FixedPoint::ParseInteger(snapshot.at("price1_cumulative").get<std::string>());
  last_sync_ = snapshot.at("last_sync").get<Timestamp>();
}
