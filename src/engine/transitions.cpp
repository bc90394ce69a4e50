#include "engine/transitions.hpp"
#include "common/errors.hpp"
#include <stdexcept>

using FixedPoint::Wad;

static void RequirePrices(const U256& reserve_price, const U256& unit_price) {
  if (reserve_price == 0) throw LedgerError(ErrorCode::FeedUnavailable, "reserve price is zero");
  if (unit_price == 0) throw LedgerError(ErrorCode::FeedUnavailable, "unit of account price is zero");
}

MintQuote QuoteMint(const CollateralPosition& position, const MintInputs& in) {
  if (in.reserve_amount == 0) throw LedgerError(ErrorCode::ZeroAmount, "mint of zero reserve");
  RequirePrices(in.reserve_price, in.unit_price);
  const U256 reserve18 = FixedPoint::Rescale(in.reserve_amount, in.reserve_decimals, FixedPoint::kWadDecimals);
  MintQuote q;
  q.gross_stable = FixedPoint::MulDiv(reserve18, in.reserve_price, in.unit_price);
  if (q.gross_stable == 0) throw LedgerError(ErrorCode::ZeroAmount, "reserve amount is worth less than one Stable unit");
  q.fee = FixedPoint::ApplyBps(q.gross_stable, in.mint_fee_bps);
  q.net_stable = q.gross_stable - q.fee;
  q.next = position;
  q.next.total_reserve_units += in.reserve_amount;
  q.next.total_stable_supply_tracked += q.gross_stable;
  return q;
}

U256 ComputeCollateralRatio(const CollateralPosition& position, unsigned reserve_decimals,
                            const U256& reserve_price, const U256& unit_price) {
  if (position.total_stable_supply_tracked == 0) return FixedPoint::MaxU256();
  RequirePrices(reserve_price, unit_price);
  const U256 reserve18 = FixedPoint::Rescale(position.total_reserve_units, reserve_decimals, FixedPoint::kWadDecimals);
  return FixedPoint::RatioWad(reserve18, reserve_price, position.total_stable_supply_tracked, unit_price);
}

const char* RedemptionTierName(RedemptionTier tier) {
  switch (tier) {
    case RedemptionTier::FullyBacked: return "fully_backed";
    case RedemptionTier::BondAtMarket: return "bond_at_market";
    case RedemptionTier::BondAtFloorWithBackstop: return "bond_at_floor_with_backstop";
  }
  return "unknown";
}

RedemptionQuote QuoteRedemption(const CollateralPosition& position, const RedemptionInputs& in) {
  if (in.stable_amount == 0) throw LedgerError(ErrorCode::ZeroAmount, "redemption of zero Stable");
  RequirePrices(in.reserve_price, in.unit_price);

  RedemptionQuote q;
  q.fee = FixedPoint::ApplyBps(in.stable_amount, in.redeem_fee_bps);
  q.net_stable = in.stable_amount - q.fee;
  if (q.net_stable == 0) throw LedgerError(ErrorCode::ZeroAmount, "redemption is consumed entirely by the fee");
  if (q.net_stable > position.total_stable_supply_tracked) {
    throw LedgerError(ErrorCode::InsufficientFunds, "redemption exceeds tracked Stable supply");
  }

  q.collateral_ratio = ComputeCollateralRatio(position, in.reserve_decimals, in.reserve_price, in.unit_price);
  q.net_value = FixedPoint::WadMul(q.net_stable, in.unit_price);

  if (q.collateral_ratio >= Wad()) {
    q.tier = RedemptionTier::FullyBacked;
    const U256 reserve18 = FixedPoint::MulDiv(q.net_stable, in.unit_price, in.reserve_price);
    q.reserve_out = FixedPoint::Rescale(reserve18, FixedPoint::kWadDecimals, in.reserve_decimals);
  } else {
    q.reserve_out = FixedPoint::MulDiv(q.net_stable, position.total_reserve_units, position.total_stable_supply_tracked);
  }
  if (q.reserve_out > position.total_reserve_units) {
    throw LedgerError(ErrorCode::InsufficientFunds, "redemption exceeds tracked reserve");
  }
  q.reserve_value = FixedPoint::WadMul(
    FixedPoint::Rescale(q.reserve_out, in.reserve_decimals, FixedPoint::kWadDecimals), in.reserve_price);

  if (q.collateral_ratio < Wad()) {
    if (!in.bond_price) throw std::logic_error("under-collateralized redemption quoted without a bond price");
    const U256& bond_price = *in.bond_price;
    const U256 shortfall = q.net_value > q.reserve_value ? U256(q.net_value - q.reserve_value) : U256(0);

    if (bond_price >= in.bond_floor_price) {
      q.tier = RedemptionTier::BondAtMarket;
      if (bond_price == 0) throw LedgerError(ErrorCode::FeedUnavailable, "bond price is zero");
      q.bond_out = FixedPoint::WadDiv(shortfall, bond_price);
      q.bond_value = FixedPoint::WadMul(q.bond_out, bond_price);
    } else {
      q.tier = RedemptionTier::BondAtFloorWithBackstop;
      if (!in.backstop_price) throw std::logic_error("bond below floor quoted without a backstop price");
      const U256& backstop_price = *in.backstop_price;
      if (backstop_price == 0) throw LedgerError(ErrorCode::FeedUnavailable, "backstop price is zero");
      const U256& floor = in.bond_floor_price;
      // the bond leg shrinks in proportion to how far the bond trades below its floor
      const U256 bond_share = FixedPoint::MulDiv(shortfall, bond_price, floor);
      q.bond_out = FixedPoint::WadDiv(bond_share, floor);
      q.bond_value = FixedPoint::WadMul(q.bond_out, floor);
      q.backstop_out = FixedPoint::WadDiv(shortfall - bond_share, backstop_price);
      q.backstop_value = FixedPoint::WadMul(q.backstop_out, backstop_price);
    }
  }

  q.next = position;
  q.next.total_reserve_units -= q.reserve_out;
  q.next.total_stable_supply_tracked -= q.net_stable;
  return q;
}

U256 BondRedemptionCap(const CollateralPosition& position, unsigned reserve_decimals,
                       const U256& reserve_price, const U256& unit_price) {
  RequirePrices(reserve_price, unit_price);
  const U256 supply = position.total_stable_supply_tracked;
  if (supply == 0) {
    const U256 reserve18 = FixedPoint::Rescale(position.total_reserve_units, reserve_decimals, FixedPoint::kWadDecimals);
    return FixedPoint::MulDiv(reserve18, reserve_price, unit_price);
  }
  const U256 ratio = ComputeCollateralRatio(position, reserve_decimals, reserve_price, unit_price);
  if (ratio <= Wad()) return 0;
  return FixedPoint::MulDiv(ratio - Wad(), supply, Wad());
}

BondRedemptionQuote QuoteBondRedemption(const CollateralPosition& position, const U256& bond_amount,
                                        unsigned reserve_decimals, const U256& reserve_price, const U256& unit_price) {
  if (bond_amount == 0) throw LedgerError(ErrorCode::ZeroAmount, "bond redemption of zero");
  BondRedemptionQuote q;
  q.collateral_ratio = ComputeCollateralRatio(position, reserve_decimals, reserve_price, unit_price);
  if (q.collateral_ratio <= Wad()) {
    throw LedgerError(ErrorCode::RedemptionCapExceeded, "collateral ratio " + FixedPoint::FormatDecimal(q.collateral_ratio, 18, 4) +
                      " leaves no surplus for bond redemption");
  }
  q.cap = BondRedemptionCap(position, reserve_decimals, reserve_price, unit_price);
  if (bond_amount > q.cap) {
    throw LedgerError(ErrorCode::RedemptionCapExceeded, "bond redemption of " + FixedPoint::FormatDecimal(bond_amount) +
                      " exceeds cap " + FixedPoint::FormatDecimal(q.cap));
  }
  // 1 bond = 1 Stable
  q.stable_out = bond_amount;
  q.next = position;
  q.next.total_stable_supply_tracked += q.stable_out;
  return q;
}
