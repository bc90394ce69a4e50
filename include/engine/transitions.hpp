#pragma once
#include <optional>
#include "engine/collateral_position.hpp"

// Pure state transitions: position + inputs -> quote, or LedgerError.
// The engine applies a quote's token effects and then adopts quote.next.

struct MintInputs {
  U256 reserve_amount = 0;   // native decimals
  unsigned reserve_decimals = 8;
  U256 reserve_price = 0;    // USD WAD
  U256 unit_price = 0;       // USD WAD
  uint64_t mint_fee_bps = 0;
};

struct MintQuote {
  U256 gross_stable = 0;
  U256 fee = 0;
  U256 net_stable = 0;
  CollateralPosition next;
};

MintQuote QuoteMint(const CollateralPosition& position, const MintInputs& in);

// WAD ratio of reserve value to outstanding Stable value; MaxU256 when nothing is outstanding
U256 ComputeCollateralRatio(const CollateralPosition& position, unsigned reserve_decimals,
                            const U256& reserve_price, const U256& unit_price);

enum class RedemptionTier { FullyBacked, BondAtMarket, BondAtFloorWithBackstop };

const char* RedemptionTierName(RedemptionTier tier);

struct RedemptionInputs {
  U256 stable_amount = 0;
  unsigned reserve_decimals = 8;
  U256 reserve_price = 0;
  U256 unit_price = 0;
  uint64_t redeem_fee_bps = 0;
  // USD value of the governed floor, which is set in Stable
  U256 bond_floor_price = 0;
  // Required when the position is under-collateralized
  std::optional<U256> bond_price;
  // Required when additionally bond_price < bond_floor_price
  std::optional<U256> backstop_price;
};

struct RedemptionQuote {
  RedemptionTier tier = RedemptionTier::FullyBacked;
  U256 collateral_ratio = 0;
  U256 fee = 0;
  U256 net_stable = 0;
  U256 reserve_out = 0;   // native decimals
  U256 bond_out = 0;
  U256 backstop_out = 0;
  // USD WAD values of each leg
  U256 net_value = 0;
  U256 reserve_value = 0;
  U256 bond_value = 0;    // at market price, or at the floor in the backstop tier
  U256 backstop_value = 0;
  CollateralPosition next;
};

RedemptionQuote QuoteRedemption(const CollateralPosition& position, const RedemptionInputs& in);

struct BondRedemptionQuote {
  U256 collateral_ratio = 0;
  U256 cap = 0;
  U256 stable_out = 0;
  CollateralPosition next;
};

// Stable that may still be issued against surplus collateral: (CR - 1) * supply,
// or the whole reserve value when nothing is outstanding
U256 BondRedemptionCap(const CollateralPosition& position, unsigned reserve_decimals,
                       const U256& reserve_price, const U256& unit_price);

BondRedemptionQuote QuoteBondRedemption(const CollateralPosition& position, const U256& bond_amount,
                                        unsigned reserve_decimals, const U256& reserve_price, const U256& unit_price);
