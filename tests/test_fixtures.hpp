#pragma once
#include <map>
#include "common/clock.hpp"
#include "common/errors.hpp"
#include "engine/collateral_engine.hpp"
#include "governance/parameter_store.hpp"
#include "oracle/trusted_price.hpp"
#include "protocols/in_memory_token_ledger.hpp"
#include "vault/reserve_vault.hpp"

namespace TestAccounts {
  const Address kAdmin = "0x00000000000000000000000000000000000a11ce";
  const Address kEngine = "0x00000000000000000000000000000000000e0617";
  const Address kVault = "0x000000000000000000000000000000000000ba17";
  const Address kAlice = "0x1111111111111111111111111111111111111111";
  const Address kBob = "0x2222222222222222222222222222222222222222";
  const Address kCarol = "0x3333333333333333333333333333333333333333";
  const Address kMallory = "0x6666666666666666666666666666666666666666";
}

inline U256 Units(const char* text, unsigned decimals = 18) { return FixedPoint::ParseDecimal(text, decimals); }

inline bool HasCode(const LedgerError& e, ErrorCode code) { return e.Code() == code; }

#define BITRES_CHECK_CODE(expr, code) \
  BOOST_CHECK_EXCEPTION(expr, LedgerError, [](const LedgerError& e) { return HasCode(e, code); })

// Prices set directly by the test
class FixedPrices : public TrustedPriceSource {
public:
  void Set(Asset asset, const U256& value) { prices_[asset] = value; }
  void Remove(Asset asset) { prices_.erase(asset); }
  TrustedPrice GetTrustedPrice(Asset asset) const override {
    auto it = prices_.find(asset);
    if (it == prices_.end()) throw LedgerError(ErrorCode::FeedUnavailable, std::string("no test price for ") + AssetName(asset));
    return TrustedPrice{asset, it->second, 0};
  }
private:
  std::map<Asset, U256> prices_;
};

inline GovernableParameters ZeroFeeParams() {
  GovernableParameters p;
  p.mint_fee_bps = 0;
  p.redeem_fee_bps = 0;
  return p;
}

// Engine, vault and ledgers over FixedPrices; reserve at $50,000, unit at $1
struct EngineFixture {
  explicit EngineFixture(const GovernableParameters& initial = GovernableParameters())
    : reserve("WBTC", 8), stable("BTD", 18), bond("BTB", 18), backstop("BRS", 18),
      params(TestAccounts::kAdmin, initial),
      vault(TestAccounts::kVault, reserve, backstop, stable),
      engine(CollateralEngineWiring{TestAccounts::kEngine, TestAccounts::kAdmin, reserve, stable, bond, vault,
                                    prices, params, clock}) {
    vault.BindEngine(TestAccounts::kEngine);
    prices.Set(Asset::Reserve, Units("50000"));
    prices.Set(Asset::UnitOfAccount, Units("1"));
    prices.Set(Asset::Stable, Units("1"));
  }

  void FundReserve(const Address& who, const char* amount) {
    reserve.Mint(who, Units(amount, 8));
    reserve.Approve(who, TestAccounts::kEngine, FixedPoint::MaxU256());
  }

  void ApproveStable(const Address& who) { stable.Approve(who, TestAccounts::kEngine, FixedPoint::MaxU256()); }

  void FundBond(const Address& who, const char* amount) {
    bond.Mint(who, Units(amount));
    bond.Approve(who, TestAccounts::kEngine, FixedPoint::MaxU256());
  }

  ManualClock clock;
  FixedPrices prices;
  InMemoryTokenLedger reserve;
  InMemoryTokenLedger stable;
  InMemoryTokenLedger bond;
  InMemoryTokenLedger backstop;
  ParameterStore params;
  ReserveVault vault;
  CollateralEngine engine;
};

struct ZeroFeeEngineFixture : EngineFixture {
  ZeroFeeEngineFixture() : EngineFixture(ZeroFeeParams()) {}
};
