#include <boost/test/unit_test.hpp>
#include "engine/transitions.hpp"
#include "test_fixtures.hpp"

using namespace TestAccounts;

namespace {
  // Reserve ledger that calls back into the engine while a deposit is being pulled
  class ReentrantLedger : public TokenLedger {
  public:
    explicit ReentrantLedger(InMemoryTokenLedger& inner) : inner_(inner) {}
    void Arm(CollateralEngine* engine) { engine_ = engine; }

    const std::string& Symbol() const override { return inner_.Symbol(); }
    unsigned Decimals() const override { return inner_.Decimals(); }
    U256 BalanceOf(const Address& a) const override { return inner_.BalanceOf(a); }
    U256 Allowance(const Address& o, const Address& s) const override { return inner_.Allowance(o, s); }
    U256 TotalSupply() const override { return inner_.TotalSupply(); }
    void TransferIn(const Address& spender, const Address& from, const Address& to, const U256& amount) override {
      if (engine_) engine_->Mint(from, U256(1));
      inner_.TransferIn(spender, from, to, amount);
    }
    void TransferOut(const Address& from, const Address& to, const U256& amount) override { inner_.TransferOut(from, to, amount); }
    void Mint(const Address& to, const U256& amount) override { inner_.Mint(to, amount); }
    void Burn(const Address& from, const U256& amount) override { inner_.Burn(from, amount); }
  private:
    InMemoryTokenLedger& inner_;
    CollateralEngine* engine_ = nullptr;
  };
}

BOOST_AUTO_TEST_SUITE(collateral_engine_tests)

BOOST_FIXTURE_TEST_CASE(mint_one_btc_at_fifty_thousand, EngineFixture)
{
  FundReserve(kAlice, "1");
  const MintResult r = engine.Mint(kAlice, Units("1", 8));

  BOOST_CHECK_EQUAL(r.gross_stable, Units("50000"));
  BOOST_CHECK_EQUAL(r.fee, Units("250"));
  BOOST_CHECK_EQUAL(r.stable_minted, Units("49750"));
  BOOST_CHECK_EQUAL(vault.Balances().reserve, Units("1", 8));
  BOOST_CHECK_EQUAL(reserve.BalanceOf(kAlice), U256(0));
  BOOST_CHECK_EQUAL(stable.BalanceOf(kAlice), Units("49750"));
  BOOST_CHECK_EQUAL(stable.BalanceOf(kVault), Units("250"));
  BOOST_CHECK_EQUAL(engine.Position().total_reserve_units, Units("1", 8));
  BOOST_CHECK_EQUAL(engine.Position().total_stable_supply_tracked, stable.TotalSupply());
  BOOST_CHECK_EQUAL(engine.CollateralRatio(), Units("1"));
}

BOOST_FIXTURE_TEST_CASE(mint_rejections_leave_state_alone, EngineFixture)
{
  BITRES_CHECK_CODE(engine.Mint(kAlice, U256(0)), ErrorCode::ZeroAmount);
  BITRES_CHECK_CODE(engine.Mint(kAlice, Units("1", 8)), ErrorCode::InsufficientFunds);
  reserve.Mint(kAlice, Units("1", 8));
  BITRES_CHECK_CODE(engine.Mint(kAlice, Units("1", 8)), ErrorCode::InsufficientAllowance);
  reserve.Approve(kAlice, kEngine, Units("1", 8));
  prices.Remove(Asset::Reserve);
  BITRES_CHECK_CODE(engine.Mint(kAlice, Units("1", 8)), ErrorCode::FeedUnavailable);
  BOOST_CHECK_EQUAL(reserve.BalanceOf(kAlice), Units("1", 8));
  BOOST_CHECK_EQUAL(engine.Position().total_reserve_units, U256(0));
  BOOST_CHECK_EQUAL(stable.TotalSupply(), U256(0));
}

BOOST_FIXTURE_TEST_CASE(fully_backed_redemption_pays_reserve_only, ZeroFeeEngineFixture)
{
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  ApproveStable(kAlice);
  prices.Set(Asset::Reserve, Units("100000"));

  const RedemptionQuote q = engine.Redeem(kAlice, Units("10000"));
  BOOST_CHECK(q.tier == RedemptionTier::FullyBacked);
  BOOST_CHECK_EQUAL(q.reserve_out, Units("0.1", 8));
  BOOST_CHECK_EQUAL(q.bond_out, U256(0));
  BOOST_CHECK_EQUAL(q.backstop_out, U256(0));
  BOOST_CHECK_EQUAL(reserve.BalanceOf(kAlice), Units("0.1", 8));
  BOOST_CHECK_EQUAL(stable.TotalSupply(), Units("40000"));
  BOOST_CHECK_EQUAL(engine.Position().total_stable_supply_tracked, Units("40000"));
  BOOST_CHECK_EQUAL(engine.Position().total_reserve_units, Units("0.9", 8));
}

BOOST_FIXTURE_TEST_CASE(half_backed_redemption_splits_reserve_and_bonds, ZeroFeeEngineFixture)
{
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  ApproveStable(kAlice);
  prices.Set(Asset::Reserve, Units("25000"));
  prices.Set(Asset::Bond, Units("1"));
  BOOST_CHECK_EQUAL(engine.CollateralRatio(), Units("0.5"));

  const RedemptionQuote q = engine.Redeem(kAlice, Units("1000"));
  BOOST_CHECK(q.tier == RedemptionTier::BondAtMarket);
  BOOST_CHECK_EQUAL(q.reserve_value, Units("500"));
  BOOST_CHECK_EQUAL(q.reserve_out, Units("0.02", 8));
  BOOST_CHECK_EQUAL(q.bond_out, Units("500"));
  BOOST_CHECK_EQUAL(q.bond_value, Units("500"));
  BOOST_CHECK_EQUAL(bond.BalanceOf(kAlice), Units("500"));
  BOOST_CHECK_EQUAL(reserve.BalanceOf(kAlice), Units("0.02", 8));
  BOOST_CHECK_EQUAL(vault.Balances().reserve, Units("0.98", 8));
}

BOOST_FIXTURE_TEST_CASE(bond_below_floor_draws_backstop, ZeroFeeEngineFixture)
{
  params.SetParam(kAdmin, ParamType::BondFloorPrice, Units("1"));
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  ApproveStable(kAlice);
  backstop.Mint(kVault, Units("1000"));
  prices.Set(Asset::Reserve, Units("25000"));
  prices.Set(Asset::Bond, Units("0.5"));
  prices.Set(Asset::Backstop, Units("2"));

  const RedemptionQuote q = engine.Redeem(kAlice, Units("1000"));
  BOOST_CHECK(q.tier == RedemptionTier::BondAtFloorWithBackstop);
  BOOST_CHECK_EQUAL(q.bond_out, Units("250"));
  BOOST_CHECK_EQUAL(q.backstop_out, Units("125"));
  BOOST_CHECK_EQUAL(q.reserve_value + q.bond_value + q.backstop_value, q.net_value);
  BOOST_CHECK_EQUAL(backstop.BalanceOf(kAlice), Units("125"));
  BOOST_CHECK_EQUAL(vault.Balances().backstop, Units("875"));
}

BOOST_FIXTURE_TEST_CASE(bond_floor_is_valued_at_the_stable_price, ZeroFeeEngineFixture)
{
  params.SetParam(kAdmin, ParamType::BondFloorPrice, Units("0.98"));
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  prices.Set(Asset::Reserve, Units("25000"));
  prices.Set(Asset::Bond, Units("0.9975"));
  prices.Set(Asset::Backstop, Units("2"));

  // 0.98 Stable at $0.95 is $0.931, under the bond price
  prices.Set(Asset::Stable, Units("0.95"));
  BOOST_CHECK(engine.QuoteRedeem(Units("1000")).tier == RedemptionTier::BondAtMarket);

  // 0.98 Stable at $1.05 is $1.029, over the bond price
  prices.Set(Asset::Stable, Units("1.05"));
  const RedemptionQuote q = engine.QuoteRedeem(Units("1000"));
  BOOST_CHECK(q.tier == RedemptionTier::BondAtFloorWithBackstop);
  BOOST_CHECK_EQUAL(q.reserve_value, Units("500"));
  BOOST_CHECK_EQUAL(q.bond_value, FixedPoint::WadMul(q.bond_out, Units("1.029")));
  BOOST_CHECK_GT(q.backstop_out, U256(0));
  BOOST_CHECK_LE(U256(q.net_value - (q.reserve_value + q.bond_value + q.backstop_value)), U256(10));

  prices.Remove(Asset::Stable);
  BITRES_CHECK_CODE(engine.QuoteRedeem(Units("1000")), ErrorCode::FeedUnavailable);
}

BOOST_FIXTURE_TEST_CASE(backstop_shortfall_aborts_redemption, ZeroFeeEngineFixture)
{
  params.SetParam(kAdmin, ParamType::BondFloorPrice, Units("1"));
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  ApproveStable(kAlice);
  backstop.Mint(kVault, Units("10"));
  prices.Set(Asset::Reserve, Units("25000"));
  prices.Set(Asset::Bond, Units("0.5"));
  prices.Set(Asset::Backstop, Units("2"));

  BITRES_CHECK_CODE(engine.Redeem(kAlice, Units("1000")), ErrorCode::InsufficientFunds);
  BOOST_CHECK_EQUAL(stable.BalanceOf(kAlice), Units("50000"));
  BOOST_CHECK_EQUAL(backstop.BalanceOf(kVault), Units("10"));
}

BOOST_AUTO_TEST_CASE(tier_values_add_up_across_prices)
{
  CollateralPosition position;
  position.total_reserve_units = Units("3", 8);
  position.total_stable_supply_tracked = Units("200000");
  for (const char* bond_price : {"0.2", "0.73", "0.999", "1", "1.4"}) {
    RedemptionInputs in;
    in.stable_amount = Units("12345.678");
    in.reserve_decimals = 8;
    in.reserve_price = Units("41234.5");
    in.unit_price = Units("1.02");
    in.redeem_fee_bps = 30;
    in.bond_floor_price = Units("0.95");
    in.bond_price = Units(bond_price);
    in.backstop_price = Units("3.3");
    const RedemptionQuote q = QuoteRedemption(position, in);
    BOOST_CHECK(q.collateral_ratio < FixedPoint::Wad());
    const U256 paid = q.reserve_value + q.bond_value + q.backstop_value;
    BOOST_CHECK_LE(paid, q.net_value);
    // flooring loses at most a few wei per leg
    BOOST_CHECK_LE(q.net_value - paid, Units("0.000001"));
    const bool below_floor = Units(bond_price) < in.bond_floor_price;
    BOOST_CHECK(q.tier == (below_floor ? RedemptionTier::BondAtFloorWithBackstop : RedemptionTier::BondAtMarket));
  }
}

BOOST_FIXTURE_TEST_CASE(round_trip_never_returns_more_than_deposited, EngineFixture)
{
  FundReserve(kAlice, "2");
  const MintResult m = engine.Mint(kAlice, Units("2", 8));
  ApproveStable(kAlice);
  const RedemptionQuote q = engine.Redeem(kAlice, m.stable_minted);
  BOOST_CHECK(q.tier == RedemptionTier::FullyBacked);
  BOOST_CHECK_LT(q.reserve_out, Units("2", 8));
  // two 50 bps fees
  const U256 expected_max = FixedPoint::ApplyBps(FixedPoint::ApplyBps(Units("2", 8), 9950), 9950);
  BOOST_CHECK_LE(q.reserve_out, expected_max);
  BOOST_CHECK_EQUAL(stable.BalanceOf(kAlice), U256(0));
  BOOST_CHECK_EQUAL(stable.BalanceOf(kVault), m.fee + q.fee);
  BOOST_CHECK_EQUAL(engine.Position().total_stable_supply_tracked, stable.TotalSupply());
}

BOOST_FIXTURE_TEST_CASE(redeem_rejections, ZeroFeeEngineFixture)
{
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  BITRES_CHECK_CODE(engine.Redeem(kAlice, U256(0)), ErrorCode::ZeroAmount);
  BITRES_CHECK_CODE(engine.Redeem(kAlice, Units("100")), ErrorCode::InsufficientAllowance);
  ApproveStable(kAlice);
  BITRES_CHECK_CODE(engine.Redeem(kAlice, Units("50001")), ErrorCode::InsufficientFunds);
  BITRES_CHECK_CODE(engine.Redeem(kBob, Units("1")), ErrorCode::InsufficientFunds);
  // under-collateralized with no bond price available
  prices.Set(Asset::Reserve, Units("20000"));
  BITRES_CHECK_CODE(engine.Redeem(kAlice, Units("1")), ErrorCode::FeedUnavailable);
  BOOST_CHECK_EQUAL(stable.BalanceOf(kAlice), Units("50000"));
}

BOOST_FIXTURE_TEST_CASE(pause_blocks_requests, EngineFixture)
{
  FundReserve(kAlice, "1");
  BITRES_CHECK_CODE(engine.Pause(kMallory), ErrorCode::Unauthorized);
  engine.Pause(kAdmin);
  BOOST_CHECK(engine.IsPaused());
  BITRES_CHECK_CODE(engine.Mint(kAlice, Units("1", 8)), ErrorCode::Paused);
  BITRES_CHECK_CODE(engine.Redeem(kAlice, Units("1")), ErrorCode::Paused);
  BITRES_CHECK_CODE(engine.RedeemBond(kAlice, Units("1")), ErrorCode::Paused);
  BITRES_CHECK_CODE(engine.Unpause(kMallory), ErrorCode::Unauthorized);
  engine.Unpause(kAdmin);
  BOOST_CHECK_NO_THROW(engine.Mint(kAlice, Units("1", 8)));
}

BOOST_AUTO_TEST_CASE(reentrant_mint_is_rejected)
{
  ManualClock clock;
  FixedPrices prices;
  prices.Set(Asset::Reserve, Units("50000"));
  prices.Set(Asset::UnitOfAccount, Units("1"));
  InMemoryTokenLedger reserve_inner("WBTC", 8), stable("BTD", 18), bond("BTB", 18), backstop("BRS", 18);
  ReentrantLedger reserve(reserve_inner);
  ParameterStore params(kAdmin);
  ReserveVault vault(kVault, reserve, backstop, stable);
  CollateralEngine engine(CollateralEngineWiring{kEngine, kAdmin, reserve, stable, bond, vault, prices, params, clock});
  vault.BindEngine(kEngine);
  reserve_inner.Mint(kAlice, Units("1", 8));
  reserve_inner.Approve(kAlice, kEngine, Units("1", 8));
  reserve.Arm(&engine);

  BITRES_CHECK_CODE(engine.Mint(kAlice, Units("1", 8)), ErrorCode::ReentrantCall);
  BOOST_CHECK_EQUAL(stable.TotalSupply(), U256(0));
  BOOST_CHECK_EQUAL(reserve_inner.BalanceOf(kAlice), Units("1", 8));

  // the guard is released after the failed request
  reserve.Arm(nullptr);
  BOOST_CHECK_NO_THROW(engine.Mint(kAlice, Units("1", 8)));
}

BOOST_FIXTURE_TEST_CASE(bond_redemption_respects_cap, ZeroFeeEngineFixture)
{
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  FundBond(kBob, "100000");
  prices.Set(Asset::Reserve, Units("100000"));
  BOOST_CHECK_EQUAL(engine.CurrentBondRedemptionCap(), Units("50000"));

  BITRES_CHECK_CODE(engine.RedeemBond(kBob, Units("60000")), ErrorCode::RedemptionCapExceeded);
  const BondRedemptionResult r = engine.RedeemBond(kBob, Units("10000"));
  BOOST_CHECK_EQUAL(r.stable_out, Units("10000"));
  BOOST_CHECK_EQUAL(stable.BalanceOf(kBob), Units("10000"));
  BOOST_CHECK_EQUAL(bond.BalanceOf(kBob), Units("90000"));
  BOOST_CHECK_EQUAL(bond.TotalSupply(), Units("90000"));
  BOOST_CHECK_EQUAL(engine.Position().total_stable_supply_tracked, Units("60000"));

  prices.Set(Asset::Reserve, Units("50000"));
  BITRES_CHECK_CODE(engine.RedeemBond(kBob, Units("1")), ErrorCode::RedemptionCapExceeded);
}

BOOST_FIXTURE_TEST_CASE(bond_queue_is_served_in_arrival_order, ZeroFeeEngineFixture)
{
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  prices.Set(Asset::Reserve, Units("100000"));
  FundBond(kAlice, "30000");
  FundBond(kBob, "30000");
  FundBond(kCarol, "10000");

  const uint64_t unfunded = engine.EnqueueBondRedemption(kMallory, Units("5000"));
  const uint64_t first = engine.EnqueueBondRedemption(kAlice, Units("30000"));
  engine.EnqueueBondRedemption(kBob, Units("30000"));
  engine.EnqueueBondRedemption(kCarol, Units("10000"));
  BOOST_CHECK_EQUAL(engine.PendingBondRequests(), 4u);

  const std::vector<BondQueueOutcome> outcomes = engine.ProcessBondQueue(10);
  BOOST_REQUIRE_EQUAL(outcomes.size(), 2u);
  BOOST_CHECK_EQUAL(outcomes[0].ticket, unfunded);
  BOOST_CHECK(!outcomes[0].served);
  BOOST_CHECK(!outcomes[0].error.empty());
  BOOST_CHECK_EQUAL(outcomes[1].ticket, first);
  BOOST_CHECK(outcomes[1].served);

  // Bob no longer fits; Carol would, but may not jump the queue
  BOOST_CHECK_EQUAL(engine.PendingBondRequests(), 2u);
  BOOST_CHECK_EQUAL(engine.PendingBondQueue().front().caller, kBob);
  BOOST_CHECK_EQUAL(stable.BalanceOf(kCarol), U256(0));
  BOOST_CHECK_EQUAL(engine.CurrentBondRedemptionCap(), Units("20000"));

  prices.Set(Asset::Reserve, Units("200000"));
  const auto rest = engine.ProcessBondQueue(1);
  BOOST_REQUIRE_EQUAL(rest.size(), 1u);
  BOOST_CHECK(rest[0].served);
  BOOST_CHECK_EQUAL(engine.PendingBondRequests(), 1u);
  BITRES_CHECK_CODE(engine.EnqueueBondRedemption(kCarol, U256(0)), ErrorCode::ZeroAmount);
}

BOOST_FIXTURE_TEST_CASE(snapshot_restores_engine_state, EngineFixture)
{
  FundReserve(kAlice, "1");
  engine.Mint(kAlice, Units("1", 8));
  FundBond(kBob, "10");
  engine.EnqueueBondRedemption(kBob, Units("10"));
  const nlohmann::json saved = engine.Snapshot();

  prices.Set(Asset::Reserve, Units("100000"));
  BOOST_CHECK_EQUAL(engine.ProcessBondQueue(5).size(), 1u);
  engine.Pause(kAdmin);
  engine.Restore(saved);
  BOOST_CHECK(!engine.IsPaused());
  BOOST_CHECK_EQUAL(engine.PendingBondRequests(), 1u);
  BOOST_CHECK_EQUAL(engine.Snapshot().dump(), saved.dump());
}

BOOST_AUTO_TEST_SUITE_END()
