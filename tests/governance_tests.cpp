#include <boost/test/unit_test.hpp>
#include "governance/ownership.hpp"
#include "governance/parameter_store.hpp"
#include "test_fixtures.hpp"

using namespace TestAccounts;

BOOST_AUTO_TEST_SUITE(governance_tests)

BOOST_AUTO_TEST_CASE(two_step_ownership_transfer)
{
  Ownership ownership(kAdmin);
  BOOST_CHECK(ownership.IsOwner(kAdmin));
  BOOST_CHECK(!ownership.PendingOwner());
  BITRES_CHECK_CODE(ownership.AcceptOwnership(kAlice), ErrorCode::NoPendingOwner);
  BITRES_CHECK_CODE(ownership.TransferOwnership(kMallory, kMallory), ErrorCode::Unauthorized);

  ownership.TransferOwnership(kAdmin, kAlice);
  // a later proposal replaces the earlier one
  ownership.TransferOwnership(kAdmin, kBob);
  BOOST_CHECK_EQUAL(*ownership.PendingOwner(), kBob);
  BITRES_CHECK_CODE(ownership.AcceptOwnership(kAlice), ErrorCode::Unauthorized);
  BOOST_CHECK(ownership.IsOwner(kAdmin));

  ownership.AcceptOwnership(kBob);
  BOOST_CHECK(ownership.IsOwner(kBob));
  BOOST_CHECK(!ownership.IsOwner(kAdmin));
  BOOST_CHECK(!ownership.PendingOwner());
}

BOOST_AUTO_TEST_CASE(ownership_cancel_and_json)
{
  Ownership ownership(kAdmin);
  BITRES_CHECK_CODE(ownership.CancelTransfer(kAdmin), ErrorCode::NoPendingOwner);
  ownership.TransferOwnership(kAdmin, kAlice);
  const nlohmann::json saved = ownership.ToJson();
  ownership.CancelTransfer(kAdmin);
  BOOST_CHECK(!ownership.PendingOwner());

  Ownership restored(kBob);
  restored.FromJson(saved);
  BOOST_CHECK(restored.IsOwner(kAdmin));
  BOOST_CHECK_EQUAL(*restored.PendingOwner(), kAlice);
  // addresses compare case-insensitively
  BOOST_CHECK(restored.IsOwner("0x00000000000000000000000000000000000A11CE"));
}

BOOST_AUTO_TEST_CASE(parameter_defaults_and_bounds)
{
  ParameterStore store(kAdmin);
  const GovernableParameters p = store.Current();
  BOOST_CHECK_EQUAL(p.mint_fee_bps, 50u);
  BOOST_CHECK_EQUAL(p.redeem_fee_bps, 50u);
  BOOST_CHECK_EQUAL(p.bond_floor_price, U256(0));
  BOOST_CHECK_EQUAL(p.max_bond_rate_bps, 0u);
  BOOST_CHECK_EQUAL(p.deviation_tolerance_bps, 100u);

  BITRES_CHECK_CODE(store.SetParam(kAdmin, ParamType::MintFeeBps, U256(1001)), ErrorCode::InvalidParameter);
  BITRES_CHECK_CODE(store.SetParam(kAdmin, ParamType::DeviationToleranceBps, U256(0)), ErrorCode::InvalidParameter);
  BITRES_CHECK_CODE(store.SetParam(kAdmin, ParamType::DeviationToleranceBps, U256(5001)), ErrorCode::InvalidParameter);
  BITRES_CHECK_CODE(store.SetParam(kAdmin, ParamType::MaxBondRateBps, U256(10001)), ErrorCode::InvalidParameter);
  BITRES_CHECK_CODE(store.SetParam(kAdmin, ParamType::BondFloorPrice, Units("10.000000000000000001")), ErrorCode::InvalidParameter);
  BITRES_CHECK_CODE(store.SetParam(kMallory, ParamType::MintFeeBps, U256(10)), ErrorCode::Unauthorized);

  store.SetParam(kAdmin, ParamType::RedeemFeeBps, U256(1000));
  store.SetParam(kAdmin, ParamType::BondFloorPrice, Units("0.98"));
  BOOST_CHECK_EQUAL(store.Current().redeem_fee_bps, 1000u);
  BOOST_CHECK_EQUAL(store.Current().bond_floor_price, Units("0.98"));

  GovernableParameters bad;
  bad.mint_fee_bps = 5000;
  BITRES_CHECK_CODE(ParameterStore rejected(kAdmin, bad), ErrorCode::InvalidParameter);
}

BOOST_AUTO_TEST_CASE(parameter_batch_is_all_or_nothing)
{
  ParameterStore store(kAdmin);
  BITRES_CHECK_CODE(store.SetParamsBatch(kAdmin, {ParamType::MintFeeBps, ParamType::RedeemFeeBps}, {U256(10)}),
                    ErrorCode::InvalidParameter);
  BITRES_CHECK_CODE(store.SetParamsBatch(kAdmin, {ParamType::MintFeeBps, ParamType::RedeemFeeBps}, {U256(10), U256(2000)}),
                    ErrorCode::InvalidParameter);
  BOOST_CHECK_EQUAL(store.Current().mint_fee_bps, 50u);

  store.SetParamsBatch(kAdmin, {ParamType::MintFeeBps, ParamType::MaxBondRateBps}, {U256(10), U256(300)});
  BOOST_CHECK_EQUAL(store.Current().mint_fee_bps, 10u);
  BOOST_CHECK_EQUAL(store.Current().max_bond_rate_bps, 300u);
}

BOOST_AUTO_TEST_CASE(parameter_names_round_trip)
{
  BOOST_CHECK(ParseParamType("mint_fee_bps") == ParamType::MintFeeBps);
  BOOST_CHECK(ParseParamType("BOND_FLOOR_PRICE") == ParamType::BondFloorPrice);
  BITRES_CHECK_CODE(ParseParamType("interest_rate"), ErrorCode::InvalidParameter);
  BOOST_CHECK_EQUAL(ParamTypeName(ParamType::DeviationToleranceBps), std::string("deviation_tolerance_bps"));
}

BOOST_AUTO_TEST_SUITE_END()
