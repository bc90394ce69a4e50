#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include "test_fixtures.hpp"

using namespace TestAccounts;

BOOST_FIXTURE_TEST_SUITE(reserve_vault_tests, EngineFixture)

BOOST_AUTO_TEST_CASE(only_the_bound_engine_moves_funds)
{
  reserve.Mint(kVault, Units("2", 8));
  backstop.Mint(kVault, Units("100"));
  BITRES_CHECK_CODE(vault.WithdrawReserve(kMallory, kMallory, Units("1", 8)), ErrorCode::Unauthorized);
  BITRES_CHECK_CODE(vault.Compensate(kMallory, kMallory, Units("1")), ErrorCode::Unauthorized);
  BITRES_CHECK_CODE(vault.DepositReserve(kAlice, kAlice, Units("1", 8)), ErrorCode::Unauthorized);
  BITRES_CHECK_CODE(vault.CollectStableFee(kAdmin, kAlice, Units("1")), ErrorCode::Unauthorized);
  BOOST_CHECK_EQUAL(vault.Balances().reserve, Units("2", 8));

  vault.WithdrawReserve(kEngine, kAlice, Units("0.5", 8));
  BOOST_CHECK_EQUAL(reserve.BalanceOf(kAlice), Units("0.5", 8));
  BOOST_CHECK_EQUAL(vault.Balances().reserve, Units("1.5", 8));
}

BOOST_AUTO_TEST_CASE(engine_binding_is_one_time)
{
  BOOST_CHECK_THROW(vault.BindEngine(kMallory), std::logic_error);
  ReserveVault unbound(kVault, reserve, backstop, stable);
  BITRES_CHECK_CODE(unbound.WithdrawReserve(kEngine, kAlice, U256(1)), ErrorCode::Unauthorized);
}

BOOST_AUTO_TEST_CASE(compensate_pays_in_full_or_fails)
{
  backstop.Mint(kVault, Units("10"));
  BITRES_CHECK_CODE(vault.Compensate(kEngine, kAlice, Units("10.000000000000000001")), ErrorCode::InsufficientFunds);
  BOOST_CHECK_EQUAL(backstop.BalanceOf(kAlice), U256(0));
  vault.Compensate(kEngine, kAlice, Units("10"));
  BOOST_CHECK_EQUAL(backstop.BalanceOf(kAlice), Units("10"));
  BOOST_CHECK_EQUAL(vault.Balances().backstop, U256(0));
}

BOOST_AUTO_TEST_CASE(withdrawal_beyond_holdings_fails)
{
  reserve.Mint(kVault, Units("1", 8));
  BITRES_CHECK_CODE(vault.WithdrawReserve(kEngine, kAlice, Units("1.00000001", 8)), ErrorCode::InsufficientFunds);
  BOOST_CHECK_EQUAL(vault.Balances().reserve, Units("1", 8));
}

BOOST_AUTO_TEST_CASE(deposit_pulls_with_engine_allowance)
{
  reserve.Mint(kAlice, Units("1", 8));
  BITRES_CHECK_CODE(vault.DepositReserve(kEngine, kAlice, Units("1", 8)), ErrorCode::InsufficientAllowance);
  reserve.Approve(kAlice, kEngine, Units("0.4", 8));
  vault.DepositReserve(kEngine, kAlice, Units("0.4", 8));
  BOOST_CHECK_EQUAL(reserve.Allowance(kAlice, kEngine), U256(0));
  BOOST_CHECK_EQUAL(vault.Balances().reserve, Units("0.4", 8));
}

BOOST_AUTO_TEST_SUITE_END()
