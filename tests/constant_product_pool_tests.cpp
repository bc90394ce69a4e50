#include <boost/test/unit_test.hpp>
#include "pool/constant_product_pool.hpp"
#include "test_fixtures.hpp"

namespace {
  struct PoolFixture {
    PoolFixture() : pool("WBTC/USDC", PoolToken{"WBTC", 8}, PoolToken{"USDC", 6}, clock) {
      pool.SetReserves(Units("100", 8), Units("5000000", 6));
    }
    ManualClock clock;
    ConstantProductPool pool;
  };
}

BOOST_FIXTURE_TEST_SUITE(constant_product_pool_tests, PoolFixture)

BOOST_AUTO_TEST_CASE(spot_price_and_quote)
{
  BOOST_CHECK_EQUAL(pool.SpotPrice0(), Units("50000"));
  // 1 WBTC in, 0.3% fee
  BOOST_CHECK_EQUAL(pool.QuoteOut(true, Units("1", 8)), U256(49357901719ULL));
  BOOST_CHECK_EQUAL(pool.QuoteOut(true, 0), U256(0));

  ConstantProductPool empty("BTD/USDC", PoolToken{"BTD", 18}, PoolToken{"USDC", 6}, clock);
  BOOST_CHECK_EQUAL(empty.QuoteOut(true, Units("1")), U256(0));
  BOOST_CHECK_EQUAL(empty.SpotPrice0(), U256(0));
  BITRES_CHECK_CODE(empty.Swap(true, Units("1")), ErrorCode::ZeroAmount);
}

BOOST_AUTO_TEST_CASE(swap_moves_reserves_and_keeps_k)
{
  const PoolReserves before = pool.Reserves();
  const U256 out = pool.Swap(true, Units("1", 8));
  const PoolReserves after = pool.Reserves();
  BOOST_CHECK_EQUAL(after.reserve0, before.reserve0 + Units("1", 8));
  BOOST_CHECK_EQUAL(after.reserve1, before.reserve1 - out);
  BOOST_CHECK_GE(U256(after.reserve0 * after.reserve1), U256(before.reserve0 * before.reserve1));
  BOOST_CHECK_LT(pool.SpotPrice0(), Units("50000"));

  const U256 back = pool.Swap(false, out);
  BOOST_CHECK_LT(back, Units("1", 8));
}

BOOST_AUTO_TEST_CASE(accumulators_use_the_price_that_held)
{
  const U256 q_price0 = FixedPoint::EncodeQ112(Units("5000000", 6), Units("100", 8));
  BOOST_CHECK_EQUAL(pool.CumulativePriceAccumulators().price0, U256(0));

  clock.Advance(100);
  pool.Sync();
  BOOST_CHECK_EQUAL(pool.CumulativePriceAccumulators().price0, q_price0 * 100);
  BOOST_CHECK_EQUAL(pool.LastSyncTime(), clock.Now());

  // the new reserves only count from the swap onwards
  pool.Swap(true, Units("10", 8));
  BOOST_CHECK_EQUAL(pool.CumulativePriceAccumulators().price0, q_price0 * 100);
  const PoolReserves moved = pool.Reserves();
  clock.Advance(50);
  pool.Sync();
  BOOST_CHECK_EQUAL(pool.CumulativePriceAccumulators().price0,
                    q_price0 * 100 + FixedPoint::EncodeQ112(moved.reserve1, moved.reserve0) * 50);
}

BOOST_AUTO_TEST_CASE(snapshot_restore)
{
  clock.Advance(30);
  pool.Sync();
  const nlohmann::json saved = pool.Snapshot();
  pool.Swap(true, Units("5", 8));
  clock.Advance(30);
  pool.Sync();
  pool.Restore(saved);
  BOOST_CHECK_EQUAL(pool.Snapshot().dump(), saved.dump());
  BOOST_CHECK_EQUAL(pool.SpotPrice0(), Units("50000"));
}

BOOST_AUTO_TEST_SUITE_END()
