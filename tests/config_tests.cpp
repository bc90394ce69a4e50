#include <boost/test/unit_test.hpp>
#include <stdexcept>
#include "common/config_manager.hpp"
#include "config/system_config.hpp"
#include "test_fixtures.hpp"

namespace {
  struct ConfigFixture {
    ConfigFixture() { ConfigManager::Clear(); }
    ~ConfigFixture() { ConfigManager::Clear(); }
  };
}

BOOST_FIXTURE_TEST_SUITE(config_tests, ConfigFixture)

BOOST_AUTO_TEST_CASE(typed_getters_fall_back_to_defaults)
{
  ConfigManager::Set("BITRES_TEST_BOOL", "yes");
  ConfigManager::Set("BITRES_TEST_BAD_BOOL", "maybe");
  ConfigManager::Set("BITRES_TEST_U64", "12x");
  ConfigManager::Set("BITRES_TEST_DECIMAL", "0.98");
  ConfigManager::Set("BITRES_TEST_LIST", " a; b ;;c ");

  BOOST_CHECK(ConfigManager::GetBoolOr("BITRES_TEST_BOOL", false));
  BOOST_CHECK(ConfigManager::GetBoolOr("BITRES_TEST_BAD_BOOL", true));
  BOOST_CHECK_EQUAL(ConfigManager::GetUint64Or("BITRES_TEST_U64", 7), 7u);
  BOOST_CHECK_EQUAL(ConfigManager::GetDecimalOr("BITRES_TEST_DECIMAL", 0), Units("0.98"));
  BOOST_CHECK_EQUAL(ConfigManager::GetDecimalOr("BITRES_TEST_MISSING", 5), U256(5));

  const auto items = ConfigManager::GetListOr("BITRES_TEST_LIST", ';', {});
  BOOST_REQUIRE_EQUAL(items.size(), 3u);
  BOOST_CHECK_EQUAL(items[0], "a");
  BOOST_CHECK_EQUAL(items[1], "b");
  BOOST_CHECK_EQUAL(items[2], "c");

  ConfigManager::Set("BITRES_TEST_DECIMAL", "1.2.3");
  BOOST_CHECK_THROW(ConfigManager::GetDecimalOr("BITRES_TEST_DECIMAL", 0), std::invalid_argument);
  BOOST_CHECK_THROW(ConfigManager::GetOrThrow("BITRES_TEST_MISSING"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(feed_specs)
{
  const FeedSpec fixed = ParseFeedSpec("RESERVE#0", "static:50000.5");
  BOOST_CHECK(fixed.kind == FeedSpec::Kind::Static);
  BOOST_CHECK_EQUAL(fixed.static_price, Units("50000.5"));

  const FeedSpec http = ParseFeedSpec("RESERVE#1", "https://api.example.com/price|/bitcoin/usd|8");
  BOOST_CHECK(http.kind == FeedSpec::Kind::Http);
  BOOST_CHECK_EQUAL(http.http.url, "https://api.example.com/price");
  BOOST_CHECK_EQUAL(http.http.json_pointer, "/bitcoin/usd");
  BOOST_REQUIRE(http.http.raw_decimals.has_value());
  BOOST_CHECK_EQUAL(*http.http.raw_decimals, 8u);

  const FeedSpec plain = ParseFeedSpec("PCE", "http://localhost:8080/pce|/value");
  BOOST_CHECK_EQUAL(plain.http.url, "http://localhost:8080/pce");
  BOOST_CHECK(!plain.http.raw_decimals.has_value());

  BOOST_CHECK_THROW(ParseFeedSpec("x", "50000"), std::invalid_argument);
  BOOST_CHECK_THROW(ParseFeedSpec("x", "ftp:host|/p"), std::invalid_argument);
  BOOST_CHECK_THROW(ParseFeedSpec("x", "http://host"), std::invalid_argument);
  BOOST_CHECK_THROW(ParseFeedSpec("x", "static:abc"), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(system_config_defaults)
{
  const SystemConfig cfg = LoadSystemConfig();
  BOOST_CHECK_EQUAL(cfg.twap_period_s, 1800u);
  BOOST_CHECK_EQUAL(cfg.reserve_decimals, 8u);
  BOOST_CHECK_EQUAL(cfg.params.mint_fee_bps, 50u);
  BOOST_CHECK_EQUAL(cfg.params.deviation_tolerance_bps, 100u);
  BOOST_CHECK_EQUAL(cfg.admin_address, TestAccounts::kAdmin);
  BOOST_CHECK_EQUAL(cfg.engine_address, TestAccounts::kEngine);
  BOOST_CHECK_EQUAL(cfg.vault_address, TestAccounts::kVault);

  const PoolSpec& reserve_pool = cfg.pools.at(Asset::Reserve);
  BOOST_CHECK_EQUAL(reserve_pool.pair_id, "WBTC/USDC");
  BOOST_CHECK_EQUAL(reserve_pool.reserve0, Units("100", 8));
  BOOST_CHECK_EQUAL(reserve_pool.reserve1, Units("5000000", 6));
  BOOST_CHECK_EQUAL(cfg.pools.at(Asset::Bond).pair_id, "BTB/BTD");
  BOOST_CHECK_EQUAL(cfg.pools.at(Asset::Backstop).pair_id, "BRS/BTD");

  BOOST_REQUIRE_EQUAL(cfg.feeds.at(Asset::Reserve).size(), 1u);
  BOOST_CHECK_EQUAL(cfg.feeds.at(Asset::Reserve)[0].name, "RESERVE#0");
  BOOST_CHECK_EQUAL(cfg.feeds.at(Asset::Reserve)[0].static_price, Units("50000"));
  BOOST_CHECK(cfg.feeds.count(Asset::Stable) == 0 || cfg.feeds.at(Asset::Stable).empty());
}

BOOST_AUTO_TEST_CASE(system_config_overrides)
{
  ConfigManager::Set("ADMIN_PRIVATE_KEY", "0x0000000000000000000000000000000000000000000000000000000000000001");
  ConfigManager::Set("FEED_RESERVE", "static:50000;static:50100");
  ConfigManager::Set("POOL_RESERVE", "10,600000");
  ConfigManager::Set("BOND_FLOOR_PRICE", "0.9");
  ConfigManager::Set("MAX_BOND_RATE_BPS", "250");

  const SystemConfig cfg = LoadSystemConfig();
  BOOST_CHECK_EQUAL(cfg.admin_address, "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
  BOOST_REQUIRE_EQUAL(cfg.feeds.at(Asset::Reserve).size(), 2u);
  BOOST_CHECK_EQUAL(cfg.feeds.at(Asset::Reserve)[1].name, "RESERVE#1");
  BOOST_CHECK_EQUAL(cfg.pools.at(Asset::Reserve).reserve1, Units("600000", 6));
  BOOST_CHECK_EQUAL(cfg.params.bond_floor_price, Units("0.9"));
  BOOST_CHECK_EQUAL(cfg.params.max_bond_rate_bps, 250u);
}

BOOST_AUTO_TEST_CASE(system_config_rejects_bad_values)
{
  ConfigManager::Set("MINT_FEE_BPS", "5000");
  BITRES_CHECK_CODE(LoadSystemConfig(), ErrorCode::InvalidParameter);

  ConfigManager::Clear();
  ConfigManager::Set("POOL_BOND", "100000");
  BOOST_CHECK_THROW(LoadSystemConfig(), std::invalid_argument);

  ConfigManager::Clear();
  ConfigManager::Set("ENGINE_ADDRESS", "0x1234");
  BOOST_CHECK_THROW(LoadSystemConfig(), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
