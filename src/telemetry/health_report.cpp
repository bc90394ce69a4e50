#include "telemetry/health_report.hpp"
#include "common/errors.hpp"
#include "engine/collateral_engine.hpp"
#include "math/fixed_point.hpp"
#include "oracle/price_validator.hpp"
#include "oracle/twap_oracle.hpp"
#include "vault/reserve_vault.hpp"
#include <sstream>

nlohmann::json BuildHealthReport(const TimeWeightedPriceOracle& twap,
                                 const PriceValidator& validator,
                                 const CollateralEngine& engine,
                                 const ReserveVault& vault) {
  nlohmann::json report;
  nlohmann::json pairs = nlohmann::json::object();
  for (const auto& pair : twap.TrackedPairs()) {
    const ObservationInfo info = twap.GetObservationInfo(pair);
    pairs[pair] = {
      {"has_observations", info.has_observations},
      {"needs_update", twap.NeedsUpdate(pair)},
      {"ready", twap.IsReady(pair)},
      {"older_timestamp", info.older_timestamp},
      {"newer_timestamp", info.newer_timestamp},
      {"elapsed", info.elapsed}
    };
  }
  report["pairs"] = pairs;

  nlohmann::json prices = nlohmann::json::object();
  for (Asset asset : AllAssets()) {
    if (!validator.HasRoute(asset)) continue;
    try {
      const TrustedPrice p = validator.GetTrustedPrice(asset);
      prices[AssetName(asset)] = {{"ok", true}, {"price", FixedPoint::FormatDecimal(p.value, 18, 8)}};
    } catch (const LedgerError& e) {
      prices[AssetName(asset)] = {{"ok", false}, {"code", ErrorCodeName(e.Code())}, {"message", e.what()}};
    }
  }
  report["prices"] = prices;

  try {
    const U256 ratio = engine.CollateralRatio();
    report["collateral_ratio"] = ratio == FixedPoint::MaxU256() ? std::string("infinite") : FixedPoint::FormatDecimal(ratio, 18, 6);
  } catch (const LedgerError& e) {
    report["collateral_ratio"] = std::string("unavailable: ") + ErrorCodeName(e.Code());
  }
  report["paused"] = engine.IsPaused();
  report["position"] = engine.Position().ToJson();
  report["pending_bond_requests"] = engine.PendingBondRequests();

  const VaultBalances balances = vault.Balances();
  report["vault"] = {
    {"reserve", balances.reserve.str()},
    {"backstop", balances.backstop.str()},
    {"stable_held", balances.stable_held.str()}
  };
  return report;
}

std::string FormatHealthReport(const nlohmann::json& report) {
  std::ostringstream oss;
  oss << "=== Ledger health ===\n";
  for (const auto& item : report.at("pairs").items()) {
    const auto& p = item.value();
    oss << "  pair " << item.key()
        << (p.at("ready").get<bool>() ? " READY" : " NOT READY")
        << (p.at("needs_update").get<bool>() ? " (needs update)" : "")
        << " older=" << p.at("older_timestamp").get<uint64_t>()
        << " newer=" << p.at("newer_timestamp").get<uint64_t>()
        << " elapsed=" << p.at("elapsed").get<uint64_t>() << "s\n";
  }
  for (const auto& item : report.at("prices").items()) {
    const auto& p = item.value();
    oss << "  price " << item.key() << ": ";
    if (p.at("ok").get<bool>()) oss << p.at("price").get<std::string>() << " USD\n";
    else oss << p.at("code").get<std::string>() << "\n";
  }
  oss << "  collateral ratio: " << report.at("collateral_ratio").get<std::string>() << "\n";
  oss << "  paused: " << (report.at("paused").get<bool>() ? "yes" : "no") << "\n";
  oss << "  pending bond requests: " << report.at("pending_bond_requests").get<size_t>() << "\n";
  return oss.str();
}
