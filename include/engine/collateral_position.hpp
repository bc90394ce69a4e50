#pragma once
#include <nlohmann/json.hpp>
#include "math/fixed_point.hpp"

// Aggregate collateral accounting, mutated only by CollateralEngine
struct CollateralPosition {
  U256 total_reserve_units = 0;         // reserve asset, native decimals
  U256 total_stable_supply_tracked = 0; // Stable, 18 decimals

  nlohmann::json ToJson() const {
    return {{"total_reserve_units", total_reserve_units.str()},
            {"total_stable_supply_tracked", total_stable_supply_tracked.str()}};
  }

  static CollateralPosition FromJson(const nlohmann::json& j) {
    CollateralPosition p;
    p.total_reserve_units = FixedPoint::ParseInteger(j.at("total_reserve_units").get<std::string>());
    p.total_stable_supply_tracked = FixedPoint::ParseInteger(j.at("total_stable_supply_tracked").get<std::string>());
    return p;
  }
};
