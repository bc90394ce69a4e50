#pragma once
#include <string>
#include <nlohmann/json.hpp>

class TimeWeightedPriceOracle;
class PriceValidator;
class CollateralEngine;
class ReserveVault;

// Per pair: observation state. Per asset: trusted price or the failure code.
// Plus collateral ratio, position and vault balances.
nlohmann::json BuildHealthReport(const TimeWeightedPriceOracle& twap,
                                 const PriceValidator& validator,
                                 const CollateralEngine& engine,
                                 const ReserveVault& vault);

// Human-readable rendering for the console
std::string FormatHealthReport(const nlohmann::json& report);
