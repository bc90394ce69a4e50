#include "governance/parameter_store.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "telemetry/structured_logger.hpp"
#include <algorithm>
#include <cctype>

const char* ParamTypeName(ParamType type) {
  switch (type) {
    case ParamType::MintFeeBps: return "mint_fee_bps";
    case ParamType::RedeemFeeBps: return "redeem_fee_bps";
    case ParamType::BondFloorPrice: return "bond_floor_price";
    case ParamType::MaxBondRateBps: return "max_bond_rate_bps";
    case ParamType::DeviationToleranceBps: return "deviation_tolerance_bps";
  }
  return "unknown";
}

ParamType ParseParamType(const std::string& text) {
  std::string s = text;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  for (ParamType t : {ParamType::MintFeeBps, ParamType::RedeemFeeBps, ParamType::BondFloorPrice,
                      ParamType::MaxBondRateBps, ParamType::DeviationToleranceBps}) {
    if (s == ParamTypeName(t)) return t;
  }
  throw LedgerError(ErrorCode::InvalidParameter, "unknown parameter '" + text + "'");
}

static void RequireAtMost(ParamType type, const U256& value, const U256& bound) {
  if (value > bound) {
    throw LedgerError(ErrorCode::InvalidParameter, std::string(ParamTypeName(type)) + "=" + value.str() +
                      " exceeds " + bound.str());
  }
}

void ParameterStore::Validate(ParamType type, const U256& value) {
  switch (type) {
    case ParamType::MintFeeBps:
    case ParamType::RedeemFeeBps:
      RequireAtMost(type, value, kMaxFeeBps);
      break;
    case ParamType::BondFloorPrice:
      RequireAtMost(type, value, FixedPoint::Wad() * 10);
      break;
    case ParamType::MaxBondRateBps:
      RequireAtMost(type, value, kMaxBondRateBps);
      break;
    case ParamType::DeviationToleranceBps:
      if (value == 0) throw LedgerError(ErrorCode::InvalidParameter, "deviation_tolerance_bps must be at least 1");
      RequireAtMost(type, value, kMaxDeviationToleranceBps);
      break;
  }
}

void ParameterStore::Validate(const GovernableParameters& p) {
  Validate(ParamType::MintFeeBps, p.mint_fee_bps);
  Validate(ParamType::RedeemFeeBps, p.redeem_fee_bps);
  Validate(ParamType::BondFloorPrice, p.bond_floor_price);
  Validate(ParamType::MaxBondRateBps, p.max_bond_rate_bps);
  Validate(ParamType::DeviationToleranceBps, p.deviation_tolerance_bps);
}

void ParameterStore::Apply(GovernableParameters& params, ParamType type, const U256& value) {
  switch (type) {
    case ParamType::MintFeeBps: params.mint_fee_bps = value.convert_to<uint64_t>(); break;
    case ParamType::RedeemFeeBps: params.redeem_fee_bps = value.convert_to<uint64_t>(); break;
    case ParamType::BondFloorPrice: params.bond_floor_price = value; break;
    case ParamType::MaxBondRateBps: params.max_bond_rate_bps = value.convert_to<uint64_t>(); break;
    case ParamType::DeviationToleranceBps: params.deviation_tolerance_bps = value.convert_to<uint64_t>(); break;
  }
}

ParameterStore::ParameterStore(const Address& owner, const GovernableParameters& initial)
  : ownership_(owner), params_(initial) {
  Validate(params_);
}

void ParameterStore::SetParam(const Address& caller, ParamType type, const U256& value) {
  SetParamsBatch(caller, {type}, {value});
}

void ParameterStore::SetParamsBatch(const Address& caller, const std::vector<ParamType>& types, const std::vector<U256>& values) {
  ownership_.RequireOwner(caller, "change parameters");
  if (types.size() != values.size()) {
    throw LedgerError(ErrorCode::InvalidParameter, "batch has " + std::to_string(types.size()) + " types and " +
                      std::to_string(values.size()) + " values");
  }
  GovernableParameters next = params_;
  for (size_t i = 0; i < types.size(); ++i) {
    Validate(types[i], values[i]);
    Apply(next, types[i], values[i]);
  }
  params_ = next;
  for (size_t i = 0; i < types.size(); ++i) {
    BITRES_LOG_INFO(std::string("parameter ") + ParamTypeName(types[i]) + " set to " + values[i].str());
    StructuredLogger::Instance().Emit("parameter_changed", {
      {"param", ParamTypeName(types[i])}, {"value", values[i].str()}, {"caller", caller}
    });
  }
}

nlohmann::json ParameterStore::Snapshot() const {
  return {
    {"ownership", ownership_.ToJson()},
    {"mint_fee_bps", params_.mint_fee_bps},
    {"redeem_fee_bps", params_.redeem_fee_bps},
    {"bond_floor_price", params_.bond_floor_price.str()},
    {"max_bond_rate_bps", params_.max_bond_rate_bps},
    {"deviation_tolerance_bps", params_.deviation_tolerance_bps}
  };
}

void ParameterStore::Restore(const nlohmann::json& snapshot) {
  ownership_.FromJson(snapshot.at("ownership"));
  params_.mint_fee_bps = snapshot.at("mint_fee_bps").get<uint64_t>();
  params_.redeem_fee_bps = snapshot.at("redeem_fee_bps").get<uint64_t>();
  params_.bond_floor_price = FixedPoint::ParseInteger(snapshot.at("bond_floor_price").get<std::string>());
  params_.max_bond_rate_bps = snapshot.at("max_bond_rate_bps").get<uint64_t>();
  params_.deviation_tolerance_bps = snapshot.at("deviation_tolerance_bps").get<uint64_t>();
}
