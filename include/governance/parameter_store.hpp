#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "governance/ownership.hpp"
#include "math/fixed_point.hpp"
#include "substrate/state_participant.hpp"

struct GovernableParameters {
  uint64_t mint_fee_bps = 50;
  uint64_t redeem_fee_bps = 50;
  U256 bond_floor_price = 0;          // Stable, 18 decimals
  uint64_t max_bond_rate_bps = 0;
  uint64_t deviation_tolerance_bps = 100;
};

enum class ParamType { MintFeeBps, RedeemFeeBps, BondFloorPrice, MaxBondRateBps, DeviationToleranceBps };

const char* ParamTypeName(ParamType type);
// Accepts the snake_case names used in config and replay scripts; throws LedgerError(InvalidParameter)
ParamType ParseParamType(const std::string& text);

// Read-only view the engine and validator consume
class ParameterSource {
public:
  virtual ~ParameterSource() = default;
  virtual GovernableParameters Current() const = 0;
};

class ParameterStore : public ParameterSource, public StateParticipant {
public:
  static constexpr uint64_t kMaxFeeBps = 1000;
  static constexpr uint64_t kMaxDeviationToleranceBps = 5000;
  static constexpr uint64_t kMaxBondRateBps = 10000;

  ParameterStore(const Address& owner, const GovernableParameters& initial = GovernableParameters());

  GovernableParameters Current() const override { return params_; }

  // Owner only; throws LedgerError(InvalidParameter) when out of range
  void SetParam(const Address& caller, ParamType type, const U256& value);
  // All-or-nothing; length mismatch is InvalidParameter
  void SetParamsBatch(const Address& caller, const std::vector<ParamType>& types, const std::vector<U256>& values);

  static void Validate(ParamType type, const U256& value);
  static void Validate(const GovernableParameters& params);

  Ownership& OwnershipRole() { return ownership_; }
  const Ownership& OwnershipRole() const { return ownership_; }

  std::string ParticipantName() const override { return "parameters"; }
  nlohmann::json Snapshot() const override;
  void Restore(const nlohmann::json& snapshot) override;
private:
  static void Apply(GovernableParameters& params, ParamType type, const U256& value);

  Ownership ownership_;
  GovernableParameters params_;
};
