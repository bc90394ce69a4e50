#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "engine/collateral_position.hpp"

struct PersistedState {
  CollateralPosition position;
  nlohmann::json observations = nlohmann::json::object(); // TimeWeightedPriceOracle snapshot
  // Simulated pool state, so restored accumulators line up with restored observations
  nlohmann::json pools = nlohmann::json::object();
  // UnitOfAccountIndex snapshot; empty in files written before the index was persisted
  nlohmann::json unit_index = nlohmann::json::object();
  uint64_t saved_at = 0;
};

// JSON file holding the collateral position, the per-pair observation slots and the unit index.
// Writes go to a temporary file that is renamed over the target.
class StateStore {
public:
  explicit StateStore(std::string path);

  // Throws std::runtime_error on I/O failure
  void Save(const PersistedState& state) const;
  // std::nullopt when no file exists; throws std::runtime_error when it is unreadable
  std::optional<PersistedState> Load() const;
  const std::string& Path() const { return path_; }
private:
  std::string path_;
};
