#pragma once
#include <string>
#include <nlohmann/json.hpp>

// Anything whose state a request may mutate. The substrate snapshots every
// participant before a request and restores them all if it fails.
class StateParticipant {
public:
  virtual ~StateParticipant() = default;
  virtual std::string ParticipantName() const = 0;
  virtual nlohmann::json Snapshot() const = 0;
  virtual void Restore(const nlohmann::json& snapshot) = 0;
};
