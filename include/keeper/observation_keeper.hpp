#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include "common/types.hpp"

class LedgerSystem;
class ThreadPool;
class StateStore;

struct KeeperRoundStats {
  size_t feeds_refreshed = 0;
  size_t feeds_failed = 0;
  size_t observations_recorded = 0;
  bool index_updated = false;
  bool state_saved = false;
};

// Periodic maintenance: refreshes HTTP feeds, pokes every pair's TWAP,
// refreshes the unit-of-account index and persists state. Never moves tokens.
class ObservationKeeper {
public:
  // store may be null to skip persistence
  ObservationKeeper(LedgerSystem& system, ThreadPool& pool, StateStore* store, Address operator_account);

  KeeperRoundStats RunRound();
  // Rounds every interval_s until stop is set or max_rounds (0 = unbounded) have run
  void Run(uint64_t interval_s, const std::atomic<bool>& stop, uint64_t max_rounds = 0);
  uint64_t RoundsCompleted() const { return rounds_; }
private:
  LedgerSystem& system_;
  ThreadPool& pool_;
  StateStore* store_;
  Address operator_;
  uint64_t rounds_ = 0;
};
