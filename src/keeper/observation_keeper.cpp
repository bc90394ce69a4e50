#include "keeper/observation_keeper.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "keeper/ledger_system.hpp"
#include "scheduler/thread_pool.hpp"
#include "substrate/state_store.hpp"
#include "telemetry/health_report.hpp"
#include "telemetry/structured_logger.hpp"
#include <chrono>
#include <thread>

ObservationKeeper::ObservationKeeper(LedgerSystem& system, ThreadPool& pool, StateStore* store, Address operator_account)
  : system_(system), pool_(pool), store_(store), operator_(std::move(operator_account)) {}

KeeperRoundStats ObservationKeeper::RunRound() {
  KeeperRoundStats stats;
  std::atomic<size_t> refreshed{0}, failed{0}, recorded{0};

  // feeds first so the round's price reads see fresh answers
  for (const auto& feed : system_.HttpFeeds()) {
    auto* f = feed.get();
    pool_.Enqueue([f, &refreshed, &failed] {
      if (f->Refresh()) ++refreshed;
      else ++failed;
    });
  }
  pool_.WaitIdle();

  for (const auto& pair : system_.twap.TrackedPairs()) {
    pool_.Enqueue([this, pair, &recorded] {
      try {
        const bool shifted = system_.substrate.Execute("poke " + pair, [&] {
          return system_.twap.RecordObservationIfDue(pair);
        });
        if (shifted) ++recorded;
      } catch (const LedgerError& e) {
        BITRES_LOG_WARN("observation for " + pair + " failed: " + e.what());
      }
    });
  }
  pool_.WaitIdle();

  stats.feeds_refreshed = refreshed;
  stats.feeds_failed = failed;
  stats.observations_recorded = recorded;

  try {
    const IndexUpdate update = system_.substrate.Execute("update_index", [&] {
      return system_.unit_index->Update(operator_);
    });
    stats.index_updated = true;
    BITRES_LOG_DEBUG("unit index " + FixedPoint::FormatDecimal(update.value));
  } catch (const LedgerError& e) {
    BITRES_LOG_WARN(std::string("unit index not updated: ") + e.what());
  }

  if (store_) {
    try {
      store_->Save(system_.CaptureState());
      stats.state_saved = true;
    } catch (const std::runtime_error& e) {
      BITRES_LOG_ERROR(std::string("state save failed: ") + e.what());
    }
  }

  const nlohmann::json report = BuildHealthReport(system_.twap, system_.validator, system_.engine, system_.vault);
  if (Logger::IsEnabled(LogLevel::DEBUG)) BITRES_LOG_DEBUG(FormatHealthReport(report));
  ++rounds_;
  StructuredLogger::Instance().Emit("keeper_round", {
    {"round", rounds_},
    {"feeds_refreshed", stats.feeds_refreshed},
    {"feeds_failed", stats.feeds_failed},
    {"observations_recorded", stats.observations_recorded},
    {"index_updated", stats.index_updated},
    {"state_saved", stats.state_saved},
    {"health", report}
  });
  BITRES_LOG_INFO("keeper round " + std::to_string(rounds_) + ": " + std::to_string(stats.observations_recorded) +
                  " observations, " + std::to_string(stats.feeds_failed) + " feed failures");
  return stats;
}

void ObservationKeeper::Run(uint64_t interval_s, const std::atomic<bool>& stop, uint64_t max_rounds) {
  const uint64_t interval = interval_s == 0 ? 1 : interval_s;
  while (!stop.load()) {
    RunRound();
    if (max_rounds != 0 && rounds_ >= max_rounds) break;
    // sleep in one-second steps so a stop request is seen promptly
    for (uint64_t i = 0; i < interval && !stop.load(); ++i) std::this_thread::sleep_for(std::chrono::seconds(1));
  }
}
