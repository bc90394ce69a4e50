#include "common/clock.hpp"
#include "common/config_manager.hpp"
#include "common/logger.hpp"
#include "config/system_config.hpp"
#include "keeper/ledger_system.hpp"
#include "keeper/observation_keeper.hpp"
#include "keeper/replay_runner.hpp"
#include "net/http_client.hpp"
#include "scheduler/thread_pool.hpp"
#include "substrate/state_store.hpp"
#include "telemetry/csv_logger.hpp"
#include "telemetry/health_report.hpp"
#include "telemetry/structured_logger.hpp"
#include "wallet/signer.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

namespace {
  std::atomic<bool> g_stop{false};
  void OnSignal(int) { g_stop = true; }

  void PrintUsage() {
    std::cout << "usage: bitres_keeper keeper [--once]\n"
              << "       bitres_keeper replay <requests.jsonl>\n"
              << "       bitres_keeper health" << std::endl;
  }

  bool HasHttpFeeds(const SystemConfig& config) {
    if (config.pce_feed.kind == FeedSpec::Kind::Http) return true;
    for (const auto& kv : config.feeds) {
      for (const auto& f : kv.second) if (f.kind == FeedSpec::Kind::Http) return true;
    }
    return false;
  }
}

int main(int argc, char** argv) {
  const std::string mode = argc > 1 ? argv[1] : "keeper";
  if (mode != "keeper" && mode != "replay" && mode != "health") {
    PrintUsage();
    return 2;
  }
  if (mode == "replay" && argc < 3) {
    PrintUsage();
    return 2;
  }
  try {
    std::cout << "=== Starting bitres ledger (" << mode << ") ===" << std::endl;
    std::cout << "Step 1: Loading .env configuration..." << std::endl;
    ConfigManager::Initialize(".env");
    const SystemConfig config = LoadSystemConfig();

    std::cout << "Step 2: Initializing Logger..." << std::endl;
    Logger::Initialize(config.log_file, config.log_level, config.log_stderr);
    std::cout << "Step 3: Initializing Structured Logger..." << std::endl;
    StructuredLogger::Instance().Initialize(config.events_file);
    BITRES_LOG_INFO("bitres starting in " + mode + " mode");

    std::unique_ptr<HttpClient> http;
    if (HasHttpFeeds(config)) {
      std::cout << "Step 4: Setting up HTTP client..." << std::endl;
      HttpClientOptions options;
      options.verify_tls = config.verify_tls;
      http.reset(CreateCurlHttpClient(options));
    }

    if (!config.admin_private_key.empty()) {
      Signer admin(config.admin_private_key);
      if (admin.GetAddress() != config.admin_address) {
        BITRES_LOG_WARN("ADMIN_PRIVATE_KEY belongs to " + admin.GetAddress() + ", not ADMIN_ADDRESS " + config.admin_address);
      }
    }

    std::cout << "Step 5: Wiring ledger..." << std::endl;
    // replay runs on simulated time; the others follow the wall clock
    ManualClock manual_clock;
    SystemClock system_clock;
    const Clock& clock = mode == "replay" ? static_cast<const Clock&>(manual_clock) : system_clock;
    LedgerSystem system(config, clock, http.get());

    StateStore store(config.state_file);
    if (mode != "replay") {
      std::cout << "Step 6: Loading persisted state from " << store.Path() << "..." << std::endl;
      if (auto state = store.Load()) system.ApplyState(*state);
      else std::cout << "No persisted state, starting empty" << std::endl;
    }
    std::cout << "=== ALL COMPONENTS INITIALIZED SUCCESSFULLY ===" << std::endl;

    if (mode == "health") {
      const nlohmann::json report = BuildHealthReport(system.twap, system.validator, system.engine, system.vault);
      std::cout << FormatHealthReport(report);
      StructuredLogger::Instance().Emit("health_report", report);
    } else if (mode == "replay") {
      CsvLogger csv(config.request_csv);
      ReplayRunner runner(system, manual_clock, &csv, config.require_signed_requests);
      const auto outcomes = runner.RunFile(argv[2]);
      for (const auto& o : outcomes) {
        std::cout << "line " << o.line << " " << o.op << ": " << (o.ok ? "OK" : o.code) << " " << (o.ok ? o.result.dump() : o.message) << std::endl;
      }
      csv.Flush();
      std::cout << runner.Applied() << " requests, " << runner.Failed() << " failed" << std::endl;
    } else {
      const bool once = argc > 2 && std::string(argv[2]) == "--once";
      std::signal(SIGINT, OnSignal);
      std::signal(SIGTERM, OnSignal);
      ThreadPool pool(config.keeper_threads > 0 ? config.keeper_threads : 1);
      ObservationKeeper keeper(system, pool, &store, config.admin_address);
      std::cout << "Keeper running every " << config.keeper_interval_s << "s with " << pool.Size() << " threads" << std::endl;
      keeper.Run(config.keeper_interval_s, g_stop, once ? 1 : 0);
      std::cout << "Keeper stopped after " << keeper.RoundsCompleted() << " rounds" << std::endl;
    }

    BITRES_LOG_INFO("bitres shutting down");
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 0;
  } catch (const std::exception& e) {
    std::cout << "CRITICAL ERROR: " << e.what() << std::endl;
    std::cout << "bitres failed. Check configuration and try again." << std::endl;
    StructuredLogger::Instance().Shutdown();
    Logger::Shutdown();
    return 1;
  }
}
