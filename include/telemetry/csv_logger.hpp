#pragma once
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <vector>

// One row per ledger request, successful or not. Amounts are pre-formatted decimals.
struct RequestRecord {
  std::string timestamp;
  std::string request;        // mint, redeem, redeem_bond, ...
  std::string caller;
  std::string status;         // OK or the error code name
  std::string reserve_amount;
  std::string stable_amount;
  std::string bond_amount;
  std::string backstop_amount;
  std::string fee;
  std::string collateral_ratio;
  std::string detail;
};

class CsvLogger {
public:
  explicit CsvLogger(const std::string& filename);
  ~CsvLogger();

  void LogRequest(const RequestRecord& record);
  void LogFailure(const RequestRecord& record, const std::string& code, const std::string& reason);

  // Flush data to disk
  void Flush();

  size_t RowsWritten() const { return rows_written_; }
  static std::string Escape(const std::string& field);

private:
  std::ofstream file_;
  std::mutex mutex_;
  std::string filename_;
  size_t rows_written_ = 0;

  std::vector<std::string> write_buffer_;
  static constexpr size_t BUFFER_SIZE = 100; // Batch 100 records before flush
  std::chrono::steady_clock::time_point last_flush_;
  static constexpr auto FLUSH_INTERVAL = std::chrono::seconds(5);

  void WriteHeader();
  void WriteRecord(const RequestRecord& record);
  void WriteToBuffer(const std::string& record);
  void FlushBuffer();
  static std::string GetCurrentTimestamp();
};
