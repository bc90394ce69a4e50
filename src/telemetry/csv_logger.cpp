#include "telemetry/csv_logger.hpp"
#include "common/logger.hpp"
#include <iomanip>
#include <sstream>
#include <ctime>

CsvLogger::CsvLogger(const std::string& filename) : filename_(filename), last_flush_(std::chrono::steady_clock::now()) {
  write_buffer_.reserve(BUFFER_SIZE);
  std::ifstream check_file(filename);
  bool file_exists = check_file.good();
  bool has_headers = false;

  if (file_exists) {
    std::string first_line;
    if (std::getline(check_file, first_line)) {
      has_headers = (first_line.find("Timestamp") != std::string::npos &&
                     first_line.find("Request") != std::string::npos);
    }
    check_file.close();
  }

  file_.open(filename, std::ios::app);
  if (!file_.is_open()) {
    BITRES_LOG_ERROR("Failed to open CSV request log: " + filename);
    return;
  }

  if (!file_exists || !has_headers) {
    WriteHeader();
    file_.flush();
  }
}

CsvLogger::~CsvLogger() {
  if (file_.is_open()) {
    Flush();
    file_.close();
  }
}

void CsvLogger::WriteHeader() {
  std::lock_guard<std::mutex> lock(mutex_);
  file_ << "Timestamp,Request,Caller,Status,Reserve_Amount,Stable_Amount,"
        << "Bond_Amount,Backstop_Amount,Fee,Collateral_Ratio,Detail" << std::endl;
}

std::string CsvLogger::Escape(const std::string& field) {
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += "\"\"";
    else if (c == '\n' || c == '\r') out += ' ';
    else out += c;
  }
  out += '"';
  return out;
}

void CsvLogger::WriteRecord(const RequestRecord& record) {
  std::ostringstream oss;
  oss << Escape(record.timestamp.empty() ? GetCurrentTimestamp() : record.timestamp) << ","
      << Escape(record.request) << ","
      << Escape(record.caller) << ","
      << Escape(record.status) << ","
      << record.reserve_amount << ","
      << record.stable_amount << ","
      << record.bond_amount << ","
      << record.backstop_amount << ","
      << record.fee << ","
      << record.collateral_ratio << ","
      << Escape(record.detail) << '\n';
  WriteToBuffer(oss.str());
}

void CsvLogger::LogRequest(const RequestRecord& record) {
  RequestRecord ok = record;
  if (ok.status.empty()) ok.status = "OK";
  WriteRecord(ok);
}

void CsvLogger::LogFailure(const RequestRecord& record, const std::string& code, const std::string& reason) {
  RequestRecord failed = record;
  failed.status = code;
  failed.detail = reason;
  WriteRecord(failed);
}

void CsvLogger::WriteToBuffer(const std::string& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  write_buffer_.push_back(record);
  ++rows_written_;

  if (write_buffer_.size() >= BUFFER_SIZE ||
      std::chrono::steady_clock::now() - last_flush_ >= FLUSH_INTERVAL) {
    FlushBuffer();
  }
}

void CsvLogger::FlushBuffer() {
  if (write_buffer_.empty()) return;
  for (const auto& record : write_buffer_) {
    file_ << record;
  }
  file_.flush();
  write_buffer_.clear();
  last_flush_ = std::chrono::steady_clock::now();
}

void CsvLogger::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  FlushBuffer();
}

std::string CsvLogger::GetCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

  std::tm tm_buf;
  gmtime_r(&time_t, &tm_buf);
  std::stringstream ss;
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  ss << " UTC";
  return ss.str();
}
