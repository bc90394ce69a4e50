#include "oracle/http_price_feed.hpp"
#include "common/logger.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

HttpPriceFeed::HttpPriceFeed(std::string name, HttpFeedSource source, HttpClient& http, const Clock& clock)
  : name_(std::move(name)), source_(std::move(source)), http_(http), clock_(clock) {}

std::optional<FeedReading> HttpPriceFeed::LatestPrice() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_;
}

FeedReading HttpPriceFeed::ParsePayload(const std::string& body, Timestamp as_of) const {
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("feed " + name_ + ": unparseable body: " + e.what());
  }
  const nlohmann::json* node = nullptr;
  try {
    node = &doc.at(nlohmann::json::json_pointer(source_.json_pointer));
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument("feed " + name_ + ": no value at " + source_.json_pointer + ": " + e.what());
  }

  std::string text;
  if (node->is_string()) {
    text = node->get<std::string>();
  } else if (node->is_number_unsigned() || node->is_number_integer()) {
    text = node->dump();
  } else if (node->is_number_float()) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(10) << node->get<double>();
    text = oss.str();
  } else {
    throw std::invalid_argument("feed " + name_ + ": value at " + source_.json_pointer + " is not a number");
  }

  FeedReading reading;
  reading.as_of = as_of;
  if (source_.raw_decimals) {
    reading.value = FixedPoint::ParseInteger(text);
    reading.decimals = *source_.raw_decimals;
  } else {
    reading.value = FixedPoint::ParseDecimal(text, FixedPoint::kWadDecimals);
    reading.decimals = FixedPoint::kWadDecimals;
  }
  return reading;
}

bool HttpPriceFeed::Refresh() {
  HttpResponse resp = http_.Get(source_.url, source_.headers, source_.timeout_ms);
  if (!resp.Ok()) {
    BITRES_LOG_WARN("feed " + name_ + " refresh failed: status=" + std::to_string(resp.status) +
                    (resp.error.empty() ? "" : " " + resp.error));
    return false;
  }
  try {
    FeedReading reading = ParsePayload(resp.body, clock_.Now());
    std::lock_guard<std::mutex> lock(mutex_);
    last_ = reading;
  } catch (const std::invalid_argument& e) {
    BITRES_LOG_WARN(e.what());
    return false;
  }
  BITRES_LOG_DEBUG("feed " + name_ + " refreshed");
  return true;
}
