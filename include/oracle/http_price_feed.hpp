#pragma once
#include <mutex>
#include <optional>
#include <string>
#include "common/clock.hpp"
#include "net/http_client.hpp"
#include "oracle/price_feed_adapter.hpp"

struct HttpFeedSource {
  std::string url;
  std::string json_pointer;             // e.g. /bitcoin/usd
  std::optional<unsigned> raw_decimals; // set when the payload is an integer scaled by 10^raw_decimals
  int timeout_ms = 3000;
  HttpHeaders headers;
};

// Pull feed over HTTP. Refresh() does the I/O; LatestPrice() only returns the
// last good reading, so price reads never wait on the network.
class HttpPriceFeed : public PushPriceFeed {
public:
  HttpPriceFeed(std::string name, HttpFeedSource source, HttpClient& http, const Clock& clock);
  const std::string& Name() const override { return name_; }
  std::optional<FeedReading> LatestPrice() const override;
  // false when the request or the payload was unusable; the previous reading is kept
  bool Refresh();
  // Extracts the price at the configured pointer; throws std::invalid_argument
  FeedReading ParsePayload(const std::string& body, Timestamp as_of) const;
private:
  std::string name_;
  HttpFeedSource source_;
  HttpClient& http_;
  const Clock& clock_;
  mutable std::mutex mutex_;
  std::optional<FeedReading> last_;
};
