#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;
  std::string body;
  std::string error;
  bool Ok() const { return error.empty() && status >= 200 && status < 300; }
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Get(const std::string& url,
                           const HttpHeaders& headers,
                           int timeout_ms) = 0;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const HttpHeaders& headers,
                            int timeout_ms) = 0;
};

struct HttpClientOptions {
  bool verify_tls = true;
  bool enable_tcp_keepalive = true;
  std::string user_agent = "bitres-keeper/1.0";
};

// libcurl-based client; caller owns the returned object
HttpClient* CreateCurlHttpClient(const HttpClientOptions& options = HttpClientOptions());
