#include "net/http_client.hpp"
#include "common/logger.hpp"
#include <curl/curl.h>
#include <mutex>

namespace {
size_t WriteCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* s = static_cast<std::string*>(userdata);
  s->append(ptr, size * nmemb);
  return size * nmemb;
}

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}
}

class CurlHttpClient : public HttpClient {
public:
  explicit CurlHttpClient(const HttpClientOptions& options) : options_(options) { EnsureCurlGlobalInit(); }

  HttpResponse Get(const std::string& url,
                   const HttpHeaders& headers,
                   int timeout_ms) override {
    return Perform(url, nullptr, headers, timeout_ms);
  }

  HttpResponse Post(const std::string& url,
                    const std::string& body,
                    const HttpHeaders& headers,
                    int timeout_ms) override {
    return Perform(url, &body, headers, timeout_ms);
  }

private:
  HttpResponse Perform(const std::string& url,
                       const std::string* body,
                       const HttpHeaders& headers,
                       int timeout_ms) {
    HttpResponse resp;
    CURL* curl = curl_easy_init();
    if (!curl) {
      resp.error = "curl_easy_init failed";
      BITRES_LOG_ERROR(resp.error);
      return resp;
    }
    std::string response_string;
    struct curl_slist* header_list = nullptr;
    for (const auto& kv : headers) {
      std::string line = kv.first + ": " + kv.second;
      header_list = curl_slist_append(header_list, line.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    if (body) {
      curl_easy_setopt(curl, CURLOPT_POST, 1L);
      curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
      curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    } else {
      curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, options_.enable_tcp_keepalive ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
      resp.error = std::string("curl_easy_perform failed: ") + curl_easy_strerror(rc);
      BITRES_LOG_ERROR(resp.error + " (" + url + ")");
    } else {
      long code = 0;
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
      resp.status = code;
      resp.body = std::move(response_string);
    }
    if (header_list) curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return resp;
  }

  HttpClientOptions options_;
};

HttpClient* CreateCurlHttpClient(const HttpClientOptions& options) {
  return new CurlHttpClient(options);
}
