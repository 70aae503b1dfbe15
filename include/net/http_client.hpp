#pragma once
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0;   // 0 when the request never produced an HTTP status
  std::string body;
  std::string error; // transport error text when status == 0
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

struct HttpClientTuning {
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  bool verify_tls = true;
};

// libcurl-backed client; the caller owns the returned object.
HttpClient* CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning());
