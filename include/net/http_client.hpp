#pragma once
#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

struct HttpResponse {
  long status = 0; // 0 when the request never got a response
  std::string body;
  bool timed_out = false;
  std::string error; // transport error text, empty on success
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

// "Name: value" sets that header; anything else is sent as Authorization.
inline void ApplyAuthHeader(std::unordered_map<std::string, std::string>& headers,
                            const std::optional<std::string>& auth_header) {
  if (!auth_header || auth_header->empty()) return;
  const std::string& raw = *auth_header;
  auto trim = [](const std::string& s) {
    size_t start = 0, end = s.size();
    while (start < end && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(s[end-1]))) --end;
    return s.substr(start, end - start);
  };
  auto pos = raw.find(':');
  if (pos != std::string::npos) {
    std::string name = trim(raw.substr(0, pos));
    std::string value = trim(raw.substr(pos + 1));
    if (!name.empty() && !value.empty()) {
      headers[name] = value;
      return;
    }
  }
  headers["Authorization"] = raw;
}

// Optional tuning knobs for persistent HTTP client behavior
struct HttpClientTuning {
  bool enable_http2 = true;      // try HTTP/2 when TLS is used
  bool enable_tcp_keepalive = true;
  int tcp_keepidle_s = 30;
  int tcp_keepintvl_s = 15;
  bool verify_tls = true;
  int connect_timeout_ms = 2000;
};

// libcurl-backed client.
std::unique_ptr<HttpClient> CreateCurlHttpClient(const HttpClientTuning& tuning = HttpClientTuning{});
