#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace acp::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
  std::string error;

  bool ok() const {
    return status_code >= 200 && status_code < 300;
  }

  // Case-insensitive header lookup
  std::optional<std::string> header(const std::string& name) const;
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::seconds timeout{30};
};

// Async HTTP/1.1 client using ASIO. The caller runs the io_context.
class HttpClient {
 public:
  explicit HttpClient(asio::io_context& io_ctx);

  ~HttpClient();

  // Async request with callback
  void request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback);

 private:
  class Impl;

  std::unique_ptr<Impl> impl_;
};

// URL parsing helper
struct ParsedUrl {
  std::string scheme;
  std::string host;
  std::string port;
  std::string path;
  std::string query;

  bool is_https() const {
    return scheme == "https";
  }

  std::string port_or_default() const;

  static std::optional<ParsedUrl> parse(const std::string& url);
};

// Decode a `Transfer-Encoding: chunked` body. nullopt if it is truncated or malformed.
std::optional<std::string> decode_chunked(const std::string& body);

// Percent-encode a query parameter value
std::string url_encode(const std::string& value);

}  // namespace acp::net
