#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace streamagent::net {

// HTTP response
struct HttpResponse {
  int status_code = 0;
  std::map<std::string, std::string> headers;  // keys lower-cased
  std::string body;
  std::string error;

  bool ok() const {
    return error.empty() && status_code >= 200 && status_code < 300;
  }
};

// HTTP request options
struct HttpOptions {
  std::string method = "GET";
  std::map<std::string, std::string> headers;
  std::string body;
  // Longest silence tolerated between two reads
  std::chrono::seconds timeout{30};
};

// Streaming data callback
using StreamDataCallback = std::function<void(const std::string &chunk)>;

// on_complete(status_code, error); error is empty on success
using StreamCompleteCallback = std::function<void(int status_code, const std::string &error)>;

// Async HTTP/1.1 client using ASIO. All handlers run on the io_context thread.
class HttpClient {
 public:
  explicit HttpClient(asio::io_context &io_ctx);

  ~HttpClient();

  // Async request with callback
  void request(const std::string &url, const HttpOptions &options, std::function<void(HttpResponse)> callback);

  // Async request returning future
  std::future<HttpResponse> request(const std::string &url, const HttpOptions &options);

  // Streaming request - calls on_data for each decoded body chunk of a 2xx
  // response. A non-2xx response is reported through on_complete with the
  // error body in the message.
  void request_stream(const std::string &url, const HttpOptions &options, StreamDataCallback on_data, StreamCompleteCallback on_complete);

  // Abort every in-flight request; each completes with "Request cancelled"
  void cancel();

 private:
  class Impl;

  std::shared_ptr<Impl> impl_;
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

  static std::optional<ParsedUrl> parse(const std::string &url);
};

// Decoder for "Transfer-Encoding: chunked" bodies
class ChunkedDecoder {
 public:
  // Consume raw bytes, return the payload they complete
  std::string feed(std::string_view input);

  bool done() const {
    return state_ == State::Done;
  }

  bool failed() const {
    return state_ == State::Error;
  }

 private:
  enum class State { Size, Data, DataEnd, Trailer, Done, Error };

  State state_ = State::Size;
  std::string pending_;
  size_t remaining_ = 0;
};

}  // namespace streamagent::net
