#include "http_client.hpp"

#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>
#include <type_traits>
#include <vector>

namespace streamagent::net {

// URL parsing
std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
  // Simple regex-based URL parser
  std::regex url_regex(R"(^(https?):\/\/([^:\/\s]+)(?::(\d+))?(\/[^\?\s]*)?(\?[^\s]*)?)");
  std::smatch match;

  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl result;
  result.scheme = match[1].str();
  result.host = match[2].str();
  result.port = match[3].str();
  result.path = match[4].str().empty() ? "/" : match[4].str();
  result.query = match[5].str();

  return result;
}

std::string ParsedUrl::port_or_default() const {
  if (!port.empty()) return port;
  return is_https() ? "443" : "80";
}

std::string ChunkedDecoder::feed(std::string_view input) {
  std::string out;
  pending_.append(input.data(), input.size());

  bool progress = true;
  while (progress) {
    progress = false;
    switch (state_) {
      case State::Size: {
        auto eol = pending_.find("\r\n");
        if (eol == std::string::npos) break;

        // Chunk extensions after ';' are ignored
        std::string_view line(pending_.data(), eol);
        line = line.substr(0, line.find(';'));
        while (!line.empty() && (line.back() == ' ' || line.back() == '\t')) line.remove_suffix(1);

        size_t size = 0;
        auto [ptr, ec] = std::from_chars(line.data(), line.data() + line.size(), size, 16);
        if (line.empty() || ec != std::errc() || ptr != line.data() + line.size()) {
          state_ = State::Error;
          break;
        }

        pending_.erase(0, eol + 2);
        if (size == 0) {
          state_ = State::Trailer;
        } else {
          remaining_ = size;
          state_ = State::Data;
        }
        progress = true;
        break;
      }
      case State::Data: {
        if (pending_.empty()) break;
        size_t n = std::min(remaining_, pending_.size());
        out.append(pending_, 0, n);
        pending_.erase(0, n);
        remaining_ -= n;
        if (remaining_ == 0) {
          state_ = State::DataEnd;
        }
        progress = true;
        break;
      }
      case State::DataEnd: {
        if (pending_.size() < 2) break;
        if (pending_.compare(0, 2, "\r\n") != 0) {
          state_ = State::Error;
          break;
        }
        pending_.erase(0, 2);
        state_ = State::Size;
        progress = true;
        break;
      }
      case State::Trailer: {
        auto eol = pending_.find("\r\n");
        if (eol == std::string::npos) break;
        // An empty line ends the trailer section
        if (eol == 0) {
          state_ = State::Done;
        }
        pending_.erase(0, eol + 2);
        progress = state_ != State::Done;
        break;
      }
      case State::Done:
      case State::Error:
        break;
    }
  }

  return out;
}

namespace {

using ssl_socket = asio::ssl::stream<asio::ip::tcp::socket>;

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

// SSL connections may return various errors on close
bool is_eof(const asio::error_code& ec) {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated || ec.category() == asio::error::get_ssl_category();
}

std::string build_request(const ParsedUrl& url, const HttpOptions& options) {
  std::ostringstream req;
  req << options.method << " " << url.path << url.query << " HTTP/1.1\r\n";
  req << "Host: " << url.host;
  if (!url.port.empty()) {
    req << ":" << url.port;
  }
  req << "\r\n";
  req << "Connection: close\r\n";

  for (const auto& [key, value] : options.headers) {
    req << key << ": " << value << "\r\n";
  }

  if (!options.body.empty()) {
    req << "Content-Length: " << options.body.size() << "\r\n";
  }

  req << "\r\n";
  req << options.body;
  return req.str();
}

class ExchangeBase {
 public:
  virtual ~ExchangeBase() = default;
  virtual void abort() = 0;
};

// One request/response exchange over a plain or TLS socket
template <typename Stream>
class Exchange : public ExchangeBase, public std::enable_shared_from_this<Exchange<Stream>> {
 public:
  Exchange(asio::io_context& io_ctx, std::unique_ptr<Stream> stream, ParsedUrl url, const HttpOptions& options, StreamDataCallback on_data,
           std::function<void(HttpResponse)> on_complete)
      : stream_(std::move(stream)),
        resolver_(io_ctx),
        timer_(io_ctx),
        url_(std::move(url)),
        timeout_(options.timeout),
        request_(build_request(url_, options)),
        on_data_(std::move(on_data)),
        on_complete_(std::move(on_complete)) {}

  void start() {
    auto self = this->shared_from_this();
    arm_timer();
    resolver_.async_resolve(url_.host, url_.port_or_default(), [self](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
      if (ec) {
        self->fail("DNS resolution failed: " + ec.message());
        return;
      }

      asio::async_connect(self->stream_->lowest_layer(), results, [self](const asio::error_code& ec, const asio::ip::tcp::endpoint&) {
        if (ec) {
          self->fail("Connection failed: " + ec.message());
          return;
        }
        self->handshake();
      });
    });
  }

  void abort() override {
    if (finished_) return;
    cancelled_ = true;
    close();
  }

 private:
  void handshake() {
    if constexpr (std::is_same_v<Stream, ssl_socket>) {
      auto self = this->shared_from_this();
      stream_->async_handshake(asio::ssl::stream_base::client, [self](const asio::error_code& ec) {
        if (ec) {
          self->fail("SSL handshake failed: " + ec.message());
          return;
        }
        self->send();
      });
    } else {
      send();
    }
  }

  void send() {
    auto self = this->shared_from_this();
    asio::async_write(*stream_, asio::buffer(request_), [self](const asio::error_code& ec, size_t) {
      if (ec) {
        self->fail("Write failed: " + ec.message());
        return;
      }
      self->read_headers();
    });
  }

  void read_headers() {
    auto self = this->shared_from_this();
    asio::async_read_until(*stream_, buffer_, "\r\n\r\n", [self](const asio::error_code& ec, size_t header_bytes) {
      if (ec) {
        self->fail("Read headers failed: " + ec.message());
        return;
      }

      self->arm_timer();
      if (!self->parse_headers(header_bytes)) {
        return;
      }

      // Bytes read past the header block belong to the body
      self->consume_buffer();
      if (self->finished_) return;

      if (self->body_complete()) {
        self->complete();
        return;
      }
      self->read_body();
    });
  }

  bool parse_headers(size_t header_bytes) {
    auto begin = asio::buffers_begin(buffer_.data());
    std::string head(begin, begin + static_cast<std::ptrdiff_t>(header_bytes));
    buffer_.consume(header_bytes);

    std::istringstream stream(head);
    std::string status_line;
    std::getline(stream, status_line);

    // Parse status code
    std::regex status_regex(R"(HTTP/[\d.]+ (\d+))");
    std::smatch match;
    if (!std::regex_search(status_line, match, status_regex)) {
      fail("Invalid HTTP response: cannot parse status line");
      return false;
    }
    response_.status_code = std::stoi(match[1].str());

    // Parse headers
    std::string header_line;
    while (std::getline(stream, header_line) && header_line != "\r") {
      auto colon = header_line.find(':');
      if (colon != std::string::npos) {
        std::string key = to_lower(header_line.substr(0, colon));
        std::string value = header_line.substr(colon + 1);
        // Trim whitespace
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        response_.headers[key] = value;
      }
    }

    auto te = response_.headers.find("transfer-encoding");
    chunked_ = te != response_.headers.end() && to_lower(te->second).find("chunked") != std::string::npos;

    auto cl = response_.headers.find("content-length");
    if (!chunked_ && cl != response_.headers.end()) {
      size_t length = 0;
      auto [ptr, ec] = std::from_chars(cl->second.data(), cl->second.data() + cl->second.size(), length);
      if (ec == std::errc()) {
        content_length_ = length;
      } else {
        spdlog::debug("Ignoring invalid Content-Length '{}'", cl->second);
      }
    }

    // Only successful responses are streamed; error bodies are collected
    streaming_ = on_data_ && response_.status_code >= 200 && response_.status_code < 300;
    return true;
  }

  void consume_buffer() {
    if (buffer_.size() == 0) return;

    auto data = buffer_.data();
    std::string raw(asio::buffers_begin(data), asio::buffers_end(data));
    buffer_.consume(raw.size());
    received_ += raw.size();

    std::string piece = chunked_ ? chunked_decoder_.feed(raw) : std::move(raw);
    if (chunked_decoder_.failed()) {
      fail("Invalid chunked transfer encoding");
      return;
    }

    if (piece.empty()) return;
    if (streaming_) {
      on_data_(piece);
    } else {
      response_.body += piece;
    }
  }

  bool body_complete() const {
    if (chunked_) return chunked_decoder_.done();
    return content_length_ && received_ >= *content_length_;
  }

  void read_body() {
    auto self = this->shared_from_this();
    asio::async_read(*stream_, buffer_, asio::transfer_at_least(1), [self](const asio::error_code& ec, size_t) {
      if (self->finished_) return;

      if (ec && !is_eof(ec)) {
        self->fail("Read failed: " + ec.message());
        return;
      }

      self->arm_timer();
      self->consume_buffer();
      if (self->finished_) return;

      if (self->body_complete()) {
        self->complete();
        return;
      }

      if (ec) {
        if (self->cancelled_ || self->timed_out_) {
          self->fail("Read failed: " + ec.message());
        } else if (self->chunked_ || self->content_length_) {
          self->fail("Connection closed before end of body");
        } else {
          self->complete();
        }
        return;
      }

      self->read_body();
    });
  }

  // Restart the idle timer. When it fires, mark as timed out and close the socket.
  void arm_timer() {
    timer_.expires_after(timeout_);
    std::weak_ptr<Exchange> weak = this->shared_from_this();
    timer_.async_wait([weak](const asio::error_code& ec) {
      if (ec) return;
      if (auto self = weak.lock()) {
        if (self->finished_) return;
        self->timed_out_ = true;
        self->close();
      }
    });
  }

  void fail(const std::string& message) {
    if (finished_) return;
    if (cancelled_) {
      response_.error = "Request cancelled";
    } else if (timed_out_) {
      response_.error = "Request timed out";
      response_.status_code = 0;
    } else {
      response_.error = message;
    }
    complete();
  }

  void complete() {
    if (finished_) return;
    finished_ = true;
    timer_.cancel();
    close();
    auto handler = std::move(on_complete_);
    handler(std::move(response_));
  }

  void close() {
    asio::error_code ignored;
    stream_->lowest_layer().cancel(ignored);
    stream_->lowest_layer().close(ignored);
  }

  std::unique_ptr<Stream> stream_;
  asio::ip::tcp::resolver resolver_;
  asio::steady_timer timer_;
  asio::streambuf buffer_;

  ParsedUrl url_;
  std::chrono::seconds timeout_;
  std::string request_;
  StreamDataCallback on_data_;
  std::function<void(HttpResponse)> on_complete_;

  HttpResponse response_;
  bool streaming_ = false;
  bool chunked_ = false;
  ChunkedDecoder chunked_decoder_;
  std::optional<size_t> content_length_;
  size_t received_ = 0;

  bool finished_ = false;
  bool cancelled_ = false;
  bool timed_out_ = false;
};

}  // namespace

// HTTP Client implementation
class HttpClient::Impl : public std::enable_shared_from_this<HttpClient::Impl> {
 public:
  explicit Impl(asio::io_context& io_ctx) : io_ctx_(io_ctx), ssl_ctx_(asio::ssl::context::tlsv12_client) {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(asio::ssl::verify_peer);
  }

  void start(const std::string& url, const HttpOptions& options, StreamDataCallback on_data, std::function<void(HttpResponse)> on_complete) {
    auto parsed = ParsedUrl::parse(url);
    if (!parsed) {
      asio::post(io_ctx_, [on_complete = std::move(on_complete)]() {
        on_complete(HttpResponse{0, {}, "", "Invalid URL"});
      });
      return;
    }

    asio::post(io_ctx_, [self = shared_from_this(), url = std::move(*parsed), options, on_data = std::move(on_data),
                         on_complete = std::move(on_complete)]() mutable {
      self->launch(std::move(url), options, std::move(on_data), std::move(on_complete));
    });
  }

  void cancel() {
    asio::post(io_ctx_, [self = shared_from_this()]() {
      for (auto& weak : self->active_) {
        if (auto exchange = weak.lock()) {
          exchange->abort();
        }
      }
      self->active_.clear();
    });
  }

 private:
  void launch(ParsedUrl url, const HttpOptions& options, StreamDataCallback on_data, std::function<void(HttpResponse)> on_complete) {
    active_.erase(std::remove_if(active_.begin(), active_.end(),
                                 [](const std::weak_ptr<ExchangeBase>& weak) {
                                   return weak.expired();
                                 }),
                  active_.end());

    spdlog::debug("HTTP {} {}://{}{}", options.method, url.scheme, url.host, url.path);

    if (url.is_https()) {
      auto stream = std::make_unique<ssl_socket>(io_ctx_, ssl_ctx_);
      // Set SNI hostname
      SSL_set_tlsext_host_name(stream->native_handle(), url.host.c_str());
      auto exchange = std::make_shared<Exchange<ssl_socket>>(io_ctx_, std::move(stream), std::move(url), options, std::move(on_data),
                                                             std::move(on_complete));
      active_.push_back(exchange);
      exchange->start();
    } else {
      auto stream = std::make_unique<asio::ip::tcp::socket>(io_ctx_);
      auto exchange = std::make_shared<Exchange<asio::ip::tcp::socket>>(io_ctx_, std::move(stream), std::move(url), options, std::move(on_data),
                                                                        std::move(on_complete));
      active_.push_back(exchange);
      exchange->start();
    }
  }

  asio::io_context& io_ctx_;
  asio::ssl::context ssl_ctx_;
  std::vector<std::weak_ptr<ExchangeBase>> active_;
};

HttpClient::HttpClient(asio::io_context& io_ctx) : impl_(std::make_shared<Impl>(io_ctx)) {}

HttpClient::~HttpClient() = default;

void HttpClient::request(const std::string& url, const HttpOptions& options, std::function<void(HttpResponse)> callback) {
  impl_->start(url, options, nullptr, std::move(callback));
}

std::future<HttpResponse> HttpClient::request(const std::string& url, const HttpOptions& options) {
  auto promise = std::make_shared<std::promise<HttpResponse>>();
  auto future = promise->get_future();

  impl_->start(url, options, nullptr, [promise](HttpResponse response) {
    promise->set_value(std::move(response));
  });

  return future;
}

void HttpClient::request_stream(const std::string& url, const HttpOptions& options, StreamDataCallback on_data,
                                StreamCompleteCallback on_complete) {
  impl_->start(url, options, std::move(on_data), [on_complete = std::move(on_complete)](HttpResponse response) {
    if (!response.error.empty()) {
      on_complete(response.status_code, response.error);
    } else if (response.status_code < 200 || response.status_code >= 300) {
      on_complete(response.status_code, "HTTP error " + std::to_string(response.status_code) + ": " + response.body);
    } else {
      on_complete(response.status_code, "");
    }
  });
}

void HttpClient::cancel() {
  impl_->cancel();
}

}  // namespace streamagent::net
