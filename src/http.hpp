#pragma once

#include "exception.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace iarepo {

enum class http_method { get, put, post, del };

const char* to_string(http_method method);

// A rewindable request body, read sequentially by the transport.
class body_source {
 public:
  virtual ~body_source() = default;

  // Total number of bytes in the body
  virtual uint64_t size() const = 0;

  // Copy up to max bytes into buffer. Returns 0 at the end of the body.
  virtual size_t read(char* buffer, size_t max) = 0;

  // Start over from the first byte, before a retry
  virtual void rewind() = 0;
};

class string_body : public body_source {
  std::string _data;
  size_t _offset = 0;

 public:
  string_body() = default;
  explicit string_body(std::string data) : _data(std::move(data)) {}

  uint64_t size() const override { return _data.size(); }
  size_t read(char* buffer, size_t max) override;
  void rewind() override { _offset = 0; }
};

struct http_request {
  http_method method = http_method::get;
  std::string url;
  std::map<std::string, std::string> headers;

  // Not owned, may be null for an empty body
  body_source* body = nullptr;

  bool mutating() const { return method != http_method::get; }
};

struct http_response {
  long status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// The request never produced an HTTP response.
class transport_error : public exception {
  bool _transient;

 public:
  transport_error(const std::string& message, bool transient) : exception(message), _transient(transient) {}

  // Connection failures and timeouts are worth retrying, a malformed URL is not
  bool transient() const { return _transient; }
};

// Sends one HTTP request and waits for the response.
class http_transport {
 public:
  virtual ~http_transport() = default;

  // Throws transport_error if no response was received.
  virtual http_response perform(const http_request& request) = 0;
};

}  // namespace iarepo
