#pragma once

#include "config.hpp"
#include "http.hpp"

#include <chrono>
#include <functional>

namespace iarepo {

// Routes every outbound request: injects credentials into mutating requests
// and retries transient failures with exponential backoff.
class transfer_client {
 public:
  using sleep_function = std::function<void(std::chrono::milliseconds)>;

  // The transport must outlive the client.
  transfer_client(http_transport& transport, const config& cfg);
  transfer_client(http_transport& transport, const config& cfg, sleep_function sleep);

  // Send a request and return the first non-transient response.
  // Throws auth_config_error when credentials are missing for a mutating
  // request or are rejected, transfer_exhausted when the retry budget is spent,
  // and transport_error for transport failures that are not worth retrying.
  http_response send(const http_request& request);

  // Throws auth_config_error unless both keys are configured
  void require_credentials() const;

  const service_endpoints& endpoints() const { return _config.endpoints; }

 private:
  void authorize(http_request& request) const;

 private:
  http_transport& _transport;
  config _config;
  sleep_function _sleep;
};

}  // namespace iarepo
