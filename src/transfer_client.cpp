#include "transfer_client.hpp"

#include "exception.hpp"
#include "log.hpp"

#include <algorithm>
#include <string>
#include <thread>

namespace iarepo {

namespace {

// 5xx and request timeouts are transient, anything else is final
bool is_retryable_status(long status) { return status == 408 || (status >= 500 && status < 600); }

bool is_auth_status(long status) { return status == 401 || status == 403; }

}  // namespace

transfer_client::transfer_client(http_transport& transport, const config& cfg)
    : transfer_client(transport, cfg, [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {}

transfer_client::transfer_client(http_transport& transport, const config& cfg, sleep_function sleep)
    : _transport(transport), _config(cfg), _sleep(std::move(sleep)) {}

void transfer_client::require_credentials() const {
  if (_config.auth.empty()) {
    throw auth_config_error("s3 access key or secret key is missing");
  }
}

void transfer_client::authorize(http_request& request) const {
  require_credentials();
  request.headers["authorization"] = "AWS " + _config.auth.access_key + ":" + _config.auth.secret_key;
  request.headers["x-amz-auto-make-bucket"] = "1";
}

http_response transfer_client::send(const http_request& original) {
  http_request request = original;
  if (request.mutating()) {
    authorize(request);
  }

  const std::string what = std::string(to_string(request.method)) + " " + request.url;
  int max_attempts = std::max(1, _config.retry.max_attempts);
  long last_status = 0;
  std::string last_error;

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (attempt > 1) {
      auto delay = _config.retry.delay(attempt - 1);
      log(log_level::warn) << what << ": " << last_error << ", retrying in " << delay.count() << "ms (attempt "
                           << attempt << " of " << max_attempts << ")" << std::endl;
      _sleep(delay);
      if (request.body) {
        request.body->rewind();
      }
    }

    http_response response;
    try {
      response = _transport.perform(request);
    }
    catch (const transport_error& e) {
      if (!e.transient()) {
        throw;
      }
      last_status = 0;
      last_error = e.what();
      continue;
    }

    if (is_auth_status(response.status)) {
      throw auth_config_error(
          what + ": credentials rejected: HTTP " + std::to_string(response.status), response.status);
    }

    if (is_retryable_status(response.status)) {
      last_status = response.status;
      last_error = "HTTP " + std::to_string(response.status);
      continue;
    }

    return response;
  }

  log(log_level::error) << what << ": giving up after " << max_attempts << " attempts: " << last_error << std::endl;
  throw transfer_exhausted(
      what + ": giving up after " + std::to_string(max_attempts) + " attempts: " + last_error, max_attempts,
      last_status);
}

}  // namespace iarepo
