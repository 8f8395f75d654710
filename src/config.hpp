#pragma once

#include "url.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <string>

namespace iarepo {

// Access and secret key of the S3-compatible API
struct credentials {
  std::string access_key;
  std::string secret_key;

  bool empty() const { return access_key.empty() || secret_key.empty(); }
};

struct service_endpoints {
  url s3{"https://s3.us.archive.org"};
  url metadata{"https://archive.org"};
};

// Bounded exponential backoff. max_attempts counts the first attempt too.
struct retry_policy {
  int max_attempts = 5;
  std::chrono::milliseconds initial_backoff{2000};
  double multiplier = 2.0;
  std::chrono::milliseconds max_backoff{120000};

  // Delay before the given retry, 1 for the first retry
  std::chrono::milliseconds delay(int retry) const {
    double ms = initial_backoff.count() * std::pow(multiplier, std::max(0, retry - 1));
    ms = std::min(ms, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
  }
};

struct transfer_timeouts {
  std::chrono::seconds connect{60};
  std::chrono::seconds total{600};
};

// Process configuration, built once and passed to the transfer client.
struct config {
  service_endpoints endpoints;
  credentials auth;
  retry_policy retry;
  transfer_timeouts timeouts;
};

}  // namespace iarepo
