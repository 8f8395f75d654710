#pragma once

#include "config.hpp"
#include "http.hpp"

namespace iarepo {

// HTTP transport backed by libcurl, one easy handle per request.
class curl_transport : public http_transport {
 public:
  explicit curl_transport(const transfer_timeouts& timeouts = transfer_timeouts());
  ~curl_transport() override;

  curl_transport(const curl_transport&) = delete;
  curl_transport& operator=(const curl_transport&) = delete;

  http_response perform(const http_request& request) override;

 private:
  transfer_timeouts _timeouts;
};

}  // namespace iarepo
