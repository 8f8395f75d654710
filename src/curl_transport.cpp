#include "curl_transport.hpp"

#include "log.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>

#include <curl/curl.h>

namespace iarepo {

namespace {

// RAII wrapper for CURL
class CURLHandle {
 public:
  CURLHandle() : handle_(curl_easy_init()) {
    if (!handle_) {
      throw std::runtime_error("failed to initialize curl");
    }
  }

  ~CURLHandle() {
    if (handle_) {
      curl_easy_cleanup(handle_);
    }
  }

  CURLHandle(const CURLHandle&) = delete;
  CURLHandle& operator=(const CURLHandle&) = delete;

  CURL* get() const { return handle_; }

 private:
  CURL* handle_;
};

// RAII wrapper for a curl header list
class CURLHeaders {
 public:
  CURLHeaders() = default;

  ~CURLHeaders() {
    if (list_) {
      curl_slist_free_all(list_);
    }
  }

  CURLHeaders(const CURLHeaders&) = delete;
  CURLHeaders& operator=(const CURLHeaders&) = delete;

  void append(const std::string& header) {
    curl_slist* list = curl_slist_append(list_, header.c_str());
    if (!list) {
      throw std::runtime_error("failed to allocate curl header list");
    }
    list_ = list;
  }

  curl_slist* get() const { return list_; }

 private:
  curl_slist* list_ = nullptr;
};

// State shared with the read and seek callbacks. Exceptions thrown by the
// body are parked here and rethrown once curl has returned.
struct ReadContext {
  body_source* body;
  std::exception_ptr error;
};

// Callback to read the request body
size_t BodyReadCallback(char* ptr, size_t size, size_t nmemb, void* userp) {
  ReadContext* ctx = static_cast<ReadContext*>(userp);
  try {
    return ctx->body->read(ptr, size * nmemb);
  }
  catch (...) {
    ctx->error = std::current_exception();
    return CURL_READFUNC_ABORT;
  }
}

// Callback to rewind the request body when curl has to resend it
int BodySeekCallback(void* userp, curl_off_t offset, int origin) {
  ReadContext* ctx = static_cast<ReadContext*>(userp);
  if (origin != SEEK_SET || offset != 0) {
    return CURL_SEEKFUNC_CANTSEEK;
  }
  try {
    ctx->body->rewind();
    return CURL_SEEKFUNC_OK;
  }
  catch (...) {
    ctx->error = std::current_exception();
    return CURL_SEEKFUNC_FAIL;
  }
}

// Callback to collect the response body
size_t StringWriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
  std::string* out = static_cast<std::string*>(userp);
  out->append(static_cast<const char*>(contents), size * nmemb);
  return size * nmemb;
}

// Errors caused by the request itself rather than by the network
bool is_transient(CURLcode code) {
  switch (code) {
    case CURLE_UNSUPPORTED_PROTOCOL:
    case CURLE_URL_MALFORMAT:
    case CURLE_READ_ERROR:
    case CURLE_ABORTED_BY_CALLBACK:
    case CURLE_BAD_FUNCTION_ARGUMENT:
    case CURLE_OUT_OF_MEMORY:
      return false;
    default:
      return true;
  }
}

}  // namespace

curl_transport::curl_transport(const transfer_timeouts& timeouts) : _timeouts(timeouts) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

curl_transport::~curl_transport() { curl_global_cleanup(); }

http_response curl_transport::perform(const http_request& request) {
  CURLHandle curl;
  CURLHeaders headers;
  http_response response;

  string_body empty;
  ReadContext ctx{request.body ? request.body : &empty, nullptr};

  for (const auto& header : request.headers) {
    headers.append(header.first + ": " + header.second);
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(_timeouts.connect.count()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(_timeouts.total.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_VERBOSE, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, StringWriteCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

  switch (request.method) {
    case http_method::get:
      curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
      break;
    case http_method::put:
      curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(ctx.body->size()));
      break;
    case http_method::post:
      curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(ctx.body->size()));
      break;
    case http_method::del:
      curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "DELETE");
      break;
  }

  if (request.method == http_method::put || request.method == http_method::post) {
    curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, BodyReadCallback);
    curl_easy_setopt(curl.get(), CURLOPT_READDATA, &ctx);
    curl_easy_setopt(curl.get(), CURLOPT_SEEKFUNCTION, BodySeekCallback);
    curl_easy_setopt(curl.get(), CURLOPT_SEEKDATA, &ctx);
  }

  log(log_level::debug) << to_string(request.method) << " " << request.url << std::endl;

  CURLcode res = curl_easy_perform(curl.get());
  if (ctx.error) {
    std::rethrow_exception(ctx.error);
  }
  if (res != CURLE_OK) {
    throw transport_error(
        std::string(to_string(request.method)) + " " + request.url + ": curl error: " + curl_easy_strerror(res),
        is_transient(res));
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  log(log_level::debug) << to_string(request.method) << " " << request.url << ": HTTP " << response.status
                        << std::endl;
  return response;
}

}  // namespace iarepo
