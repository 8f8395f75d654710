#include "http.hpp"

#include <algorithm>
#include <cstring>

namespace iarepo {

const char* to_string(http_method method) {
  switch (method) {
    case http_method::get:
      return "GET";
    case http_method::put:
      return "PUT";
    case http_method::post:
      return "POST";
    case http_method::del:
      return "DELETE";
  }
  return "GET";
}

size_t string_body::read(char* buffer, size_t max) {
  size_t n = std::min(max, _data.size() - _offset);
  std::memcpy(buffer, _data.data() + _offset, n);
  _offset += n;
  return n;
}

}  // namespace iarepo
