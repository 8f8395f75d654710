#ifndef URL_HPP
#define URL_HPP

#include <cstdio>
#include <string>

namespace iarepo {

// Percent-encode a path, leaving unreserved characters and '/' as they are
inline std::string escape_path(const std::string& path) {
  std::string out;
  out.reserve(path.size());
  for (unsigned char c : path) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
        c == '.' || c == '~' || c == '/') {
      out += static_cast<char>(c);
    }
    else {
      char hex[4];
      std::snprintf(hex, sizeof(hex), "%%%02X", c);
      out += hex;
    }
  }
  return out;
}

class url {
  std::string _url;

 public:
  explicit url(const std::string& url) : _url(url) {
    // Base URLs are joined with '/', drop the trailing ones
    while (!_url.empty() && _url.back() == '/') _url.pop_back();
  }

  std::string scheme() const {
    size_t pos = _url.find("://");
    if (pos == std::string::npos) return "";
    return _url.substr(0, pos);
  }

  std::string host() const {
    size_t pos = _url.find("://");
    pos = pos == std::string::npos ? 0 : pos + 3;
    size_t end = _url.find("/", pos);
    if (end == std::string::npos) return _url.substr(pos);
    return _url.substr(pos, end - pos);
  }

  std::string path() const {
    size_t pos = _url.find("://");
    pos = pos == std::string::npos ? 0 : pos + 3;
    size_t end = _url.find("/", pos);
    if (end == std::string::npos) return "/";
    return _url.substr(end);
  }

  const std::string& string() const { return _url; }

  // Append a relative path. Empty components are skipped so that a file in the
  // repository root does not produce a double slash.
  url operator/(const std::string& component) const {
    std::string c = component;
    while (!c.empty() && c.front() == '/') c.erase(0, 1);
    while (!c.empty() && c.back() == '/') c.pop_back();
    if (c.empty()) return *this;
    return url(_url + "/" + c);
  }
};

}  // namespace iarepo

#endif  // URL_HPP
