#pragma once

#include <stdexcept>
#include <string>

namespace iarepo {

class exception : public std::runtime_error {
 public:
  explicit exception(const std::string& message) : std::runtime_error(message) {}
};

// The repository reference is neither a details URL nor a valid identifier.
class invalid_reference : public exception {
 public:
  explicit invalid_reference(const std::string& message) : exception(message) {}
};

// Credentials are missing or were rejected by the remote. Never retried.
class auth_config_error : public exception {
  long _status;

 public:
  explicit auth_config_error(const std::string& message, long status = 0) : exception(message), _status(status) {}

  // 401 or 403 when the remote rejected the credentials, 0 when they are missing
  long status() const { return _status; }
  bool rejected() const { return _status != 0; }
};

// A transient failure persisted through the whole retry budget.
class transfer_exhausted : public exception {
  int _attempts;
  long _status;

 public:
  transfer_exhausted(const std::string& message, int attempts, long status)
      : exception(message), _attempts(attempts), _status(status) {}

  int attempts() const { return _attempts; }

  // Last HTTP status seen, or 0 if the last attempt failed at the transport level.
  long status() const { return _status; }
};

// Terminal failure carrying the HTTP response for diagnostics.
class http_error : public exception {
  long _status;
  std::string _body;

 public:
  http_error(const std::string& message, long status, const std::string& body)
      : exception(status != 0 ? message + ": HTTP " + std::to_string(status) : message),
        _status(status),
        _body(body) {}

  // HTTP status of the failed response, 0 when no response was involved.
  long status() const { return _status; }
  const std::string& body() const { return _body; }
};

class upload_failed : public http_error {
 public:
  upload_failed(const std::string& message, long status = 0, const std::string& body = "")
      : http_error(message, status, body) {}
};

class delete_failed : public http_error {
 public:
  delete_failed(const std::string& message, long status, const std::string& body)
      : http_error(message, status, body) {}
};

class metadata_fetch_error : public http_error {
 public:
  metadata_fetch_error(const std::string& message, long status, const std::string& body)
      : http_error(message, status, body) {}
};

// The copy phase of a move failed. Nothing changed on the remote.
class copy_failed : public http_error {
 public:
  copy_failed(const std::string& message, long status, const std::string& body)
      : http_error(message, status, body) {}
};

// The copy phase of a move succeeded but the source could not be deleted.
// The object now exists at both paths; source() is the path left to delete.
class partial_move : public http_error {
  std::string _source;

 public:
  partial_move(const std::string& message, const std::string& source, long status, const std::string& body)
      : http_error(message, status, body), _source(source) {}

  const std::string& source() const { return _source; }
};

}  // namespace iarepo
