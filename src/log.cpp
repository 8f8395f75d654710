#include "log.hpp"

#include <iostream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>

namespace iarepo {

static log_level _log_level = log_level::off;
static std::ostream& _stream(std::cerr);
static std::mutex _mutex;

void set_log_level(log_level level) { _log_level = level; }

log_level parse_log_level(const std::string& name) {
  if (name == "debug") return log_level::debug;
  if (name == "info") return log_level::info;
  if (name == "warn" || name == "warning") return log_level::warn;
  if (name == "error") return log_level::error;
  if (name == "off" || name == "none") return log_level::off;
  throw std::invalid_argument("invalid log level: " + name);
}

mutex_ostream log(log_level level) {
  if (level == log_level::off || level < _log_level) {
    return mutex_ostream();
  }

  mutex_ostream stream(_stream, _mutex);
  switch (level) {
    case log_level::debug:
      stream << "debug - ";
      break;
    case log_level::info:
      stream << "info - ";
      break;
    case log_level::warn:
      stream << "warn - ";
      break;
    case log_level::error:
      stream << "error - ";
      break;
    default:
      break;
  }
  return stream;
}

}  // namespace iarepo
