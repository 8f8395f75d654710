#include "event.hpp"

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace iarepo {

static bool _events_enabled = false;
static std::ostream* _stream = &std::cerr;
static std::mutex _mutex;

void set_events_enabled(bool enabled) { _events_enabled = enabled; }
bool events_enabled() { return _events_enabled; }

void set_event_stream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(_mutex);
  _stream = &stream;
}

static void emit(const nlohmann::json& object) {
  commit_ostream stream([](const std::string& line) {
    std::lock_guard<std::mutex> lock(_mutex);
    *_stream << line << std::flush;
  });
  stream << object.dump() << "\n";
}

// Emit an event in JSON format
void event(const std::string& type, const std::string& path, const std::string& message) {
  if (!_events_enabled) {
    return;
  }

  nlohmann::json object = {{"type", type}, {"path", path}};
  if (!message.empty()) {
    object["message"] = message;
  }
  emit(object);
}

void event(const std::string& type, const std::string& path, uint64_t value) {
  if (!_events_enabled) {
    return;
  }

  emit({{"type", type}, {"path", path}, {"value", value}});
}

}  // namespace iarepo
