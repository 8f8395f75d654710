#pragma once

#include "commit_ostream.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace iarepo {

// JSON-lines events for machine consumers, written to stderr when enabled.
void set_events_enabled(bool enabled = true);
bool events_enabled();

// Redirect events, mainly for tests. The stream must outlive all event calls.
void set_event_stream(std::ostream& stream);

void event(const std::string& type, const std::string& path, const std::string& message = "");
void event(const std::string& type, const std::string& path, uint64_t value);

}  // namespace iarepo
