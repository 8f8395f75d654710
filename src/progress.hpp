#pragma once

#include "upload.hpp"

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

namespace iarepo {

std::string format_bytes(uint64_t bytes);

// Progress observer for the command line. Draws a bar on a terminal, or
// emits progress events when JSON events are enabled.
class progress_bar : public progress_observer {
  std::ostream& _out;
  std::string _name;
  std::chrono::steady_clock::time_point _start;
  bool _interactive;

 public:
  explicit progress_bar(std::ostream& out, bool interactive = true);

  void on_start(const std::string& name, uint64_t total_bytes) override;
  void on_progress(uint64_t bytes_so_far, uint64_t total_bytes) override;
};

}  // namespace iarepo
