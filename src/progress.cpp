#include "progress.hpp"

#include "event.hpp"

#include <cstdio>

namespace iarepo {

std::string format_bytes(uint64_t bytes) {
  char buf[32];
  double b = static_cast<double>(bytes);
  if (b >= 1024.0 * 1024.0 * 1024.0)
    std::snprintf(buf, sizeof(buf), "%.1f GiB", b / (1024.0 * 1024.0 * 1024.0));
  else if (b >= 1024.0 * 1024.0)
    std::snprintf(buf, sizeof(buf), "%.1f MiB", b / (1024.0 * 1024.0));
  else if (b >= 1024.0)
    std::snprintf(buf, sizeof(buf), "%.1f KiB", b / 1024.0);
  else
    std::snprintf(buf, sizeof(buf), "%.0f B", b);
  return buf;
}

progress_bar::progress_bar(std::ostream& out, bool interactive) : _out(out), _interactive(interactive) {}

void progress_bar::on_start(const std::string& name, uint64_t total_bytes) {
  _name = name;
  _start = std::chrono::steady_clock::now();
  event("upload", name, total_bytes);
}

void progress_bar::on_progress(uint64_t bytes_so_far, uint64_t total_bytes) {
  if (events_enabled()) {
    event("progress", _name, bytes_so_far);
    return;
  }

  bool done = bytes_so_far >= total_bytes;
  if (!_interactive && !done) {
    return;
  }

  double pct = total_bytes > 0 ? 100.0 * bytes_so_far / total_bytes : 100.0;
  double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - _start).count();
  uint64_t rate = elapsed > 0.01 ? static_cast<uint64_t>(bytes_so_far / elapsed) : 0;

  const int width = 30;
  int filled = static_cast<int>(pct / 100.0 * width);
  if (filled > width) filled = width;
  std::string bar(filled, '=');
  if (filled < width) bar += '>' + std::string(width - filled - 1, ' ');

  char pct_str[8];
  std::snprintf(pct_str, sizeof(pct_str), "%3.0f%%", pct);

  _out << "\r" << _name << "  " << format_bytes(bytes_so_far) << " / " << format_bytes(total_bytes) << "  [" << bar
       << "]  " << pct_str << "  " << format_bytes(rate) << "/s   ";
  if (done) _out << "\n";
  _out.flush();
}

}  // namespace iarepo
