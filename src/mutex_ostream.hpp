#pragma once

#include <iostream>
#include <mutex>

namespace iarepo {

// An output stream that holds a lock on a shared mutex for its lifetime, so that
// one log line is never interleaved with another.
// A default constructed stream has no buffer and discards everything.

class mutex_ostream : public std::ostream {
  std::unique_lock<std::mutex> _lock;

 public:
  mutex_ostream() : std::ostream(nullptr) {}

  mutex_ostream(std::ostream& stream, std::mutex& mutex) : std::ostream(stream.rdbuf()), _lock(mutex) {}

  mutex_ostream(mutex_ostream&& other) : std::ostream(other.rdbuf()), _lock(std::move(other._lock)) {}
};

}  // namespace iarepo
