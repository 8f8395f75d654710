#pragma once

#include "http.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace iarepo {

// Uploads are streamed in chunks of this size
constexpr size_t chunk_size = 2 * 1024 * 1024;

// Receives byte level progress of an upload.
class progress_observer {
 public:
  virtual ~progress_observer() = default;

  // Called once before the first byte is sent
  virtual void on_start(const std::string& name, uint64_t total_bytes) {
    (void)name;
    (void)total_bytes;
  }

  // Called after each chunk with the cumulative number of bytes sent
  virtual void on_progress(uint64_t bytes_so_far, uint64_t total_bytes) = 0;
};

// Request body reading a file one chunk at a time. Only one chunk is held in
// memory. Progress is reported per chunk and never goes backwards, even when
// the body is rewound for a retry.
class chunked_file_body : public body_source {
  std::filesystem::path _path;
  std::ifstream _file;
  uint64_t _size = 0;
  std::vector<char> _chunk;
  size_t _chunk_length = 0;
  size_t _chunk_offset = 0;
  uint64_t _sent = 0;
  uint64_t _reported = 0;
  size_t _chunks = 0;
  progress_observer* _observer;

 public:
  explicit chunked_file_body(
      const std::filesystem::path& path, progress_observer* observer = nullptr, size_t chunk = chunk_size);

  uint64_t size() const override { return _size; }
  size_t read(char* buffer, size_t max) override;
  void rewind() override;

  // Chunks read from the file since the last rewind
  size_t chunks() const { return _chunks; }

 private:
  bool next_chunk();
  void report();
};

}  // namespace iarepo
