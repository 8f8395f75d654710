#include "upload.hpp"

#include "event.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "repository.hpp"

#include <algorithm>
#include <cstring>
#include <system_error>

namespace iarepo {

chunked_file_body::chunked_file_body(const std::filesystem::path& path, progress_observer* observer, size_t chunk)
    : _path(path), _chunk(chunk), _observer(observer) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw upload_failed("not a regular file: " + path.string());
  }

  _size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw upload_failed("failed to stat file: " + path.string() + ": " + ec.message());
  }

  _file.open(path, std::ios::binary);
  if (!_file.is_open()) {
    throw upload_failed("failed to open file for reading: " + path.string());
  }
}

size_t chunked_file_body::read(char* buffer, size_t max) {
  if (_chunk_offset == _chunk_length && !next_chunk()) {
    return 0;
  }

  // Never cross a chunk boundary in a single read
  size_t n = std::min(max, _chunk_length - _chunk_offset);
  std::memcpy(buffer, _chunk.data() + _chunk_offset, n);
  _chunk_offset += n;

  if (_chunk_offset == _chunk_length) {
    _sent += _chunk_length;
    report();
  }
  return n;
}

void chunked_file_body::rewind() {
  _file.clear();
  _file.seekg(0, std::ios::beg);
  if (!_file) {
    throw upload_failed("failed to rewind file: " + _path.string());
  }
  _chunk_length = 0;
  _chunk_offset = 0;
  _sent = 0;
  _chunks = 0;
}

bool chunked_file_body::next_chunk() {
  if (_sent >= _size) {
    return false;
  }

  size_t want = static_cast<size_t>(std::min<uint64_t>(_chunk.size(), _size - _sent));
  _file.read(_chunk.data(), want);
  if (static_cast<size_t>(_file.gcount()) != want) {
    throw upload_failed("failed to read file: " + _path.string() + ": file changed during upload");
  }

  _chunk_length = want;
  _chunk_offset = 0;
  _chunks++;
  return true;
}

void chunked_file_body::report() {
  if (_sent <= _reported) {
    return;
  }
  _reported = _sent;
  if (_observer) {
    _observer->on_progress(_sent, _size);
  }
}

// Send the file to {s3}/{identifier}/{remote_directory}/{filename} as one streamed PUT.
void repository::upload(
    const std::filesystem::path& local_path, const std::string& remote_directory, progress_observer* observer) {
  std::string name = local_path.filename().string();
  std::string remote_path = join_path(remote_directory, name);

  chunked_file_body body(local_path, observer);
  if (observer) {
    observer->on_start(remote_path, body.size());
  }

  http_request request;
  request.method = http_method::put;
  request.url = object_url(remote_path).string();
  request.body = &body;

  log(log_level::info) << "uploading " << local_path.string() << " to " << _identifier << "/" << remote_path << " ("
                       << body.size() << " bytes)" << std::endl;

  http_response response;
  try {
    response = _client.send(request);
  }
  catch (const auth_config_error& e) {
    if (!e.rejected()) throw;
    throw upload_failed("failed to upload " + local_path.string() + ": credentials rejected", e.status());
  }
  catch (const transport_error& e) {
    throw upload_failed("failed to upload " + local_path.string() + ": " + e.what());
  }

  if (!response.ok()) {
    throw upload_failed("failed to upload " + local_path.string(), response.status, response.body);
  }

  // An empty file has no chunks, report its completion here
  if (body.size() == 0 && observer) {
    observer->on_progress(0, 0);
  }

  event("uploaded", remote_path, body.size());
  log(log_level::info) << "uploaded " << _identifier << "/" << remote_path << std::endl;
}

}  // namespace iarepo
