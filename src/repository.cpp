#include "repository.hpp"

#include "event.hpp"
#include "exception.hpp"
#include "identifier.hpp"
#include "log.hpp"

#include <charconv>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

namespace iarepo {

namespace {

std::string strip_slashes(const std::string& s) {
  size_t begin = s.find_first_not_of('/');
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of('/');
  return s.substr(begin, end - begin + 1);
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Sizes appear both as strings and as numbers in manifests
uint64_t manifest_size(const nlohmann::json& entry) {
  auto it = entry.find("size");
  if (it == entry.end()) return 0;
  if (it->is_number_unsigned()) return it->get<uint64_t>();
  if (it->is_string()) {
    const std::string& s = it->get_ref<const std::string&>();
    uint64_t size = 0;
    auto result = std::from_chars(s.data(), s.data() + s.size(), size);
    // Anything but a whole in-range number is an unknown size
    if (result.ec == std::errc() && result.ptr == s.data() + s.size()) return size;
  }
  return 0;
}

}  // namespace

std::string join_path(const std::string& directory, const std::string& name) {
  std::string dir = strip_slashes(directory);
  std::string file = strip_slashes(name);
  if (dir.empty()) return file;
  if (file.empty()) return dir;
  return dir + "/" + file;
}

bool is_thumbnail_path(const std::string& path) {
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) end = path.size();
    if (ends_with(path.substr(start, end - start), ".thumbs")) return true;
    start = end + 1;
  }
  return false;
}

std::vector<remote_file> parse_manifest(const std::string& document) {
  nlohmann::json data = nlohmann::json::parse(document, nullptr, false);
  if (data.is_discarded() || !data.is_object()) {
    throw metadata_fetch_error("malformed metadata document", 0, document);
  }

  std::vector<remote_file> files;
  auto it = data.find("files");
  if (it == data.end()) {
    return files;
  }
  if (!it->is_array()) {
    throw metadata_fetch_error("malformed metadata document: files is not an array", 0, document);
  }

  for (const auto& entry : *it) {
    if (!entry.is_object()) continue;
    auto name = entry.find("name");
    if (name == entry.end() || !name->is_string()) continue;

    remote_file file;
    file.name = name->get<std::string>();
    if (is_thumbnail_path(file.name)) continue;
    file.size = manifest_size(entry);
    files.push_back(file);
  }
  return files;
}

repository::repository(transfer_client& client, const std::string& identifier)
    : _client(client), _identifier(identifier) {
  if (!is_valid_identifier(identifier)) {
    throw invalid_reference("invalid repository identifier: " + identifier);
  }
}

url repository::object_url(const std::string& path) const {
  return _client.endpoints().s3 / _identifier / escape_path(path);
}

url repository::metadata_url() const { return _client.endpoints().metadata / "metadata" / _identifier; }

std::vector<remote_file> repository::list() {
  http_request request;
  request.method = http_method::get;
  request.url = metadata_url().string();

  http_response response;
  try {
    response = _client.send(request);
  }
  catch (const auth_config_error& e) {
    throw metadata_fetch_error(
        "failed to fetch metadata of " + _identifier + ": credentials rejected", e.status(), "");
  }
  if (!response.ok()) {
    throw metadata_fetch_error("failed to fetch metadata of " + _identifier, response.status, response.body);
  }

  std::vector<remote_file> files = parse_manifest(response.body);
  log(log_level::debug) << _identifier << ": " << files.size() << " files" << std::endl;
  return files;
}

void repository::remove(const std::string& path) {
  http_request request;
  request.method = http_method::del;
  request.url = object_url(path).string();

  http_response response;
  try {
    response = _client.send(request);
  }
  catch (const auth_config_error& e) {
    if (!e.rejected()) throw;
    throw delete_failed(
        "failed to delete " + _identifier + "/" + path + ": credentials rejected", e.status(), "");
  }
  if (response.status != 200 && response.status != 204) {
    throw delete_failed("failed to delete " + _identifier + "/" + path, response.status, response.body);
  }

  event("deleted", path);
  log(log_level::info) << "deleted " << _identifier << "/" << path << std::endl;
}

move_state repository::move(
    const std::string& name, const std::string& source_directory, const std::string& target_directory) {
  const std::string source = join_path(source_directory, name);
  const std::string target = join_path(target_directory, name);

  // A copy onto itself followed by the delete would lose the file
  if (source == target) {
    throw copy_failed("source and target of move are the same: " + source, 0, "");
  }

  move_state state = move_state::pending;

  http_request request;
  request.method = http_method::put;
  request.url = object_url(target).string();
  request.headers["x-amz-copy-source"] = "/" + _identifier + "/" + escape_path(source);

  http_response response;
  try {
    response = _client.send(request);
  }
  catch (const auth_config_error& e) {
    // Missing credentials stay a configuration error, a rejection is a failed copy
    if (!e.rejected()) throw;
    throw copy_failed("failed to copy " + source + " to " + target + ": credentials rejected", e.status(), "");
  }
  catch (const transfer_exhausted& e) {
    throw copy_failed(std::string("failed to copy ") + source + " to " + target + ": " + e.what(), e.status(), "");
  }
  catch (const transport_error& e) {
    throw copy_failed(std::string("failed to copy ") + source + " to " + target + ": " + e.what(), 0, "");
  }

  if (!response.ok()) {
    throw copy_failed("failed to copy " + source + " to " + target, response.status, response.body);
  }

  state = move_state::copied;
  log(log_level::info) << "copied " << _identifier << "/" << source << " to " << target << std::endl;

  try {
    remove(source);
  }
  catch (const http_error& e) {
    throw partial_move(
        "copied " + source + " to " + target + " but failed to delete the original", source, e.status(), e.body());
  }
  catch (const exception& e) {
    throw partial_move(
        "copied " + source + " to " + target + " but failed to delete the original: " + e.what(), source, 0, "");
  }

  state = move_state::deleted;
  event("moved", source, target);
  log(log_level::info) << "moved " << _identifier << "/" << source << " to " << target << std::endl;
  return state;
}

void repository::submit_metadata(const metadata_record& record) {
  string_body body(record.to_json());

  http_request request;
  request.method = http_method::post;
  request.url = metadata_url().string();
  request.headers["content-type"] = "application/json";
  request.body = &body;

  http_response response;
  try {
    response = _client.send(request);
  }
  catch (const auth_config_error& e) {
    if (!e.rejected()) throw;
    throw http_error(
        "failed to submit metadata of " + _identifier + ": credentials rejected", e.status(), "");
  }
  if (!response.ok()) {
    throw http_error("failed to submit metadata of " + _identifier, response.status, response.body);
  }

  event("metadata", _identifier);
  log(log_level::info) << "submitted metadata of " << _identifier << std::endl;
}

}  // namespace iarepo
