#pragma once

#include "metadata.hpp"
#include "transfer_client.hpp"
#include "upload.hpp"
#include "url.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace iarepo {

// A file stored in a remote repository
struct remote_file {
  std::string name;
  uint64_t size = 0;
};

// Progress of a two-phase move
enum class move_state {
  pending,
  copied,
  deleted,
};

// Join a repository directory and a name. An empty directory is the root.
std::string join_path(const std::string& directory, const std::string& name);

// Returns true if any directory component of the path ends in ".thumbs"
bool is_thumbnail_path(const std::string& path);

// Parse the file manifest of a metadata document. Thumbnail derivatives are
// left out and manifest order is kept. Throws metadata_fetch_error if the
// document is not valid JSON.
std::vector<remote_file> parse_manifest(const std::string& document);

// Operations on one remote repository. Every request goes through the
// transfer client, which must outlive the repository.
class repository {
 public:
  // Throws invalid_reference if the identifier is malformed
  repository(transfer_client& client, const std::string& identifier);

  const std::string& identifier() const { return _identifier; }
  transfer_client& client() const { return _client; }

  // Stream a local file into remote_directory, keeping its file name.
  // Throws upload_failed if the file cannot be read or the remote refuses it.
  void upload(
      const std::filesystem::path& local_path, const std::string& remote_directory,
      progress_observer* observer = nullptr);

  // Fetch the file listing. Each call fetches the manifest again.
  std::vector<remote_file> list();

  // Delete one file. Throws delete_failed unless the remote answers 200 or 204.
  void remove(const std::string& path);

  // Copy name from source_directory to target_directory, then delete the
  // source. The source is only deleted once the copy is confirmed.
  // Throws copy_failed if the copy was refused and partial_move if the copy
  // succeeded but the source could not be deleted.
  move_state move(const std::string& name, const std::string& source_directory, const std::string& target_directory);

  // Register the repository metadata. Throws http_error on refusal.
  void submit_metadata(const metadata_record& record);

 private:
  url object_url(const std::string& path) const;
  url metadata_url() const;

 private:
  transfer_client& _client;
  std::string _identifier;
};

}  // namespace iarepo
