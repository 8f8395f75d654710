#pragma once

#include "metadata.hpp"
#include "repository.hpp"
#include "upload.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace iarepo {

// Test mode walks the folder and reports what would be done without sending
// any mutating request. Permanent mode performs the uploads.
enum class init_mode { test, permanent };

struct init_options {
  // Stop at the first failed upload and skip the metadata submission
  bool strict = false;

  // Receives progress of each upload, may be null
  progress_observer* observer = nullptr;
};

struct file_outcome {
  // Path relative to the folder, with '/' separators
  std::string path;
  std::string remote_directory;
  bool uploaded = false;
  std::string error;
};

struct init_result {
  init_mode mode = init_mode::test;

  // One entry per file found, in upload order
  std::vector<file_outcome> files;

  bool metadata_submitted = false;
  std::string metadata_error;

  size_t succeeded() const;
  size_t failed() const;

  // Every file uploaded and the metadata submitted, or a clean test run
  bool ok() const;

  // Human readable summary of the failures, empty if there are none
  std::string summary() const;
};

// Create a repository from the files below folder, then register its metadata.
// Uploads run one after the other. A failed upload is recorded and the
// remaining files are still attempted unless options.strict is set. The
// metadata is submitted unless no file was uploaded.
// Throws std::invalid_argument if folder is not a directory and
// auth_config_error if credentials are missing or rejected.
init_result initialize_repository(
    repository& repo, const std::filesystem::path& folder, const metadata_record& metadata, init_mode mode,
    const init_options& options = init_options());

}  // namespace iarepo
