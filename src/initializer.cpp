#include "initializer.hpp"

#include "event.hpp"
#include "exception.hpp"
#include "filesystem.hpp"
#include "log.hpp"

#include <algorithm>
#include <sstream>

namespace iarepo {

namespace {

void record_failure(file_outcome& f, const exception& e) {
  f.error = e.what();
  log(log_level::error) << "failed to upload " << f.path << ": " << e.what() << std::endl;
  event("upload-failed", f.path, e.what());
}

}  // namespace

size_t init_result::succeeded() const {
  return static_cast<size_t>(
      std::count_if(files.begin(), files.end(), [](const file_outcome& f) { return f.uploaded; }));
}

size_t init_result::failed() const {
  return static_cast<size_t>(
      std::count_if(files.begin(), files.end(), [](const file_outcome& f) { return !f.error.empty(); }));
}

bool init_result::ok() const {
  if (mode == init_mode::test) return true;
  return !files.empty() && failed() == 0 && succeeded() == files.size() && metadata_submitted;
}

std::string init_result::summary() const {
  std::ostringstream ss;
  size_t count = failed();
  if (count > 0) {
    ss << count << " of " << files.size() << " files failed to upload:";
    for (const auto& f : files) {
      if (!f.error.empty()) ss << "\n  " << f.path << ": " << f.error;
    }
  }
  if (mode == init_mode::permanent && files.empty()) {
    ss << "no files to upload";
  }
  if (!metadata_error.empty()) {
    if (ss.tellp() > 0) ss << "\n";
    ss << "metadata: " << metadata_error;
  }
  return ss.str();
}

init_result initialize_repository(
    repository& repo, const std::filesystem::path& folder, const metadata_record& metadata, init_mode mode,
    const init_options& options) {
  repo.client().require_credentials();

  init_result result;
  result.mode = mode;

  for (const auto& relative : list_local_files(folder)) {
    file_outcome outcome;
    outcome.path = relative.generic_string();
    outcome.remote_directory = relative.parent_path().generic_string();
    result.files.push_back(outcome);
  }

  if (mode == init_mode::test) {
    log(log_level::info) << "test mode: " << result.files.size() << " files would be uploaded to "
                         << repo.identifier() << std::endl;
    for (const auto& f : result.files) {
      log(log_level::info) << "would upload " << f.path << std::endl;
      event("would-upload", f.path);
    }
    log(log_level::info) << "would submit metadata " << metadata.to_json() << std::endl;
    event("would-submit-metadata", repo.identifier(), metadata.to_json());
    return result;
  }

  for (auto& f : result.files) {
    try {
      repo.upload(folder / f.path, f.remote_directory, options.observer);
      f.uploaded = true;
    }
    catch (const upload_failed& e) {
      // Every later request would be rejected as well
      if (e.status() == 401 || e.status() == 403) {
        throw auth_config_error(e.what(), e.status());
      }
      record_failure(f, e);
      if (options.strict) break;
    }
    catch (const auth_config_error&) {
      throw;
    }
    catch (const exception& e) {
      record_failure(f, e);
      if (options.strict) break;
    }
  }

  if (options.strict && result.failed() > 0) {
    result.metadata_error = "skipped after failed upload";
  }
  else if (result.succeeded() == 0) {
    result.metadata_error = "skipped, no file was uploaded";
  }
  else {
    try {
      repo.submit_metadata(metadata);
      result.metadata_submitted = true;
    }
    catch (const exception& e) {
      result.metadata_error = e.what();
      event("metadata-failed", repo.identifier(), e.what());
    }
  }

  if (!result.ok()) {
    log(log_level::error) << repo.identifier() << ": " << result.summary() << std::endl;
  }
  return result;
}

}  // namespace iarepo
