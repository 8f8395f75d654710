#include "filesystem.hpp"

#include "log.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace iarepo {

std::vector<fs::path> list_local_files(const fs::path& folder) {
  std::error_code ec;
  if (!fs::is_directory(folder, ec)) {
    throw std::invalid_argument("not a directory: " + folder.string());
  }

  std::vector<fs::path> files;
  fs::recursive_directory_iterator it(folder, ec);
  if (ec) {
    throw std::runtime_error("failed to read directory: " + folder.string() + ": " + ec.message());
  }

  for (fs::recursive_directory_iterator end; it != end;) {
    if (it->is_regular_file(ec)) {
      files.push_back(it->path().lexically_relative(folder));
    }
    it.increment(ec);
    if (ec) {
      throw std::runtime_error("failed to read directory: " + folder.string() + ": " + ec.message());
    }
  }

  std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
    return a.generic_string() < b.generic_string();
  });
  return files;
}

bool create_rules_file(const fs::path& folder) {
  fs::path rules = folder / rules_file_name;

  std::error_code ec;
  if (fs::exists(rules, ec)) {
    log(log_level::info) << rules.string() << " already exists, skipping creation" << std::endl;
    return false;
  }

  std::ofstream out(rules, std::ios::binary);
  if (!out.is_open()) {
    throw std::runtime_error("failed to create " + rules.string());
  }
  out << rules_file_default;
  out.close();
  if (!out) {
    throw std::runtime_error("failed to write " + rules.string());
  }

  log(log_level::info) << "created " << rules.string() << std::endl;
  return true;
}

}  // namespace iarepo
