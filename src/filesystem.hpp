#ifndef FILESYSTEM_HPP
#define FILESYSTEM_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace iarepo {

// Name and default contents of the rules marker placed in a folder before it
// is turned into a repository
constexpr const char* rules_file_name = "_rules.conf";
constexpr const char* rules_file_default = "CAT.ALL\n";

// Regular files below the folder, recursively, as paths relative to it and
// sorted by path. Symlinked directories are not descended into.
// Throws std::invalid_argument if folder is not a directory.
std::vector<std::filesystem::path> list_local_files(const std::filesystem::path& folder);

// Create the rules marker in the folder unless it exists.
// Returns true if the file was created.
bool create_rules_file(const std::filesystem::path& folder);

}  // namespace iarepo

#endif  // FILESYSTEM_HPP
