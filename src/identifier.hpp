#pragma once

#include <string>

namespace iarepo {

// Returns true if the string is a well formed repository identifier.
bool is_valid_identifier(const std::string& identifier);

// Extracts the repository identifier from a reference, which is either a
// details URL such as https://archive.org/details/{identifier} or the bare
// identifier. Throws invalid_reference if neither form matches.
std::string resolve_identifier(const std::string& reference);

}  // namespace iarepo
