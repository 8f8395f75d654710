#pragma once

#include <set>
#include <string>
#include <vector>

namespace iarepo {

// Collections a new repository can be filed under
enum class collection_type {
  community,
  opensource,
  texts,
  movies,
  audio,
  image,
  etree,
  folksoundomy,
  games,
  software,
};

const std::vector<collection_type>& all_collections();
const char* to_string(collection_type collection);
const char* describe(collection_type collection);

// Accepts the collection name or its 1-based position in all_collections().
// Throws std::invalid_argument for anything else.
collection_type parse_collection(const std::string& name);

// Split a comma separated list of subject tags, dropping empty ones
std::set<std::string> parse_subjects(const std::string& list);

// Descriptive fields submitted when a repository is created
struct metadata_record {
  std::string title;
  std::string description;
  std::string creator;
  std::string date;
  std::string language;
  std::string license_url;
  collection_type collection = collection_type::community;
  std::set<std::string> subjects;

  // Test items are removed by the service after 30 days
  bool test_item = false;

  // JSON payload. Empty fields are left out, and so is test_item unless set.
  std::string to_json() const;
};

}  // namespace iarepo
