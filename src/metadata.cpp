#include "metadata.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace iarepo {

namespace {

std::string trim(const std::string& s) {
  size_t begin = s.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

std::string tolower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  return s;
}

}  // namespace

const std::vector<collection_type>& all_collections() {
  static const std::vector<collection_type> collections = {
      collection_type::community, collection_type::opensource, collection_type::texts,
      collection_type::movies,    collection_type::audio,      collection_type::image,
      collection_type::etree,     collection_type::folksoundomy, collection_type::games,
      collection_type::software,
  };
  return collections;
}

const char* to_string(collection_type collection) {
  switch (collection) {
    case collection_type::community:
      return "community";
    case collection_type::opensource:
      return "opensource";
    case collection_type::texts:
      return "texts";
    case collection_type::movies:
      return "movies";
    case collection_type::audio:
      return "audio";
    case collection_type::image:
      return "image";
    case collection_type::etree:
      return "etree";
    case collection_type::folksoundomy:
      return "folksoundomy";
    case collection_type::games:
      return "games";
    case collection_type::software:
      return "software";
  }
  return "community";
}

const char* describe(collection_type collection) {
  switch (collection) {
    case collection_type::community:
      return "general-purpose collection for user-contributed materials";
    case collection_type::opensource:
      return "open-source software";
    case collection_type::texts:
      return "books, magazines and other written documents";
    case collection_type::movies:
      return "videos, movies and visual media";
    case collection_type::audio:
      return "audio recordings, including music and podcasts";
    case collection_type::image:
      return "images or photography";
    case collection_type::etree:
      return "live music archive for etree community recordings";
    case collection_type::folksoundomy:
      return "independent and user-contributed audio content";
    case collection_type::games:
      return "video games and gaming-related resources";
    case collection_type::software:
      return "software applications and tools";
  }
  return "";
}

collection_type parse_collection(const std::string& input) {
  std::string name = tolower(trim(input));
  const auto& collections = all_collections();

  for (collection_type c : collections) {
    if (name == to_string(c)) return c;
  }

  if (!name.empty() && name.find_first_not_of("0123456789") == std::string::npos && name.size() < 3) {
    size_t index = std::stoul(name);
    if (index >= 1 && index <= collections.size()) return collections[index - 1];
  }

  throw std::invalid_argument("unknown collection: " + input);
}

std::set<std::string> parse_subjects(const std::string& list) {
  std::set<std::string> subjects;
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(',', start);
    if (end == std::string::npos) end = list.size();
    std::string subject = trim(list.substr(start, end - start));
    if (!subject.empty()) subjects.insert(subject);
    start = end + 1;
  }
  return subjects;
}

std::string metadata_record::to_json() const {
  nlohmann::json payload = nlohmann::json::object();

  auto put = [&payload](const char* key, const std::string& value) {
    if (!value.empty()) payload[key] = value;
  };
  put("title", title);
  put("description", description);
  put("creator", creator);
  put("date", date);
  put("language", language);
  put("licenseurl", license_url);
  payload["collection"] = to_string(collection);

  if (!subjects.empty()) {
    payload["subject"] = subjects;
  }
  if (test_item) {
    payload["test_item"] = true;
  }

  return payload.dump();
}

}  // namespace iarepo
