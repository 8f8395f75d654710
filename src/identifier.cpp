#include "identifier.hpp"

#include "exception.hpp"

#include <regex>
#include <string>

namespace iarepo {

namespace {

const std::regex identifier_regex("^[A-Za-z0-9][A-Za-z0-9._-]*$");
const std::regex details_regex("/details/([^/?#]+)");

// Strip surrounding whitespace and quotes, as pasted from a shell or a browser
std::string trim(const std::string& s) {
  const char* junk = " \t\r\n\"'";
  size_t begin = s.find_first_not_of(junk);
  if (begin == std::string::npos) return "";
  size_t end = s.find_last_not_of(junk);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

bool is_valid_identifier(const std::string& identifier) { return std::regex_match(identifier, identifier_regex); }

std::string resolve_identifier(const std::string& reference) {
  std::string ref = trim(reference);

  std::smatch match;
  if (std::regex_search(ref, match, details_regex)) {
    return match[1].str();
  }

  if (is_valid_identifier(ref)) {
    return ref;
  }

  throw invalid_reference("invalid repository reference: " + reference);
}

}  // namespace iarepo
