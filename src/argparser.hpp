#ifndef ARGS_HPP
#define ARGS_HPP

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace iarepo {

// Command line options with environment variable fallback. An option added
// while an env prefix is set also reads PREFIX_NAME from the environment,
// e.g. --access-key with prefix S3 reads S3_ACCESS_KEY.
class argparser {
  struct option {
    std::string value;
    std::string default_value;
    bool has_value;
  };

  std::map<std::string, std::shared_ptr<option>> _options;
  std::vector<std::string> _values;
  std::string _env_prefix;
  std::string _command;

 public:
  argparser();

  void parse(int argc, char** argv);

  void set_env_prefix(const std::string& prefix);

  void add_option(const std::string& name, const std::string& default_value);
  void add_option_alias(const std::string& name, const std::string& alias);
  void add_bool_option(const std::string& name);

  std::string get_option(const std::string& name) const;

  // Check if the option is set on the command line or in the environment
  bool has_option(const std::string& name) const;

  std::string get_value(size_t index) const;
  std::filesystem::path get_value_path(size_t index) const;

  // Positional values from index to the end
  std::vector<std::string> get_values_from(size_t index) const;

  // Returns the number of values
  size_t size() const;

  // Returns the value at the given index
  std::string operator[](size_t index) const;

  // Program name as invoked
  std::string command() const;

 private:
  const option& find(const std::string& name) const;
};

}  // namespace iarepo

#endif  // ARGS_HPP
