#include "argparser.hpp"
#include "config.hpp"
#include "curl_transport.hpp"
#include "event.hpp"
#include "exception.hpp"
#include "filesystem.hpp"
#include "identifier.hpp"
#include "initializer.hpp"
#include "log.hpp"
#include "metadata.hpp"
#include "progress.hpp"
#include "repository.hpp"
#include "transfer_client.hpp"
#include "version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

int usage() {
  std::cerr << "iarepo resolve <repository>" << std::endl;
  std::cerr << "iarepo ls <repository>" << std::endl;
  std::cerr << "iarepo upload <repository> <directory> <file>..." << std::endl;
  std::cerr << "iarepo rm <repository> <path>" << std::endl;
  std::cerr << "iarepo mv <repository> <name> <source-directory> <target-directory>" << std::endl;
  std::cerr << "iarepo init [--test] [--strict] [--title <text>] [--description <text>] [--creator <text>]" << std::endl;
  std::cerr << "            [--date <yyyy-mm-dd>] [--language <code>] [--license-url <url>]" << std::endl;
  std::cerr << "            [--collection <name>] [--subject <tag,tag>] [--test-item] <folder> <identifier>" << std::endl;
  std::cerr << std::endl;
  std::cerr << "<repository> is a details URL or an identifier. Use / for the repository root directory." << std::endl;
  std::cerr << "Credentials are read from --access-key and --secret-key, or S3_ACCESS_KEY and S3_SECRET_KEY."
            << std::endl;
  std::cerr << std::endl;
  std::cerr << "collections:" << std::endl;
  for (iarepo::collection_type c : iarepo::all_collections()) {
    std::cerr << "  " << iarepo::to_string(c) << " - " << iarepo::describe(c) << std::endl;
  }
  return EXIT_FAILURE;
}

int version() {
  std::cout << "iarepo " << IAREPO_VERSION << std::endl;
  return EXIT_SUCCESS;
}

int error(const std::string& msg) {
  if (iarepo::events_enabled()) iarepo::event("error", "", msg);
  std::cerr << "error: " << msg << std::endl;
  return EXIT_FAILURE;
}

iarepo::config make_config(const iarepo::argparser& args) {
  iarepo::config cfg;

  iarepo::url s3(args.get_option("--s3-url"));
  if (s3.host().empty()) throw std::invalid_argument("invalid s3 url: " + args.get_option("--s3-url"));
  iarepo::url metadata(args.get_option("--metadata-url"));
  if (metadata.host().empty())
    throw std::invalid_argument("invalid metadata url: " + args.get_option("--metadata-url"));

  cfg.endpoints.s3 = s3;
  cfg.endpoints.metadata = metadata;
  cfg.auth.access_key = args.get_option("--access-key");
  cfg.auth.secret_key = args.get_option("--secret-key");

  try {
    cfg.timeouts.connect = std::chrono::seconds(std::stoi(args.get_option("--connect-timeout")));
    cfg.timeouts.total = std::chrono::seconds(std::stoi(args.get_option("--timeout")));
  }
  catch (const std::exception&) {
    throw std::invalid_argument("invalid timeout: " + args.get_option("--timeout"));
  }
  return cfg;
}

iarepo::metadata_record make_metadata(const iarepo::argparser& args) {
  iarepo::metadata_record record;
  record.title = args.get_option("--title");
  record.description = args.get_option("--description");
  record.creator = args.get_option("--creator");
  record.date = args.get_option("--date");
  record.language = args.get_option("--language");
  record.license_url = args.get_option("--license-url");
  record.collection = iarepo::parse_collection(args.get_option("--collection"));
  record.subjects = iarepo::parse_subjects(args.get_option("--subject"));
  record.test_item = args.has_option("--test-item");
  if (record.title.empty()) throw std::invalid_argument("missing --title");
  return record;
}

int cmd_iarepo(const iarepo::argparser& args) {
  if (args.size() < 1) throw std::invalid_argument("missing command argument");

  iarepo::config cfg = make_config(args);
  iarepo::curl_transport transport(cfg.timeouts);
  iarepo::transfer_client client(transport, cfg);
  iarepo::progress_bar progress(std::cerr, isatty(STDERR_FILENO));

  if (args[0] == "resolve") {
    if (args.size() < 2) throw std::invalid_argument("missing repository argument");

    std::cout << iarepo::resolve_identifier(args[1]) << std::endl;
    return EXIT_SUCCESS;
  }
  else if (args[0] == "ls") {
    if (args.size() < 2) throw std::invalid_argument("missing repository argument");

    iarepo::repository repo(client, iarepo::resolve_identifier(args[1]));
    std::vector<iarepo::remote_file> files = repo.list();
    if (files.empty()) {
      std::cerr << "no files found in repository" << std::endl;
      return EXIT_SUCCESS;
    }

    size_t index = 1;
    for (const auto& file : files) {
      std::cout << index++ << ". " << file.name << std::endl;
    }
    return EXIT_SUCCESS;
  }
  else if (args[0] == "upload") {
    if (args.size() < 2) throw std::invalid_argument("missing repository argument");
    if (args.size() < 3) throw std::invalid_argument("missing directory argument");
    if (args.size() < 4) throw std::invalid_argument("missing file argument");

    iarepo::repository repo(client, iarepo::resolve_identifier(args[1]));
    std::string directory = args[2];

    // Refuse to start unless every file is there
    std::vector<std::string> files = args.get_values_from(3);
    for (const auto& file : files) {
      if (!std::filesystem::is_regular_file(file)) throw std::invalid_argument("file not found: " + file);
    }

    size_t failed = 0;
    for (const auto& file : files) {
      try {
        repo.upload(file, directory, &progress);
      }
      catch (const iarepo::auth_config_error&) {
        throw;
      }
      catch (const iarepo::exception& e) {
        error(e.what());
        failed++;
      }
    }

    if (failed > 0) {
      return error(std::to_string(failed) + " of " + std::to_string(files.size()) + " files failed to upload");
    }
    return EXIT_SUCCESS;
  }
  else if (args[0] == "rm") {
    if (args.size() < 2) throw std::invalid_argument("missing repository argument");
    if (args.size() < 3) throw std::invalid_argument("missing path argument");

    iarepo::repository repo(client, iarepo::resolve_identifier(args[1]));
    repo.remove(args[2]);
    std::cerr << "deleted " << args[2] << std::endl;
    return EXIT_SUCCESS;
  }
  else if (args[0] == "mv") {
    if (args.size() < 2) throw std::invalid_argument("missing repository argument");
    if (args.size() < 5) throw std::invalid_argument("missing name, source or target directory argument");

    iarepo::repository repo(client, iarepo::resolve_identifier(args[1]));
    try {
      repo.move(args[2], args[3], args[4]);
    }
    catch (const iarepo::partial_move& e) {
      // The copy exists, only the delete has to be repeated
      error(e.what());
      std::cerr << "the file now exists in both directories, remove the original with: iarepo rm " << repo.identifier()
                << " " << e.source() << std::endl;
      return EXIT_FAILURE;
    }
    std::cerr << "moved " << iarepo::join_path(args[3], args[2]) << " to " << iarepo::join_path(args[4], args[2])
              << std::endl;
    return EXIT_SUCCESS;
  }
  else if (args[0] == "init") {
    if (args.size() < 2) throw std::invalid_argument("missing folder argument");
    if (args.size() < 3) throw std::invalid_argument("missing identifier argument");

    std::filesystem::path folder = args.get_value_path(1);
    if (!std::filesystem::is_directory(folder)) throw std::invalid_argument("not a directory: " + folder.string());

    iarepo::init_mode mode = args.has_option("--test") ? iarepo::init_mode::test : iarepo::init_mode::permanent;
    iarepo::metadata_record metadata = make_metadata(args);
    iarepo::repository repo(client, args[2]);

    iarepo::init_options options;
    options.strict = args.has_option("--strict");
    options.observer = &progress;

    iarepo::create_rules_file(folder);
    iarepo::init_result result = iarepo::initialize_repository(repo, folder, metadata, mode, options);

    if (mode == iarepo::init_mode::test) {
      std::cout << "test mode, nothing was uploaded" << std::endl;
      std::cout << "identifier: " << repo.identifier() << std::endl;
      std::cout << "metadata: " << metadata.to_json() << std::endl;
      std::cout << "files that would be uploaded:" << std::endl;
      for (const auto& f : result.files) {
        std::cout << " - " << f.path << std::endl;
      }
      return EXIT_SUCCESS;
    }

    std::cout << result.succeeded() << " of " << result.files.size() << " files uploaded" << std::endl;
    if (!result.ok()) {
      return error(result.summary());
    }
    std::cout << "metadata submitted" << std::endl;
    return EXIT_SUCCESS;
  }
  else {
    throw std::invalid_argument("unknown command: " + args[0]);
  }
}

int main(int argc, char* argv[]) {
  try {
    if (argc < 2) {
      return usage();
    }

    iarepo::argparser args;
    args.set_env_prefix("S3");
    args.add_option("--access-key", "");
    args.add_option("--secret-key", "");

    args.set_env_prefix("IAREPO");
    args.add_option("--s3-url", "https://s3.us.archive.org");
    args.add_option("--metadata-url", "https://archive.org");
    args.add_option("--connect-timeout", "60");
    args.add_option("--timeout", "600");
    args.add_option("--log-level", "warn");
    args.add_option_alias("--log-level", "-l");
    args.add_bool_option("--json");
    args.add_option_alias("--json", "-J");
    args.add_bool_option("--help");
    args.add_option_alias("--help", "-h");
    args.add_bool_option("--version");
    args.add_option_alias("--version", "-V");

    // init
    args.add_bool_option("--test");
    args.add_bool_option("--strict");
    args.add_bool_option("--test-item");
    args.add_option("--title", "");
    args.add_option("--description", "");
    args.add_option("--creator", "");
    args.add_option("--date", "");
    args.add_option("--language", "");
    args.add_option("--license-url", "");
    args.add_option("--collection", "community");
    args.add_option("--subject", "");
    args.parse(argc, argv);

    if (args.has_option("--help")) return usage();
    if (args.has_option("--version")) return version();
    if (args.has_option("--json")) iarepo::set_events_enabled();
    iarepo::set_log_level(iarepo::parse_log_level(args.get_option("--log-level")));

    return cmd_iarepo(args);
  }
  catch (const std::exception& e) {
    return error(e.what());
  }
}
