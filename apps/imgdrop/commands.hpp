// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_CLI_COMMANDS_HPP
#define IMGDROP_CLI_COMMANDS_HPP

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <config_parser.hpp>
#include <upload_service.hpp>

namespace imgdrop {
namespace cli {

/**
 * Parsed command line after the command word
 */
struct CommandOptions {
  std::vector<std::string> args;  // Positional arguments
  std::optional<std::string> folder;
  std::optional<std::string> folder_index;  // Kept raw; validated against the live folder list
  std::string config_path;
  bool json = false;
  bool verbose = false;
};

/**
 * Command handler for the imgdrop CLI
 */
class Commands {
public:
  static constexpr int kExitOk = 0;
  static constexpr int kExitUploadFailed = 1;
  static constexpr int kExitUsage = 2;

  explicit Commands(std::ostream& out = std::cout, std::ostream& err = std::cerr);
  ~Commands() = default;

  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

  /**
   * Upload every source in options.args through the dispatcher
   */
  int upload(const CommandOptions& options);

  /**
   * Let the endpoint fetch a remote image itself
   */
  int upload_url(const CommandOptions& options);

  /**
   * Check endpoint URL and account id
   */
  int probe(const CommandOptions& options);

  /**
   * List configured folders with their indices
   */
  int folders(const CommandOptions& options);

  int version();

  void print_usage();

#ifdef IMGDROP_CLI_TESTING
  /**
   * Replace transport, file system or notification sink for testing
   */
  void set_dependencies(const uploader::ServiceDependencies& deps) {
    deps_ = deps;
  }
#endif

private:
  bool parse_options(int argc, char* argv[], CommandOptions& options);

  /**
   * Load and validate the YAML file, then set up logging from it.
   *
   * @return Store, or nullptr after printing the error
   */
  std::shared_ptr<uploader::ConfigStore> load_config(const CommandOptions& options);

  void setup_logging(const uploader::UploaderAppConfig& config, bool verbose);

  /**
   * Target folder for the upload; nullopt is the root.
   *
   * @return false after printing the error
   */
  bool resolve_folder(
    const CommandOptions& options, const uploader::UploaderAppConfig& config,
    std::optional<std::string>& folder
  );

  uploader::ServiceDependencies make_dependencies(bool json);

  static std::string default_config_path();

  std::ostream& out_;
  std::ostream& err_;
  uploader::ServiceDependencies deps_;
};

}  // namespace cli
}  // namespace imgdrop

#endif  // IMGDROP_CLI_COMMANDS_HPP
