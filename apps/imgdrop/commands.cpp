// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <map>
#include <mutex>

#include <imgdrop_log_init.hpp>
#include <url_utils.hpp>

#include "console_notifier.hpp"

#define IMGDROP_LOG_COMPONENT "imgdrop_cli"
#include <imgdrop_log_macros.hpp>

#ifndef IMGDROP_VERSION
#define IMGDROP_VERSION "0.1.0"
#endif

namespace fs = std::filesystem;

namespace imgdrop {
namespace cli {

using imgdrop::logging::kv;
using uploader::ImageUploadOutcome;

Commands::Commands(std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err) {}

void Commands::print_usage() {
  out_ << "Usage: imgdrop <command> [options]\n"
       << "\n"
       << "Commands:\n"
       << "  upload <source>...   Upload images (http(s) URL, data URL or local file)\n"
       << "  upload-url <url>     Ask the endpoint to fetch a remote image itself\n"
       << "  probe                Test the endpoint URL and account id\n"
       << "  folders              List configured upload folders\n"
       << "  version              Print version\n"
       << "  help                 Show this message\n"
       << "\n"
       << "Options:\n"
       << "  --folder NAME        Upload into folder NAME\n"
       << "  --folder-index N     Upload into the N-th configured folder (see 'folders')\n"
       << "  --config FILE        Configuration file (default: $IMGDROP_CONFIG or\n"
       << "                       ~/.config/imgdrop/config.yaml)\n"
       << "  --json               Machine-readable output, one JSON object per line\n"
       << "  --verbose, -v        Debug logging on stderr\n"
       << "\n"
       << "Exit codes: 0 success, 1 upload failure, 2 usage or configuration error\n";
}

std::string Commands::default_config_path() {
  if (const char* env = std::getenv("IMGDROP_CONFIG")) {
    if (*env != '\0') {
      return env;
    }
  }
  if (const char* home = std::getenv("HOME")) {
    return (fs::path(home) / ".config" / "imgdrop" / "config.yaml").string();
  }
  return "imgdrop.yaml";
}

bool Commands::parse_options(int argc, char* argv[], CommandOptions& options) {
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    auto needs_value = [&](const std::string& flag) -> bool {
      if (i + 1 >= argc) {
        err_ << "Error: " << flag << " requires a value" << std::endl;
        return false;
      }
      return true;
    };

    if (arg == "--folder") {
      if (!needs_value(arg)) return false;
      options.folder = argv[++i];
    } else if (arg == "--folder-index") {
      if (!needs_value(arg)) return false;
      options.folder_index = argv[++i];
    } else if (arg == "--config" || arg == "-c") {
      if (!needs_value(arg)) return false;
      options.config_path = argv[++i];
    } else if (arg == "--json") {
      options.json = true;
    } else if (arg == "--verbose" || arg == "-v") {
      options.verbose = true;
    } else if (arg.size() > 1 && arg[0] == '-' && arg != "-") {
      err_ << "Error: Unknown option '" << arg << "'" << std::endl;
      return false;
    } else {
      options.args.push_back(arg);
    }
  }

  if (options.folder && options.folder_index) {
    err_ << "Error: --folder and --folder-index are mutually exclusive" << std::endl;
    return false;
  }
  if (options.config_path.empty()) {
    options.config_path = default_config_path();
  }
  return true;
}

int Commands::execute(int argc, char* argv[]) {
  std::string command;

  if (argc > 1) {
    command = argv[1];
  }

  if (command.empty() || command == "help" || command == "-h" || command == "--help") {
    print_usage();
    return command.empty() ? kExitUsage : kExitOk;
  }
  if (command == "version" || command == "--version") {
    return version();
  }

  CommandOptions options;
  if (!parse_options(argc, argv, options)) {
    return kExitUsage;
  }

  int rc = kExitUsage;
  if (command == "upload") {
    rc = upload(options);
  } else if (command == "upload-url") {
    rc = upload_url(options);
  } else if (command == "probe") {
    rc = probe(options);
  } else if (command == "folders") {
    rc = folders(options);
  } else {
    err_ << "Error: Unknown command '" << command << "'" << std::endl;
    print_usage();
    return kExitUsage;
  }

  if (::imgdrop::logging::is_logging_initialized()) {
    ::imgdrop::logging::flush_logging();
  }
  return rc;
}

int Commands::version() {
  out_ << "imgdrop " << IMGDROP_VERSION << std::endl;
  return kExitOk;
}

void Commands::setup_logging(const uploader::UploaderAppConfig& config, bool verbose) {
  ::imgdrop::logging::LoggingConfig log_config;
  uploader::convert_logging_config(config.logging, log_config);

  // stdout carries links; keep stderr quiet unless asked
  if (verbose) {
    log_config.console_level = ::imgdrop::logging::severity_level::debug;
  } else if (log_config.console_level < ::imgdrop::logging::severity_level::warn) {
    log_config.console_level = ::imgdrop::logging::severity_level::warn;
  }

  ::imgdrop::logging::apply_env_overrides(log_config);
  ::imgdrop::logging::init_logging(log_config);
}

std::shared_ptr<uploader::ConfigStore> Commands::load_config(const CommandOptions& options) {
  uploader::UploaderAppConfig config;
  uploader::ConfigParser parser;
  if (!parser.load_from_file(options.config_path, config)) {
    err_ << "Error: " << parser.get_last_error() << std::endl;
    return nullptr;
  }

  std::string error_msg;
  if (!uploader::ConfigParser::validate(config, error_msg)) {
    err_ << "Error: Invalid configuration: " << error_msg << std::endl;
    return nullptr;
  }

  setup_logging(config, options.verbose);
  IMGDROP_LOG_DEBUG("Configuration loaded" << kv("path", options.config_path));
  return std::make_shared<uploader::ConfigStore>(options.config_path);
}

bool Commands::resolve_folder(
  const CommandOptions& options, const uploader::UploaderAppConfig& config,
  std::optional<std::string>& folder
) {
  const auto& folders = config.endpoint.folders;

  if (options.folder) {
    const std::string name = uploader::trim(*options.folder);
    folder = name.empty() ? std::nullopt : std::optional<std::string>(name);
  } else if (options.folder_index) {
    size_t consumed = 0;
    long index = -1;
    try {
      index = std::stol(*options.folder_index, &consumed);
    } catch (const std::exception&) {
      consumed = 0;
    }
    if (consumed != options.folder_index->size() || index < 0 ||
        static_cast<size_t>(index) >= folders.size()) {
      err_ << "Error: Invalid folder index" << std::endl;
      return false;
    }
    folder = folders[static_cast<size_t>(index)];
  } else if (config.endpoint.hide_root && !folders.empty()) {
    folder = folders.front();
  } else {
    folder = std::nullopt;
  }

  if (!folder && config.endpoint.hide_root && !folders.empty()) {
    err_ << "Error: Uploads to the root folder are disabled" << std::endl;
    return false;
  }
  return true;
}

uploader::ServiceDependencies Commands::make_dependencies(bool json) {
  uploader::ServiceDependencies deps = deps_;
  if (!deps.notification_sink && !json) {
    deps.notification_sink = std::make_shared<ConsoleNotifier>(err_);
  }
  return deps;
}

namespace {

nlohmann::json outcome_to_json(
  const std::string& source, const std::string& task_id, const ImageUploadOutcome& outcome,
  uploader::LinkFormat format
) {
  nlohmann::json j;
  j["source"] = source;
  j["task_id"] = task_id;
  j["success"] = outcome.success;
  if (outcome.success) {
    j["url"] = outcome.url;
    j["link"] = uploader::formatLink(outcome.url, format);
    j["chunked"] = outcome.chunked;
  } else {
    j["error"] = outcome.error;
    j["message"] = outcome.display_message;
  }
  if (!outcome.note.empty()) {
    j["note"] = outcome.note;
  }
  return j;
}

}  // namespace

int Commands::upload(const CommandOptions& options) {
  if (options.args.empty()) {
    err_ << "Error: upload requires at least one source" << std::endl;
    return kExitUsage;
  }

  auto store = load_config(options);
  if (!store) {
    return kExitUsage;
  }
  const uploader::UploaderAppConfig config = store->config();
  if (!store->settings().complete()) {
    err_ << "Error: Missing configuration: endpoint URL and account id are required" << std::endl;
    return kExitUsage;
  }

  std::optional<std::string> folder;
  if (!resolve_folder(options, config, folder)) {
    return kExitUsage;
  }

  uploader::UploadService service(store, make_dependencies(options.json));

  std::mutex results_mutex;
  std::map<std::string, ImageUploadOutcome> results;
  service.dispatcher().setCallback([&](const std::string& task_id, const ImageUploadOutcome& outcome) {
    std::lock_guard<std::mutex> lock(results_mutex);
    results[task_id] = outcome;
  });

  service.start();

  std::vector<std::pair<std::string, std::string>> submitted;  // source, task id
  for (const auto& source : options.args) {
    uploader::CreateTaskParams params;
    params.folder = folder;
    submitted.emplace_back(source, service.dispatcher().submit(source, params));
  }

  service.dispatcher().waitForIdle();
  service.stop();

  int rc = kExitOk;
  std::lock_guard<std::mutex> lock(results_mutex);
  for (const auto& entry : submitted) {
    const std::string& source = entry.first;
    const std::string& task_id = entry.second;
    ImageUploadOutcome outcome;
    auto it = results.find(task_id);
    if (it != results.end()) {
      outcome = it->second;
    } else {
      outcome.error = "Upload did not complete";
      outcome.display_message = outcome.error;
    }

    if (!outcome.success) {
      rc = kExitUploadFailed;
    }
    if (options.json) {
      out_ << outcome_to_json(source, task_id, outcome, config.endpoint.link_format).dump()
           << std::endl;
    } else if (outcome.success) {
      out_ << uploader::formatLink(outcome.url, config.endpoint.link_format) << std::endl;
    } else {
      err_ << source << ": " << outcome.display_message << std::endl;
      if (options.verbose) {
        err_ << "  " << outcome.error << std::endl;
      }
    }
  }
  return rc;
}

int Commands::upload_url(const CommandOptions& options) {
  if (options.args.size() != 1) {
    err_ << "Error: upload-url requires exactly one URL" << std::endl;
    return kExitUsage;
  }

  auto store = load_config(options);
  if (!store) {
    return kExitUsage;
  }
  const uploader::UploaderAppConfig config = store->config();
  if (!store->settings().complete()) {
    err_ << "Error: Missing configuration: endpoint URL and account id are required" << std::endl;
    return kExitUsage;
  }

  std::optional<std::string> folder;
  if (!resolve_folder(options, config, folder)) {
    return kExitUsage;
  }

  const std::string& image_url = options.args.front();
  uploader::UploadService service(store, make_dependencies(options.json));
  service.start();

  uploader::CreateTaskParams params;
  params.folder = folder;
  const std::string task_id = service.tracker().createTask(image_url, params);
  ImageUploadOutcome outcome = service.uploader().uploadFromUrl(image_url, task_id, folder);
  service.stop();

  if (options.json) {
    out_ << outcome_to_json(image_url, task_id, outcome, config.endpoint.link_format).dump()
         << std::endl;
  } else if (outcome.success) {
    out_ << uploader::formatLink(outcome.url, config.endpoint.link_format) << std::endl;
  } else {
    err_ << image_url << ": " << outcome.display_message << std::endl;
  }
  return outcome.success ? kExitOk : kExitUploadFailed;
}

int Commands::probe(const CommandOptions& options) {
  auto store = load_config(options);
  if (!store) {
    return kExitUsage;
  }

  uploader::ServiceDependencies deps = deps_;
  deps.notification_sink = nullptr;
  uploader::UploadService service(store, deps);
  uploader::ProbeResult result = service.uploader().probeEndpoint();

  if (options.json) {
    nlohmann::json j;
    j["success"] = result.success;
    j["message"] = result.message;
    if (result.status_code) {
      j["status"] = *result.status_code;
    }
    out_ << j.dump() << std::endl;
  } else if (result.success) {
    out_ << "OK: " << result.message << std::endl;
  } else {
    err_ << "Error: " << result.message << std::endl;
  }
  return result.success ? kExitOk : kExitUploadFailed;
}

int Commands::folders(const CommandOptions& options) {
  auto store = load_config(options);
  if (!store) {
    return kExitUsage;
  }
  const uploader::UploaderAppConfig config = store->config();
  const auto& folders = config.endpoint.folders;

  if (options.json) {
    nlohmann::json j;
    j["folders"] = folders;
    j["hide_root"] = config.endpoint.hide_root;
    out_ << j.dump() << std::endl;
    return kExitOk;
  }

  if (!config.endpoint.hide_root) {
    out_ << "-  (root)" << std::endl;
  }
  for (size_t i = 0; i < folders.size(); ++i) {
    out_ << i << "  " << folders[i] << std::endl;
  }
  return kExitOk;
}

}  // namespace cli
}  // namespace imgdrop
