// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_file_sink.cpp
 * @brief File sink output and JSON escaping
 */

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#define IMGDROP_LOG_COMPONENT "test_file_sink"
#include "imgdrop_log_format.hpp"
#include "imgdrop_log_init.hpp"
#include "imgdrop_log_macros.hpp"

namespace fs = std::filesystem;

using namespace imgdrop::logging;

TEST(EscapeJsonTest, EscapesQuotesAndControlCharacters) {
  EXPECT_EQ(escape_json("plain"), "plain");
  EXPECT_EQ(escape_json("say \"hi\""), "say \\\"hi\\\"");
  EXPECT_EQ(escape_json("a\\b"), "a\\\\b");
  EXPECT_EQ(escape_json("line\nnext\t"), "line\\nnext\\t");
  EXPECT_EQ(escape_json(std::string("\x01", 1)), "\\u0001");
}

class FileSinkTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("imgdrop_file_sink_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
    if (is_logging_initialized()) {
      shutdown_logging();
    }
  }

  void TearDown() override {
    shutdown_logging();
    fs::remove_all(test_dir_);
  }

  std::string read_all_logs() const {
    std::ostringstream all;
    for (const auto& entry : fs::directory_iterator(test_dir_)) {
      std::ifstream in(entry.path());
      all << in.rdbuf();
    }
    return all.str();
  }

  fs::path test_dir_;
};

TEST_F(FileSinkTest, WritesJsonRecordsWithContext) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_config.directory = test_dir_.string();
  config.file_config.file_pattern = "json_%N.log";
  config.file_config.format_json = true;
  init_logging(config);

  {
    IMGDROP_LOG_SCOPED_CONTEXT("upload_123", "chunk_abc");
    IMGDROP_LOG_WARN("chunk failed" << kv("index", 2));
  }
  shutdown_logging();

  const std::string logs = read_all_logs();
  EXPECT_NE(logs.find("\"level\":\"WARN\""), std::string::npos);
  EXPECT_NE(logs.find("[test_file_sink] chunk failed index=2"), std::string::npos);
  EXPECT_NE(logs.find("\"task_id\":\"upload_123\""), std::string::npos);
  EXPECT_NE(logs.find("\"session_id\":\"chunk_abc\""), std::string::npos);
}

TEST_F(FileSinkTest, TextFormatAndLevelFilter) {
  LoggingConfig config;
  config.console_enabled = false;
  config.file_enabled = true;
  config.file_level = severity_level::info;
  config.file_config.directory = test_dir_.string();
  config.file_config.file_pattern = "text_%N.log";
  config.file_config.format_json = false;
  init_logging(config);

  IMGDROP_LOG_DEBUG("hidden detail");
  IMGDROP_LOG_ERROR("upload failed" << kv("status", 503));
  shutdown_logging();

  const std::string logs = read_all_logs();
  EXPECT_EQ(logs.find("hidden detail"), std::string::npos);
  EXPECT_NE(logs.find("[ERROR] [test_file_sink] upload failed status=503"), std::string::npos);
}

TEST_F(FileSinkTest, FallsBackWhenDirectoryCannotBeCreated) {
  FileSinkConfig config;
  config.directory = "/proc/imgdrop_cannot_exist/logs";
  config.file_pattern = "fallback_%N.log";
  auto sink = create_file_sink(config, severity_level::info);
  ASSERT_NE(sink, nullptr);
}
