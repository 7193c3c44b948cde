// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_response.hpp"

#include <nlohmann/json.hpp>

#include <regex>

#define IMGDROP_LOG_COMPONENT "upload_response"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

namespace {

std::string stringField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return "";
}

std::optional<int> intField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return std::nullopt;
  }
  if (it->is_number_integer()) {
    return it->get<int>();
  }
  if (it->is_string()) {
    try {
      return std::stoi(it->get<std::string>());
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

std::optional<UploadResponse> recoverFromText(const std::string& body) {
  static const std::regex success_pattern(R"("success"\s*:\s*true)");
  static const std::regex url_pattern(R"re("url"\s*:\s*"([^"]+)")re");

  std::smatch match;
  if (!std::regex_search(body, success_pattern) || !std::regex_search(body, match, url_pattern)) {
    return std::nullopt;
  }

  UploadResponse response;
  response.success = true;
  response.url = match[1].str();
  response.recovered = true;
  response.note = "Response format issue, URL has been extracted";
  return response;
}

}  // namespace

std::optional<UploadResponse> parseUploadResponse(const std::string& body) {
  const nlohmann::json json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    auto recovered = recoverFromText(body);
    if (recovered) {
      IMGDROP_LOG_WARN("Recovered URL from malformed response" << kv("url", recovered->url));
    } else {
      IMGDROP_LOG_WARN(
        "Unparseable response" << kv("bytes", body.size()) << kv("head", body.substr(0, 120))
      );
    }
    return recovered;
  }

  UploadResponse response;
  auto success = json.find("success");
  response.success = success != json.end() && success->is_boolean() && success->get<bool>();
  response.url = stringField(json, "url");
  response.path = stringField(json, "path");
  response.error = stringField(json, "error");
  response.message = stringField(json, "message");
  response.type = stringField(json, "type");
  response.session_id = stringField(json, "sessionId");
  response.chunk_index = intField(json, "chunkIndex");
  response.total_chunks = intField(json, "totalChunks");

  auto size = json.find("size");
  if (size != json.end() && size->is_number_unsigned()) {
    response.size = size->get<uint64_t>();
  }
  return response;
}

}  // namespace uploader
}  // namespace imgdrop
