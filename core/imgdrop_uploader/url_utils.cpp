// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "url_utils.hpp"

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <cstdio>
#include <map>
#include <regex>

namespace imgdrop {
namespace uploader {

namespace {

// Full-width comma U+FF0C, as typed by CJK input methods
constexpr const char* kFullWidthComma = "\xEF\xBC\x8C";

const std::map<std::string, std::string>& extensionTypes() {
  static const std::map<std::string, std::string> types = {
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"svg", "image/svg+xml"},
    {"bmp", "image/bmp"},
    {"ico", "image/x-icon"},
    {"avif", "image/avif"},
    {"tiff", "image/tiff"},
  };
  return types;
}

}  // namespace

std::optional<ParsedUrl> parseUrl(const std::string& url) {
  static const std::regex url_regex(R"(^(https?)://([^/:?#]+)(?::(\d+))?([^#]*)(#.*)?$)", std::regex::icase);
  std::smatch match;
  if (!std::regex_match(url, match, url_regex)) {
    return std::nullopt;
  }

  ParsedUrl parsed;
  parsed.scheme = boost::algorithm::to_lower_copy(match[1].str());
  parsed.host = match[2].str();
  parsed.use_ssl = parsed.scheme == "https";
  parsed.port = match[3].matched ? match[3].str() : (parsed.use_ssl ? "443" : "80");

  parsed.target = match[4].str();
  if (parsed.target.empty() || parsed.target[0] != '/') {
    parsed.target = "/" + parsed.target;
  }
  return parsed;
}

std::string trim(const std::string& s) {
  return boost::algorithm::trim_copy(s);
}

std::string formatEndpointUrl(const std::string& raw_url) {
  std::string url = trim(raw_url);
  if (url.empty()) {
    return url;
  }
  // Any other explicit scheme is left alone so parseUrl rejects it
  static const std::regex scheme_regex(R"(^[A-Za-z][A-Za-z0-9+.\-]*://)");
  if (!std::regex_search(url, scheme_regex)) {
    url = "https://" + url;
  }
  return url;
}

std::string urlEncode(const std::string& value) {
  std::string encoded;
  encoded.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      encoded += static_cast<char>(c);
    } else {
      char buf[4];
      std::snprintf(buf, sizeof(buf), "%%%02X", c);
      encoded += buf;
    }
  }
  return encoded;
}

std::string appendQueryParam(
  const std::string& url, const std::string& key, const std::string& value
) {
  const char separator = url.find('?') == std::string::npos ? '?' : '&';
  return url + separator + urlEncode(key) + "=" + urlEncode(value);
}

std::vector<std::string> parseFolderList(const std::string& folder_path) {
  const std::string normalized = boost::algorithm::replace_all_copy(folder_path, kFullWidthComma, ",");

  std::vector<std::string> parts;
  boost::algorithm::split(parts, normalized, boost::algorithm::is_any_of(","));

  std::vector<std::string> folders;
  for (const auto& part : parts) {
    std::string folder = trim(part);
    if (!folder.empty()) {
      folders.push_back(std::move(folder));
    }
  }
  return folders;
}

std::string normalizeContentType(const std::string& content_type) {
  std::string type = content_type.substr(0, content_type.find(';'));
  type = boost::algorithm::to_lower_copy(trim(type));
  if (type == "image/jpg") {
    type = "image/jpeg";
  }
  return type;
}

std::string imageExtensionFromUrl(const std::string& url) {
  std::string path = url;
  const auto cut = path.find_first_of("?#");
  if (cut != std::string::npos) {
    path.resize(cut);
  }
  const auto slash = path.find_last_of('/');
  const std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
  const auto dot = segment.find_last_of('.');
  if (dot == std::string::npos || dot + 1 >= segment.size()) {
    return "";
  }

  const std::string ext = boost::algorithm::to_lower_copy(segment.substr(dot + 1));
  return extensionTypes().count(ext) > 0 ? ext : "";
}

std::string extensionForContentType(const std::string& content_type) {
  const std::string type = normalizeContentType(content_type);
  if (type == "image/jpeg") return "jpg";
  if (type == "image/svg+xml") return "svg";
  if (type == "image/x-icon") return "ico";
  if (boost::algorithm::starts_with(type, "image/")) {
    const std::string sub = type.substr(6);
    if (extensionTypes().count(sub) > 0) {
      return sub;
    }
  }
  return "jpg";
}

std::string contentTypeForExtension(const std::string& extension) {
  const auto it = extensionTypes().find(boost::algorithm::to_lower_copy(extension));
  return it == extensionTypes().end() ? std::string() : it->second;
}

std::string makeUploadFilename(
  const std::string& source_ref, const std::string& content_type,
  std::chrono::system_clock::time_point now
) {
  std::string ext;
  if (!boost::algorithm::istarts_with(source_ref, "data:")) {
    ext = imageExtensionFromUrl(source_ref);
  }
  if (ext.empty()) {
    ext = extensionForContentType(content_type);
  }

  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
  return "image_" + std::to_string(ms) + "." + ext;
}

}  // namespace uploader
}  // namespace imgdrop
