// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_URL_UTILS_HPP
#define IMGDROP_URL_UTILS_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace imgdrop {
namespace uploader {

struct ParsedUrl {
  std::string scheme;  // "http" or "https", lower case
  std::string host;
  std::string port;    // Defaulted from the scheme when absent
  std::string target;  // Path plus query, always starts with '/'
  bool use_ssl = false;
};

/**
 * Parse http(s)://host(:port)(/path)(?query). Fragments are dropped.
 */
std::optional<ParsedUrl> parseUrl(const std::string& url);

std::string trim(const std::string& s);

/**
 * Trim and prefix "https://" when no scheme is given. Empty stays empty.
 */
std::string formatEndpointUrl(const std::string& raw_url);

std::string urlEncode(const std::string& value);

std::string appendQueryParam(
  const std::string& url, const std::string& key, const std::string& value
);

/**
 * Split a configured folder list on ',' and the full-width '，', trimming
 * entries and dropping empty ones.
 */
std::vector<std::string> parseFolderList(const std::string& folder_path);

/**
 * "image/JPG; charset=x" -> "image/jpeg"
 */
std::string normalizeContentType(const std::string& content_type);

/**
 * Image extension of the last path segment of a URL ("jpg", "png", ...), or
 * empty when the path has no recognised image extension.
 */
std::string imageExtensionFromUrl(const std::string& url);

/**
 * "image/jpeg" -> "jpg", "image/svg+xml" -> "svg"; "jpg" for anything unknown.
 */
std::string extensionForContentType(const std::string& content_type);

/**
 * Inverse of extensionForContentType; empty when unknown.
 */
std::string contentTypeForExtension(const std::string& extension);

/**
 * "image_<epoch ms>.<ext>" with the extension taken from the source URL when
 * it names an image, otherwise from the content type.
 */
std::string makeUploadFilename(
  const std::string& source_ref, const std::string& content_type,
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_URL_UTILS_HPP
