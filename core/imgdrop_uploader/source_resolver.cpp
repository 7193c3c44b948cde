// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "source_resolver.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>

#include "uploader_impl.hpp"
#include "url_utils.hpp"

#define IMGDROP_LOG_COMPONENT "source_resolver"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

namespace {

bool startsWith(const std::vector<uint8_t>& bytes, const char* magic, size_t offset = 0) {
  const size_t len = std::strlen(magic);
  return bytes.size() >= offset + len && std::memcmp(bytes.data() + offset, magic, len) == 0;
}

bool decodeBase64(std::string input, std::vector<uint8_t>& out) {
  using namespace boost::archive::iterators;
  using Base64Decoder = transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;

  input.erase(
    std::remove_if(input.begin(), input.end(), [](unsigned char c) { return std::isspace(c); }),
    input.end()
  );
  if (input.empty() || input.size() % 4 != 0) {
    return false;
  }

  const size_t padding = input.size() - input.find_last_not_of('=') - 1;
  if (padding > 2) {
    return false;
  }
  std::replace(input.end() - static_cast<std::ptrdiff_t>(padding), input.end(), '=', 'A');

  try {
    std::string decoded(Base64Decoder(input.cbegin()), Base64Decoder(input.cend()));
    decoded.resize(decoded.size() - padding);
    out.assign(decoded.begin(), decoded.end());
    return true;
  } catch (const dataflow_exception&) {
    return false;
  }
}

}  // namespace

std::string sniffImageType(const std::vector<uint8_t>& bytes) {
  if (startsWith(bytes, "\xFF\xD8\xFF")) return "image/jpeg";
  if (startsWith(bytes, "\x89PNG\r\n\x1A\n")) return "image/png";
  if (startsWith(bytes, "GIF87a") || startsWith(bytes, "GIF89a")) return "image/gif";
  if (startsWith(bytes, "RIFF") && startsWith(bytes, "WEBP", 8)) return "image/webp";
  if (startsWith(bytes, "BM")) return "image/bmp";
  return "";
}

bool decodeDataUrl(
  const std::string& data_url, std::vector<uint8_t>& bytes, std::string& content_type
) {
  if (!boost::algorithm::istarts_with(data_url, "data:")) {
    return false;
  }
  const auto comma = data_url.find(',');
  if (comma == std::string::npos) {
    return false;
  }

  const std::string meta = data_url.substr(5, comma - 5);
  if (!boost::algorithm::iends_with(meta, ";base64")) {
    return false;
  }

  content_type = normalizeContentType(meta.substr(0, meta.size() - 7));
  if (content_type.empty()) {
    content_type = "application/octet-stream";
  }
  return decodeBase64(data_url.substr(comma + 1), bytes);
}

SourceResolver::SourceResolver(
  TransferPrimitive& primitive, std::shared_ptr<IFileSystem> file_system, uint64_t max_local_bytes
)
    : primitive_(primitive)
    , file_system_(file_system ? std::move(file_system) : std::make_shared<FileSystemImpl>())
    , max_local_bytes_(max_local_bytes) {}

SourceResult SourceResolver::resolve(
  const std::string& source_ref, const std::string& task_id, const CancellationToken& token
) {
  const std::string ref = trim(source_ref);
  if (ref.empty()) {
    return SourceResult::Failure("Invalid source reference: empty", true);
  }

  if (boost::algorithm::istarts_with(ref, "data:")) {
    SourceResult result;
    if (!decodeDataUrl(ref, result.bytes, result.content_type)) {
      return SourceResult::Failure("Invalid source reference: malformed data URL", true);
    }
    result.success = true;
    IMGDROP_LOG_DEBUG("Decoded data URL" << kv("task_id", task_id) << kv("bytes", result.bytes.size()));
    return result;
  }

  if (boost::algorithm::istarts_with(ref, "http://") ||
      boost::algorithm::istarts_with(ref, "https://")) {
    FetchResult fetched = primitive_.fetchSource(ref, task_id, token);
    SourceResult result;
    result.success = fetched.success;
    result.bytes = std::move(fetched.bytes);
    result.content_type = fetched.content_type;
    result.error = fetched.error;
    result.status_code = fetched.status_code;
    result.timed_out = fetched.timed_out;
    return result;
  }

  std::string path = ref;
  if (boost::algorithm::istarts_with(path, "file://")) {
    path = path.substr(7);
  }
  return resolveLocal(path);
}

SourceResult SourceResolver::resolveLocal(const std::string& path) {
  if (!file_system_->exists(path)) {
    return SourceResult::Failure("Invalid source reference: " + path, true);
  }

  const uint64_t size = file_system_->file_size(path);
  if (size > max_local_bytes_) {
    return SourceResult::Failure(
      "Source file too large: " + std::to_string(size) + " bytes", true
    );
  }

  SourceResult result;
  if (!file_system_->read_file(path, result.bytes)) {
    return SourceResult::Failure("Failed to read source file: " + path, true);
  }

  result.content_type = sniffImageType(result.bytes);
  if (result.content_type.empty()) {
    result.content_type = contentTypeForExtension(imageExtensionFromUrl(path));
  }
  if (result.content_type.empty()) {
    result.content_type = "application/octet-stream";
  }
  result.success = true;
  return result;
}

}  // namespace uploader
}  // namespace imgdrop
