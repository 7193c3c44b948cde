// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOAD_RESPONSE_HPP
#define IMGDROP_UPLOAD_RESPONSE_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace imgdrop {
namespace uploader {

/**
 * Body of an upload, chunk or finalize response:
 * {success, url?, path?, size?, type?, error?, chunkIndex?, totalChunks?, sessionId?}
 */
struct UploadResponse {
  bool success = false;
  std::string url;
  std::string path;
  std::string error;
  std::string message;
  std::string type;
  std::optional<uint64_t> size;
  std::optional<int> chunk_index;
  std::optional<int> total_chunks;
  std::string session_id;
  bool recovered = false;  // URL pulled out of a body that was not valid JSON
  std::string note;
};

constexpr const char* kResponseFormatError = "Response format error";

/**
 * Parse a response body with nlohmann::json.
 *
 * If strict parsing fails but the text carries "success":true and a "url"
 * string, the URL is recovered by pattern and the response is marked
 * recovered.
 *
 * @return nullopt when the body is neither JSON nor recoverable
 */
std::optional<UploadResponse> parseUploadResponse(const std::string& body);

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOAD_RESPONSE_HPP
