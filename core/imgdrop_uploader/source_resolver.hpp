// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_SOURCE_RESOLVER_HPP
#define IMGDROP_SOURCE_RESOLVER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "http_transport.hpp"
#include "transfer_primitive.hpp"
#include "uploader_interfaces.hpp"

namespace imgdrop {
namespace uploader {

struct SourceResult {
  bool success = false;
  std::vector<uint8_t> bytes;
  std::string content_type;
  std::string error;
  std::optional<int> status_code;
  bool fatal = false;  // Reference itself is unusable
  bool timed_out = false;

  static SourceResult Failure(const std::string& error, bool fatal = false) {
    SourceResult result;
    result.error = error;
    result.fatal = fatal;
    return result;
  }
};

/**
 * Turns a source reference into bytes plus content type.
 */
class ISourceResolver {
public:
  virtual ~ISourceResolver() = default;

  virtual SourceResult resolve(
    const std::string& source_ref, const std::string& task_id, const CancellationToken& token
  ) = 0;
};

/**
 * Content type from magic bytes: JPEG, PNG, GIF, WebP, BMP. Empty if unknown.
 */
std::string sniffImageType(const std::vector<uint8_t>& bytes);

/**
 * Decode "data:<mime>;base64,<payload>".
 *
 * @return false if the URL is not a base64 data URL or the payload is corrupt
 */
bool decodeDataUrl(
  const std::string& data_url, std::vector<uint8_t>& bytes, std::string& content_type
);

/**
 * Resolves http(s) URLs through the transfer primitive, data: URLs in
 * memory and anything else as a local path (file:// accepted).
 */
class SourceResolver : public ISourceResolver {
public:
  SourceResolver(
    TransferPrimitive& primitive, std::shared_ptr<IFileSystem> file_system = nullptr,
    uint64_t max_local_bytes = 100ull * 1024 * 1024
  );

  SourceResult resolve(
    const std::string& source_ref, const std::string& task_id, const CancellationToken& token
  ) override;

private:
  SourceResult resolveLocal(const std::string& path);

  TransferPrimitive& primitive_;
  std::shared_ptr<IFileSystem> file_system_;
  uint64_t max_local_bytes_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_SOURCE_RESOLVER_HPP
