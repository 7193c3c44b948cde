// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_MULTIPART_FORM_HPP
#define IMGDROP_MULTIPART_FORM_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace imgdrop {
namespace uploader {

/**
 * multipart/form-data body builder (RFC 7578).
 */
class MultipartForm {
public:
  struct Part {
    std::string name;
    std::string value;         // Field text or raw file bytes
    std::string filename;      // Non-empty for file parts
    std::string content_type;  // Only meaningful for file parts
  };

  MultipartForm();
  explicit MultipartForm(std::string boundary);

  MultipartForm& addField(const std::string& name, const std::string& value);
  MultipartForm& addFile(
    const std::string& name, const std::string& filename, const std::string& content_type,
    const uint8_t* data, size_t size
  );

  std::string encode() const;

  /**
   * "multipart/form-data; boundary=<boundary>"
   */
  std::string contentType() const;

  const std::string& boundary() const {
    return boundary_;
  }

  const std::vector<Part>& parts() const {
    return parts_;
  }

  /**
   * First part with the given name, if any.
   */
  const Part* find(const std::string& name) const;

  /**
   * Decode a body produced by encode(). Used by in-process endpoints and tests.
   *
   * @return Parts in order, or nullopt if the body is not well formed
   */
  static std::optional<std::vector<Part>> parse(
    const std::string& body, const std::string& content_type
  );

private:
  std::string boundary_;
  std::vector<Part> parts_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_MULTIPART_FORM_HPP
