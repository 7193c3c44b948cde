// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart_form.hpp"

#include <random>
#include <regex>

namespace imgdrop {
namespace uploader {

namespace {

std::string randomBoundary() {
  static constexpr char kAlphabet[] =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
  thread_local std::mt19937 rng(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 61);

  std::string boundary = "----imgdropFormBoundary";
  for (int i = 0; i < 24; ++i) {
    boundary += kAlphabet[dist(rng)];
  }
  return boundary;
}

std::string headerParam(const std::string& headers, const std::string& param) {
  const std::regex pattern(param + "=\"([^\"]*)\"");
  std::smatch match;
  if (std::regex_search(headers, match, pattern)) {
    return match[1].str();
  }
  return "";
}

}  // namespace

MultipartForm::MultipartForm()
    : boundary_(randomBoundary()) {}

MultipartForm::MultipartForm(std::string boundary)
    : boundary_(std::move(boundary)) {}

MultipartForm& MultipartForm::addField(const std::string& name, const std::string& value) {
  parts_.push_back(Part{name, value, "", ""});
  return *this;
}

MultipartForm& MultipartForm::addFile(
  const std::string& name, const std::string& filename, const std::string& content_type,
  const uint8_t* data, size_t size
) {
  Part part;
  part.name = name;
  part.filename = filename;
  part.content_type = content_type.empty() ? "application/octet-stream" : content_type;
  part.value.assign(reinterpret_cast<const char*>(data), size);
  parts_.push_back(std::move(part));
  return *this;
}

std::string MultipartForm::encode() const {
  size_t total = 0;
  for (const auto& part : parts_) {
    total += part.value.size() + 160;
  }

  std::string body;
  body.reserve(total + boundary_.size() + 8);
  for (const auto& part : parts_) {
    body += "--" + boundary_ + "\r\n";
    body += "Content-Disposition: form-data; name=\"" + part.name + "\"";
    if (!part.filename.empty()) {
      body += "; filename=\"" + part.filename + "\"\r\n";
      body += "Content-Type: " + part.content_type;
    }
    body += "\r\n\r\n";
    body += part.value;
    body += "\r\n";
  }
  body += "--" + boundary_ + "--\r\n";
  return body;
}

std::string MultipartForm::contentType() const {
  return "multipart/form-data; boundary=" + boundary_;
}

const MultipartForm::Part* MultipartForm::find(const std::string& name) const {
  for (const auto& part : parts_) {
    if (part.name == name) {
      return &part;
    }
  }
  return nullptr;
}

std::optional<std::vector<MultipartForm::Part>> MultipartForm::parse(
  const std::string& body, const std::string& content_type
) {
  const auto pos = content_type.find("boundary=");
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  std::string boundary = content_type.substr(pos + 9);
  if (!boundary.empty() && boundary.front() == '"') {
    boundary = boundary.substr(1, boundary.find('"', 1) - 1);
  }
  const std::string delimiter = "--" + boundary;

  std::vector<Part> parts;
  size_t cursor = body.find(delimiter);
  if (cursor == std::string::npos) {
    return std::nullopt;
  }

  while (true) {
    cursor += delimiter.size();
    if (body.compare(cursor, 2, "--") == 0) {
      return parts;
    }
    if (body.compare(cursor, 2, "\r\n") != 0) {
      return std::nullopt;
    }
    cursor += 2;

    const size_t header_end = body.find("\r\n\r\n", cursor);
    if (header_end == std::string::npos) {
      return std::nullopt;
    }
    const std::string headers = body.substr(cursor, header_end - cursor);
    const size_t content_start = header_end + 4;
    const size_t next = body.find("\r\n" + delimiter, content_start);
    if (next == std::string::npos) {
      return std::nullopt;
    }

    Part part;
    part.name = headerParam(headers, "name");
    part.filename = headerParam(headers, "filename");
    const auto type_pos = headers.find("Content-Type: ");
    if (type_pos != std::string::npos) {
      const auto type_end = headers.find("\r\n", type_pos);
      part.content_type = headers.substr(type_pos + 14, type_end - (type_pos + 14));
    }
    part.value = body.substr(content_start, next - content_start);
    parts.push_back(std::move(part));

    cursor = next + 2;
  }
}

}  // namespace uploader
}  // namespace imgdrop
