// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOADER_IMPL_HPP
#define IMGDROP_UPLOADER_IMPL_HPP

#include <filesystem>
#include <fstream>
#include <iterator>

#include "uploader_interfaces.hpp"

namespace imgdrop {
namespace uploader {

/**
 * IFileSystem over std::filesystem and std::ifstream
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
  }

  uint64_t file_size(const std::string& path) const override {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
  }

  bool read_file(const std::string& path, std::vector<uint8_t>& out) const override {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
      return false;
    }
    out.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    return !stream.bad();
  }
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOADER_IMPL_HPP
