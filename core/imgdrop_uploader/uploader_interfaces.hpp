// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_UPLOADER_INTERFACES_HPP
#define IMGDROP_UPLOADER_INTERFACES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace imgdrop {
namespace uploader {

/**
 * Interface for filesystem operations
 * Allows mocking local source files in tests
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  /**
   * Check if a regular file exists
   */
  virtual bool exists(const std::string& path) const = 0;

  /**
   * Size of a file in bytes
   */
  virtual uint64_t file_size(const std::string& path) const = 0;

  /**
   * Read a whole file
   * @param path Path to the file
   * @param out Receives the file contents
   * @return true if the file was read completely
   */
  virtual bool read_file(const std::string& path, std::vector<uint8_t>& out) const = 0;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_UPLOADER_INTERFACES_HPP
