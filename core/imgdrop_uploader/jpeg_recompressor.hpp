// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_JPEG_RECOMPRESSOR_HPP
#define IMGDROP_JPEG_RECOMPRESSOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace imgdrop {
namespace uploader {

/**
 * Result of a recompression attempt.
 *
 * applied is false when the input was passed through unchanged (disabled,
 * not a JPEG, quality too high, decode failure or no size gain).
 */
struct CompressionResult {
  bool applied = false;
  std::vector<uint8_t> bytes;
  std::string content_type;
  size_t input_bytes = 0;
  size_t output_bytes = 0;
  std::string note;

  double ratio() const {
    return input_bytes > 0 ? static_cast<double>(output_bytes) / input_bytes : 1.0;
  }
};

/**
 * Lossy re-encode of JPEG payloads with libjpeg.
 *
 * quality is the 0..1 value from the endpoint settings; 0 disables the stage.
 */
class JpegRecompressor {
public:
  static constexpr double kMinQuality = 0.1;
  static constexpr double kMaxQuality = 0.95;

  explicit JpegRecompressor(double quality);

  CompressionResult process(const std::vector<uint8_t>& input, const std::string& content_type) const;

  /**
   * Quality after clamping to [kMinQuality, kMaxQuality], or 0 when disabled.
   */
  double effectiveQuality() const {
    return quality_;
  }

  bool enabled() const {
    return quality_ > 0.0 && quality_ < kMaxQuality;
  }

private:
  /**
   * Decode and re-encode. Throws std::runtime_error on libjpeg errors.
   */
  std::vector<uint8_t> recompress(const std::vector<uint8_t>& input, int quality) const;

  double quality_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_JPEG_RECOMPRESSOR_HPP
