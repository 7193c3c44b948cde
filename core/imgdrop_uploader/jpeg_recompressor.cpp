// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "jpeg_recompressor.hpp"

#include <algorithm>
#include <cmath>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <stdexcept>

// jpeglib.h expects size_t and FILE to be declared
#include <jpeglib.h>

#define IMGDROP_LOG_COMPONENT "jpeg_recompressor"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

using imgdrop::logging::kv;

namespace {

// libjpeg reports fatal errors through error_exit, which must not return
struct JpegErrorManager {
  jpeg_error_mgr pub;
  jmp_buf setjmp_buffer;
  char message[JMSG_LENGTH_MAX];
};

void onJpegError(j_common_ptr cinfo) {
  auto* err = reinterpret_cast<JpegErrorManager*>(cinfo->err);
  (*cinfo->err->format_message)(cinfo, err->message);
  longjmp(err->setjmp_buffer, 1);
}

void onJpegMessage(j_common_ptr) {}

struct DecodedImage {
  std::vector<uint8_t> pixels;
  int width = 0;
  int height = 0;
  int channels = 0;
};

// Only trivially destructible locals live in the setjmp frames below
bool decodeJpeg(const uint8_t* data, size_t size, DecodedImage& image, char* message) {
  jpeg_decompress_struct dinfo;
  JpegErrorManager err;
  dinfo.err = jpeg_std_error(&err.pub);
  err.pub.error_exit = onJpegError;
  err.pub.output_message = onJpegMessage;
  err.message[0] = '\0';

  if (setjmp(err.setjmp_buffer)) {
    std::memcpy(message, err.message, JMSG_LENGTH_MAX);
    jpeg_destroy_decompress(&dinfo);
    return false;
  }

  jpeg_create_decompress(&dinfo);
  jpeg_mem_src(&dinfo, const_cast<unsigned char*>(data), static_cast<unsigned long>(size));
  jpeg_read_header(&dinfo, TRUE);
  dinfo.out_color_space = dinfo.num_components == 1 ? JCS_GRAYSCALE : JCS_RGB;
  jpeg_start_decompress(&dinfo);

  image.width = static_cast<int>(dinfo.output_width);
  image.height = static_cast<int>(dinfo.output_height);
  image.channels = dinfo.output_components;
  const size_t row_stride = static_cast<size_t>(image.width) * image.channels;
  image.pixels.resize(row_stride * image.height);

  JSAMPROW row_pointer[1];
  while (dinfo.output_scanline < dinfo.output_height) {
    row_pointer[0] = &image.pixels[dinfo.output_scanline * row_stride];
    jpeg_read_scanlines(&dinfo, row_pointer, 1);
  }

  jpeg_finish_decompress(&dinfo);
  jpeg_destroy_decompress(&dinfo);
  return true;
}

bool encodeJpeg(DecodedImage& image, int quality, std::vector<uint8_t>& output, char* message) {
  jpeg_compress_struct cinfo;
  JpegErrorManager err;
  unsigned char* outbuffer = nullptr;
  unsigned long outsize = 0;
  cinfo.err = jpeg_std_error(&err.pub);
  err.pub.error_exit = onJpegError;
  err.pub.output_message = onJpegMessage;
  err.message[0] = '\0';

  if (setjmp(err.setjmp_buffer)) {
    std::memcpy(message, err.message, JMSG_LENGTH_MAX);
    jpeg_destroy_compress(&cinfo);
    free(outbuffer);
    return false;
  }

  jpeg_create_compress(&cinfo);
  jpeg_mem_dest(&cinfo, &outbuffer, &outsize);

  cinfo.image_width = static_cast<JDIMENSION>(image.width);
  cinfo.image_height = static_cast<JDIMENSION>(image.height);
  cinfo.input_components = image.channels;
  cinfo.in_color_space = image.channels == 3 ? JCS_RGB : JCS_GRAYSCALE;

  jpeg_set_defaults(&cinfo);
  jpeg_set_quality(&cinfo, quality, TRUE);
  jpeg_start_compress(&cinfo, TRUE);

  const size_t row_stride = static_cast<size_t>(image.width) * image.channels;
  JSAMPROW row_pointer[1];
  while (cinfo.next_scanline < cinfo.image_height) {
    row_pointer[0] = &image.pixels[cinfo.next_scanline * row_stride];
    jpeg_write_scanlines(&cinfo, row_pointer, 1);
  }

  jpeg_finish_compress(&cinfo);
  jpeg_destroy_compress(&cinfo);

  output.assign(outbuffer, outbuffer + outsize);
  free(outbuffer);
  return true;
}

}  // namespace

JpegRecompressor::JpegRecompressor(double quality) {
  if (!(quality > 0.0) || std::isnan(quality)) {
    quality_ = 0.0;
  } else {
    quality_ = std::clamp(quality, kMinQuality, kMaxQuality);
  }
}

CompressionResult JpegRecompressor::process(
  const std::vector<uint8_t>& input, const std::string& content_type
) const {
  CompressionResult result;
  result.bytes = input;
  result.content_type = content_type;
  result.input_bytes = input.size();
  result.output_bytes = input.size();

  if (quality_ <= 0.0) {
    result.note = "compression disabled";
    return result;
  }
  if (content_type != "image/jpeg") {
    result.note = "not a jpeg";
    return result;
  }
  if (quality_ >= kMaxQuality) {
    result.note = "quality too high to gain";
    return result;
  }
  if (input.empty()) {
    result.note = "empty input";
    return result;
  }

  const int jpeg_quality = static_cast<int>(std::lround(quality_ * 100.0));
  std::vector<uint8_t> output;
  try {
    output = recompress(input, jpeg_quality);
  } catch (const std::runtime_error& e) {
    IMGDROP_LOG_WARN("JPEG recompression failed, sending original" << kv("error", e.what()));
    result.note = std::string("decode failed: ") + e.what();
    return result;
  }

  if (output.empty() || output.size() >= input.size()) {
    IMGDROP_LOG_DEBUG(
      "Recompressed image is not smaller, keeping original"
      << kv("input_bytes", input.size()) << kv("output_bytes", output.size())
    );
    result.note = "no size gain";
    return result;
  }

  result.applied = true;
  result.bytes = std::move(output);
  result.output_bytes = result.bytes.size();
  IMGDROP_LOG_DEBUG(
    "Recompressed JPEG" << kv("quality", jpeg_quality) << kv("input_bytes", result.input_bytes)
                        << kv("output_bytes", result.output_bytes)
  );
  return result;
}

std::vector<uint8_t> JpegRecompressor::recompress(
  const std::vector<uint8_t>& input, int quality
) const {
  DecodedImage image;
  char message[JMSG_LENGTH_MAX] = {0};
  if (!decodeJpeg(input.data(), input.size(), image, message)) {
    throw std::runtime_error(message[0] != '\0' ? message : "invalid JPEG data");
  }

  std::vector<uint8_t> output;
  if (!encodeJpeg(image, quality, output, message)) {
    throw std::runtime_error(message[0] != '\0' ? message : "JPEG encode failed");
  }
  return output;
}

}  // namespace uploader
}  // namespace imgdrop
