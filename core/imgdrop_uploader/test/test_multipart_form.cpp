// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for MultipartForm
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "multipart_form.hpp"

using namespace imgdrop::uploader;

TEST(MultipartFormTest, EncodeLayout) {
  MultipartForm form("XBOUNDARY");
  form.addField("cloudflareId", "acct");
  const std::vector<uint8_t> bytes = {'a', 'b', 'c'};
  form.addFile("file", "pic.png", "image/png", bytes.data(), bytes.size());

  EXPECT_EQ(form.contentType(), "multipart/form-data; boundary=XBOUNDARY");
  EXPECT_EQ(
    form.encode(),
    "--XBOUNDARY\r\n"
    "Content-Disposition: form-data; name=\"cloudflareId\"\r\n\r\n"
    "acct\r\n"
    "--XBOUNDARY\r\n"
    "Content-Disposition: form-data; name=\"file\"; filename=\"pic.png\"\r\n"
    "Content-Type: image/png\r\n\r\n"
    "abc\r\n"
    "--XBOUNDARY--\r\n"
  );
}

TEST(MultipartFormTest, RandomBoundariesDiffer) {
  MultipartForm a;
  MultipartForm b;
  EXPECT_NE(a.boundary(), b.boundary());
  EXPECT_FALSE(a.boundary().empty());
}

TEST(MultipartFormTest, FileWithoutTypeIsOctetStream) {
  MultipartForm form;
  const uint8_t byte = 0;
  form.addFile("file", "image.jpg.part0", "", &byte, 1);
  ASSERT_NE(form.find("file"), nullptr);
  EXPECT_EQ(form.find("file")->content_type, "application/octet-stream");
  EXPECT_EQ(form.find("missing"), nullptr);
}

TEST(MultipartFormTest, ParseRecoversFieldsAndBinary) {
  MultipartForm form;
  form.addField("action", "upload_chunk").addField("chunkIndex", "2");
  std::vector<uint8_t> binary = {0x00, 0xFF, '\r', '\n', '-', '-', 0x7F};
  form.addFile("file", "image_1.jpg.part2", "application/octet-stream", binary.data(), binary.size());

  auto parts = MultipartForm::parse(form.encode(), form.contentType());
  ASSERT_TRUE(parts.has_value());
  ASSERT_EQ(parts->size(), 3u);
  EXPECT_EQ((*parts)[0].name, "action");
  EXPECT_EQ((*parts)[0].value, "upload_chunk");
  EXPECT_TRUE((*parts)[0].filename.empty());
  EXPECT_EQ((*parts)[1].value, "2");
  EXPECT_EQ((*parts)[2].filename, "image_1.jpg.part2");
  EXPECT_EQ((*parts)[2].content_type, "application/octet-stream");
  EXPECT_EQ((*parts)[2].value, std::string(binary.begin(), binary.end()));
}

TEST(MultipartFormTest, ParseRejectsMalformedInput) {
  EXPECT_FALSE(MultipartForm::parse("anything", "multipart/form-data").has_value());
  EXPECT_FALSE(MultipartForm::parse("no delimiter", "multipart/form-data; boundary=abc").has_value());
  EXPECT_FALSE(
    MultipartForm::parse("--abc\r\nContent-Disposition: form-data; name=\"x\"\r\n\r\nunterminated",
                         "multipart/form-data; boundary=abc")
      .has_value()
  );
}
