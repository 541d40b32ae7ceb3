#include <gtest/gtest.h>

#include <string>

#include "MultipartDecoder.h"

using namespace chipstream;

namespace {
const std::string BOUNDARY = "----chipBoundary42";

std::string field(const std::string& name, const std::string& value) {
  return "--" + BOUNDARY + "\r\n" +
         "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n" +
         value + "\r\n";
}

std::string filePart(const std::string& name, const std::string& filename,
                     const std::string& data) {
  return "--" + BOUNDARY + "\r\n" +
         "Content-Disposition: form-data; name=\"" + name +
         "\"; filename=\"" + filename + "\"\r\n" +
         "Content-Type: application/octet-stream\r\n\r\n" + data + "\r\n";
}

std::string closing() {
  return "--" + BOUNDARY + "--\r\n";
}
}  // namespace

TEST(MultipartDecoderTest, DecodesFieldsAndFile) {
  std::string body = field("title", "Chip Tune") + field("artist", "4mat") +
                     filePart("file", "song.mod", "MODDATA") + closing();

  auto result = decodeMultipart(body, BOUNDARY);
  EXPECT_EQ(result.fields["title"], "Chip Tune");
  EXPECT_EQ(result.fields["artist"], "4mat");
  ASSERT_TRUE(result.fileData.has_value());
  EXPECT_EQ(*result.fileData, "MODDATA");
  ASSERT_TRUE(result.fileName.has_value());
  EXPECT_EQ(*result.fileName, "song.mod");
}

TEST(MultipartDecoderTest, KeepsBinaryPayloadExactly) {
  // Trailing CR/LF and dashes inside the payload belong to the file
  std::string data("\x00\x01\r\n--\xFF\r\n", 9);
  std::string body = filePart("file", "raw.fc", data) + closing();

  auto result = decodeMultipart(body, BOUNDARY);
  ASSERT_TRUE(result.fileData.has_value());
  EXPECT_EQ(*result.fileData, data);
}

TEST(MultipartDecoderTest, FilePayloadIsAViewIntoBody) {
  std::string body = field("title", "T") + filePart("file", "big.vgm", "VGMDATA") +
                     closing();

  auto result = decodeMultipart(body, BOUNDARY);
  ASSERT_TRUE(result.fileData.has_value());
  const char* begin = body.data();
  const char* end = body.data() + body.size();
  EXPECT_GE(result.fileData->data(), begin);
  EXPECT_LE(result.fileData->data() + result.fileData->size(), end);
  EXPECT_EQ(result.fileData->data(), begin + body.find("VGMDATA"));
}

TEST(MultipartDecoderTest, OnlyFirstFileIsKept) {
  std::string body = filePart("file", "first.xm", "ONE") +
                     filePart("file", "second.it", "TWO") + closing();

  auto result = decodeMultipart(body, BOUNDARY);
  ASSERT_TRUE(result.fileData.has_value());
  EXPECT_EQ(*result.fileData, "ONE");
  EXPECT_EQ(*result.fileName, "first.xm");
}

TEST(MultipartDecoderTest, SkipsPartWithoutBlankLine) {
  std::string broken = "--" + BOUNDARY + "\r\n" +
                       "Content-Disposition: form-data; name=\"oops\"\r\n";
  std::string body = broken + field("title", "Fine") + closing();

  auto result = decodeMultipart(body, BOUNDARY);
  EXPECT_EQ(result.fields.count("oops"), 0u);
  EXPECT_EQ(result.fields["title"], "Fine");
  EXPECT_FALSE(result.fileData.has_value());
}

TEST(MultipartDecoderTest, IgnoresPreambleAndEpilogue) {
  std::string body = "preamble text\r\n" + field("title", "T") + closing() +
                     "epilogue " + field("title", "late");

  auto result = decodeMultipart(body, BOUNDARY);
  EXPECT_EQ(result.fields["title"], "T");
}

TEST(MultipartDecoderTest, LastRepeatedFieldWins) {
  std::string body = field("comment", "a") + field("comment", "b") + closing();

  auto result = decodeMultipart(body, BOUNDARY);
  EXPECT_EQ(result.fields["comment"], "b");
}

TEST(MultipartDecoderTest, EmptyFilenameIsAField) {
  std::string body = filePart("file", "", "not a file") + closing();

  auto result = decodeMultipart(body, BOUNDARY);
  EXPECT_FALSE(result.fileData.has_value());
  EXPECT_EQ(result.fields["file"], "not a file");
}

TEST(MultipartDecoderTest, HeaderNamesAreCaseInsensitive) {
  std::string body = "--" + BOUNDARY + "\r\n" +
                     "content-disposition: form-data; NAME=\"title\"\r\n\r\n" +
                     "lower\r\n" + closing();

  auto result = decodeMultipart(body, BOUNDARY);
  EXPECT_EQ(result.fields["title"], "lower");
}

TEST(MultipartDecoderTest, InvalidUtf8FieldIsReplaced) {
  std::string body = field("artist", "bad\xFF") + closing();

  auto result = decodeMultipart(body, BOUNDARY);
  EXPECT_EQ(result.fields["artist"], "bad\xEF\xBF\xBD");
}

TEST(MultipartDecoderTest, GarbageInputYieldsNothing) {
  EXPECT_TRUE(decodeMultipart("", BOUNDARY).fields.empty());
  EXPECT_TRUE(decodeMultipart("no delimiters at all", BOUNDARY).fields.empty());
  EXPECT_TRUE(decodeMultipart("--" + BOUNDARY + "--", BOUNDARY).fields.empty());
  EXPECT_TRUE(decodeMultipart(field("title", "x"), "").fields.empty());
}

TEST(MultipartDecoderTest, ReaderExposesPartViews) {
  std::string body = filePart("file", "a.ogg", "OGG") + closing();
  MultipartReader reader(body, BOUNDARY);

  auto part = reader.next();
  ASSERT_TRUE(part.has_value());
  EXPECT_EQ(part->name, "file");
  EXPECT_EQ(part->content, "OGG");
  EXPECT_NE(part->headers.find("Content-Type"), std::string_view::npos);
  EXPECT_FALSE(reader.next().has_value());
}

TEST(MultipartDecoderTest, ExtractBoundary) {
  EXPECT_EQ(extractBoundary("multipart/form-data; boundary=abc").value(), "abc");
  EXPECT_EQ(extractBoundary("multipart/form-data; BOUNDARY=\"q r\"").value(),
            "q r");
  EXPECT_EQ(extractBoundary("multipart/form-data; boundary=x; charset=utf-8")
                .value(),
            "x");
  EXPECT_FALSE(extractBoundary("multipart/form-data").has_value());
  EXPECT_FALSE(extractBoundary("multipart/form-data; boundary=").has_value());
}
