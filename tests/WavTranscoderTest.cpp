#include <gtest/gtest.h>

#include <string>

#include "TestUtils.h"
#include "WavTranscoder.h"

using namespace chipstream;

namespace {
uint32_t le32(const std::string& s, size_t at) {
  return (uint32_t)(uint8_t)s[at] | ((uint32_t)(uint8_t)s[at + 1] << 8) |
         ((uint32_t)(uint8_t)s[at + 2] << 16) |
         ((uint32_t)(uint8_t)s[at + 3] << 24);
}

uint16_t le16(const std::string& s, size_t at) {
  return (uint16_t)((uint8_t)s[at] | ((uint8_t)s[at + 1] << 8));
}

// 44100 Hz, 2 channels
std::string rawHeader() {
  return std::string("\x44\xAC\x00\x00\x02\x00", 6);
}
}  // namespace

TEST(WavTranscoderTest, ParsesRawHeader) {
  auto raw = rawHeader();
  auto header =
      WavTranscoder::parseRawHeader((const uint8_t*)raw.data(), raw.size());
  ASSERT_TRUE(header.has_value());
  EXPECT_EQ(header->sampleRate, 44100u);
  EXPECT_EQ(header->channels, 2u);

  EXPECT_FALSE(
      WavTranscoder::parseRawHeader((const uint8_t*)raw.data(), 5).has_value());
}

TEST(WavTranscoderTest, BuildsPcmWaveHeader) {
  RawAudioHeader header;
  header.sampleRate = 44100;
  header.channels = 2;
  auto wav = WavTranscoder::buildWavHeader(header, 1000);
  std::string s(wav.begin(), wav.end());

  EXPECT_EQ(s.substr(0, 4), "RIFF");
  EXPECT_EQ(le32(s, 4), 1036u);
  EXPECT_EQ(s.substr(8, 4), "WAVE");
  EXPECT_EQ(s.substr(12, 4), "fmt ");
  EXPECT_EQ(le32(s, 16), 16u);
  EXPECT_EQ(le16(s, 20), 1u);
  EXPECT_EQ(le16(s, 22), 2u);
  EXPECT_EQ(le32(s, 24), 44100u);
  EXPECT_EQ(le32(s, 28), 176400u);
  EXPECT_EQ(le16(s, 32), 4u);
  EXPECT_EQ(le16(s, 34), 16u);
  EXPECT_EQ(s.substr(36, 4), "data");
  EXPECT_EQ(le32(s, 40), 1000u);
}

TEST(WavTranscoderTest, StreamsHeaderThenPcm) {
  test::TempDir dir;
  auto path = dir.path("tune.fc");
  auto pcm = test::patternBytes(70000);
  test::writeFile(path, rawHeader() + pcm);

  auto response = WavTranscoder::makeResponse(path, 6 + pcm.size(), 4096);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->status, 200);
  EXPECT_EQ(response->headers["Content-Type"], "audio/wav");
  EXPECT_EQ(response->headers["Content-Length"], std::to_string(44 + pcm.size()));

  auto body = test::collectBody(*response);
  ASSERT_EQ(body.size(), 44 + pcm.size());
  EXPECT_EQ(le32(body, 4), 36 + pcm.size());
  EXPECT_EQ(le32(body, 40), pcm.size());
  EXPECT_EQ(body.substr(44), pcm);
}

TEST(WavTranscoderTest, HeaderOnlyFileIsEmptyWave) {
  test::TempDir dir;
  auto path = dir.path("empty.fc");
  test::writeFile(path, rawHeader());

  auto response = WavTranscoder::makeResponse(path, 6);
  ASSERT_NE(response, nullptr);
  EXPECT_EQ(response->headers["Content-Length"], "44");
  EXPECT_EQ(test::collectBody(*response).size(), 44u);
}

TEST(WavTranscoderTest, ShortFileIsRejected) {
  test::TempDir dir;
  auto path = dir.path("short.fc");
  test::writeFile(path, "abc");

  EXPECT_EQ(WavTranscoder::makeResponse(path, 3), nullptr);
}
