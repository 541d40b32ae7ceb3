#include "WavTranscoder.h"

#include <string.h>  // for memcpy
#include <fstream>   // for ifstream

#include "ChipLogger.h"  // for CHIP_LOG

using namespace chipstream;

namespace {
void putLe32(uint8_t* out, uint32_t value) {
  out[0] = value & 0xFF;
  out[1] = (value >> 8) & 0xFF;
  out[2] = (value >> 16) & 0xFF;
  out[3] = (value >> 24) & 0xFF;
}

void putLe16(uint8_t* out, uint16_t value) {
  out[0] = value & 0xFF;
  out[1] = (value >> 8) & 0xFF;
}

uint32_t clamp32(uint64_t value) {
  return value > 0xFFFFFFFFull ? 0xFFFFFFFFu : (uint32_t)value;
}
}  // namespace

std::optional<RawAudioHeader> WavTranscoder::parseRawHeader(const uint8_t* data,
                                                            size_t size) {
  if (data == nullptr || size < RAW_HEADER_SIZE) {
    return std::nullopt;
  }
  RawAudioHeader header;
  header.sampleRate = (uint32_t)data[0] | ((uint32_t)data[1] << 8) |
                      ((uint32_t)data[2] << 16) | ((uint32_t)data[3] << 24);
  header.channels = (uint16_t)(data[4] | (data[5] << 8));
  return header;
}

std::optional<RawAudioHeader> WavTranscoder::readRawHeader(
    const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  uint8_t raw[RAW_HEADER_SIZE];
  file.read((char*)raw, sizeof(raw));
  return parseRawHeader(raw, (size_t)file.gcount());
}

std::array<uint8_t, WavTranscoder::WAV_HEADER_SIZE>
WavTranscoder::buildWavHeader(const RawAudioHeader& header, uint64_t pcmSize) {
  std::array<uint8_t, WAV_HEADER_SIZE> wav{};
  uint8_t* out = wav.data();

  uint32_t byteRate = clamp32((uint64_t)header.sampleRate * header.channels * 2);
  uint16_t blockAlign = (uint16_t)(header.channels * 2);

  memcpy(out, "RIFF", 4);
  putLe32(out + 4, clamp32(36 + pcmSize));
  memcpy(out + 8, "WAVE", 4);
  memcpy(out + 12, "fmt ", 4);
  putLe32(out + 16, 16);
  putLe16(out + 20, 1);  // PCM
  putLe16(out + 22, header.channels);
  putLe32(out + 24, header.sampleRate);
  putLe32(out + 28, byteRate);
  putLe16(out + 32, blockAlign);
  putLe16(out + 34, 16);
  memcpy(out + 36, "data", 4);
  putLe32(out + 40, clamp32(pcmSize));
  return wav;
}

std::unique_ptr<HTTPResponse> WavTranscoder::makeResponse(
    const std::string& path, uint64_t fileSize, size_t chunkSize) {
  if (fileSize < RAW_HEADER_SIZE) {
    return nullptr;
  }
  auto header = readRawHeader(path);
  if (!header.has_value()) {
    return nullptr;
  }

  uint64_t pcmSize = fileSize - RAW_HEADER_SIZE;
  auto wav = buildWavHeader(*header, pcmSize);
  CHIP_LOG(debug, "WavTranscoder", "%s: %u Hz, %u channels, %llu PCM bytes",
           path.c_str(), header->sampleRate, (unsigned)header->channels,
           (unsigned long long)pcmSize);

  auto response = makeEmptyResponse(200);
  response->headers["Content-Type"] = "audio/wav";
  response->headers["Content-Length"] =
      std::to_string(WAV_HEADER_SIZE + pcmSize);
  response->headers["Cache-Control"] = "no-cache";
  response->streamBody = [path, wav, pcmSize,
                          chunkSize](const ChunkWriter& writer) {
    if (!writer(wav.data(), wav.size())) {
      CHIP_LOG(debug, "WavTranscoder", "Client closed connection before data");
      return;
    }
    RangeStreamer::pump(path, RAW_HEADER_SIZE, pcmSize, writer, chunkSize);
  };
  return response;
}
