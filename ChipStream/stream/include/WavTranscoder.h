#pragma once

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint8_t, uint16_t, uint32_t, uint64_t
#include <array>     // for array
#include <memory>    // for unique_ptr
#include <optional>  // for optional
#include <string>    // for string

#include "HTTPResponse.h"   // for HTTPResponse
#include "RangeStreamer.h"  // for RangeStreamer

namespace chipstream {

// Leading header of a `.fc` raw-sample file, both fields little endian.
struct RawAudioHeader {
  uint32_t sampleRate = 0;
  uint16_t channels = 0;
};

/**
 * Serves `.fc` files as 16-bit PCM WAVE. The 44-byte RIFF header is built
 * from the raw header, the samples that follow it are streamed untouched.
 */
class WavTranscoder {
 public:
  static constexpr size_t RAW_HEADER_SIZE = 6;
  static constexpr size_t WAV_HEADER_SIZE = 44;

  static std::optional<RawAudioHeader> parseRawHeader(const uint8_t* data,
                                                      size_t size);
  static std::optional<RawAudioHeader> readRawHeader(const std::string& path);

  static std::array<uint8_t, WAV_HEADER_SIZE> buildWavHeader(
      const RawAudioHeader& header, uint64_t pcmSize);

  // nullptr when the raw header cannot be read.
  static std::unique_ptr<HTTPResponse> makeResponse(
      const std::string& path, uint64_t fileSize,
      size_t chunkSize = RangeStreamer::DEFAULT_CHUNK_SIZE);
};

}  // namespace chipstream
