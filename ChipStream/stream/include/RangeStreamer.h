#pragma once

#include <stddef.h>  // for size_t
#include <stdint.h>  // for uint64_t
#include <memory>    // for unique_ptr
#include <optional>  // for optional
#include <string>    // for string

#include "HTTPResponse.h"  // for HTTPResponse, ChunkWriter

namespace chipstream {

// Parsed `bytes=<start>-<end>`; `end` is inclusive and absent for "<start>-".
struct ByteRange {
  uint64_t start = 0;
  std::optional<uint64_t> end;
};

struct RangePlan {
  int status = 200;  // 200, 206 or 416
  uint64_t start = 0;
  uint64_t end = 0;  // inclusive
  uint64_t length = 0;
  uint64_t fileSize = 0;

  std::string contentRange() const;
};

class RangeStreamer {
 public:
  static constexpr size_t DEFAULT_CHUNK_SIZE = 64 * 1024;

  /**
   * Single-range form only. An omitted start means 0. Multi-range lists,
   * suffixes other than digits and end < start are rejected, which callers
   * treat as "no usable range".
   */
  static std::optional<ByteRange> parseRange(const std::string& header);

  // Status, bounds and length for a Range header (or none) against a file.
  static RangePlan plan(const std::optional<std::string>& rangeHeader,
                        uint64_t fileSize);

  /**
   * Streams `length` bytes of `path` from `offset` through `writer` in
   * chunks of `chunkSize`. Stops quietly when the writer reports a closed
   * connection or the file ends early. Returns the bytes delivered.
   */
  static uint64_t pump(const std::string& path, uint64_t offset,
                       uint64_t length, const ChunkWriter& writer,
                       size_t chunkSize = DEFAULT_CHUNK_SIZE);

  // Full response for a plain file: headers now, bytes on streamBody.
  static std::unique_ptr<HTTPResponse> makeResponse(
      const std::string& path, uint64_t fileSize, const std::string& mimeType,
      const std::optional<std::string>& rangeHeader,
      size_t chunkSize = DEFAULT_CHUNK_SIZE);
};

}  // namespace chipstream
