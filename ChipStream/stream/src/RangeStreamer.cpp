#include "RangeStreamer.h"

#include <algorithm>     // for min
#include <charconv>      // for from_chars
#include <fstream>       // for ifstream
#include <string_view>   // for string_view
#include <system_error>  // for errc
#include <vector>        // for vector

#include <fmt/core.h>  // for format

#include "ChipLogger.h"  // for CHIP_LOG
#include "ChipUtils.h"   // for startsWith, trimmed

using namespace chipstream;

namespace {
bool parseNumber(std::string_view text, uint64_t& out) {
  if (text.empty())
    return false;
  auto result = std::from_chars(text.data(), text.data() + text.size(), out);
  return result.ec == std::errc() && result.ptr == text.data() + text.size();
}
}  // namespace

std::string RangePlan::contentRange() const {
  if (status == 416 || fileSize == 0) {
    return fmt::format("bytes */{}", fileSize);
  }
  return fmt::format("bytes {}-{}/{}", start, end, fileSize);
}

std::optional<ByteRange> RangeStreamer::parseRange(const std::string& header) {
  if (!startsWith(header, "bytes="))
    return std::nullopt;

  std::string rangeSet = trimmed(header.substr(6));
  size_t dash = rangeSet.find('-');
  if (dash == std::string::npos)
    return std::nullopt;

  std::string_view view(rangeSet);
  std::string_view first = view.substr(0, dash);
  std::string_view last = view.substr(dash + 1);

  ByteRange range;
  if (!first.empty() && !parseNumber(first, range.start))
    return std::nullopt;
  if (!last.empty()) {
    uint64_t end = 0;
    if (!parseNumber(last, end) || end < range.start)
      return std::nullopt;
    range.end = end;
  }
  return range;
}

RangePlan RangeStreamer::plan(const std::optional<std::string>& rangeHeader,
                              uint64_t fileSize) {
  RangePlan plan;
  plan.fileSize = fileSize;

  std::optional<ByteRange> range;
  if (rangeHeader.has_value())
    range = parseRange(*rangeHeader);

  if (!range.has_value()) {
    plan.status = 200;
    plan.start = 0;
    plan.end = fileSize > 0 ? fileSize - 1 : 0;
    plan.length = fileSize;
    return plan;
  }

  if (range->start >= fileSize) {
    plan.status = 416;
    return plan;
  }

  plan.status = 206;
  plan.start = range->start;
  plan.end = std::min(range->end.value_or(fileSize - 1), fileSize - 1);
  plan.length = plan.end - plan.start + 1;
  return plan;
}

uint64_t RangeStreamer::pump(const std::string& path, uint64_t offset,
                             uint64_t length, const ChunkWriter& writer,
                             size_t chunkSize) {
  if (length == 0)
    return 0;
  if (chunkSize == 0)
    chunkSize = DEFAULT_CHUNK_SIZE;

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    CHIP_LOG(debug, "RangeStreamer", "Could not open %s", path.c_str());
    return 0;
  }
  file.seekg((std::streamoff)offset);
  if (!file) {
    CHIP_LOG(debug, "RangeStreamer", "Seek to %llu failed in %s",
             (unsigned long long)offset, path.c_str());
    return 0;
  }

  std::vector<char> buffer(chunkSize);
  uint64_t sent = 0;
  while (sent < length) {
    size_t want = (size_t)std::min<uint64_t>(chunkSize, length - sent);
    file.read(buffer.data(), want);
    auto got = file.gcount();
    if (got <= 0)
      break;

    if (!writer((const uint8_t*)buffer.data(), (size_t)got)) {
      CHIP_LOG(debug, "RangeStreamer", "Client closed connection after %llu bytes",
               (unsigned long long)sent);
      break;
    }
    sent += (uint64_t)got;
  }
  return sent;
}

std::unique_ptr<HTTPResponse> RangeStreamer::makeResponse(
    const std::string& path, uint64_t fileSize, const std::string& mimeType,
    const std::optional<std::string>& rangeHeader, size_t chunkSize) {
  RangePlan plan = RangeStreamer::plan(rangeHeader, fileSize);

  auto response = makeEmptyResponse(plan.status);
  response->headers["Content-Range"] = plan.contentRange();
  response->headers["Accept-Ranges"] = "bytes";
  response->headers["Cache-Control"] = "no-cache";
  if (plan.status == 416) {
    return response;
  }

  response->headers["Content-Type"] = mimeType;
  response->headers["Content-Length"] = std::to_string(plan.length);

  uint64_t start = plan.start;
  uint64_t length = plan.length;
  response->streamBody = [path, start, length,
                          chunkSize](const ChunkWriter& writer) {
    RangeStreamer::pump(path, start, length, writer, chunkSize);
  };
  return response;
}
