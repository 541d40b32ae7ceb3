#include "MultipartDecoder.h"

#include "ChipUtils.h"  // for trim, toLower, startsWith, sanitizeUtf8

using namespace chipstream;

namespace {
const std::string_view CRLF = "\r\n";
const std::string_view BLANK_LINE = "\r\n\r\n";

std::string stripQuotes(std::string s) {
  size_t first = s.find_first_not_of('"');
  if (first == std::string::npos)
    return "";
  size_t last = s.find_last_not_of('"');
  return s.substr(first, last - first + 1);
}

// Content-Disposition: form-data; name="file"; filename="song.mod"
void parseContentDisposition(std::string_view headers, std::string& name,
                             std::optional<std::string>& filename) {
  std::string disposition;
  size_t pos = 0;
  while (pos <= headers.size()) {
    size_t end = headers.find('\n', pos);
    std::string_view line = headers.substr(
        pos, end == std::string_view::npos ? std::string_view::npos
                                           : end - pos);
    if (!line.empty() && line.back() == '\r')
      line.remove_suffix(1);

    if (startsWith(toLower(std::string(line)), "content-disposition")) {
      disposition = sanitizeUtf8(line);
      break;
    }
    if (end == std::string_view::npos)
      break;
    pos = end + 1;
  }

  size_t start = 0;
  while (start <= disposition.size()) {
    size_t semi = disposition.find(';', start);
    std::string segment = disposition.substr(
        start, semi == std::string::npos ? std::string::npos : semi - start);
    trim(segment);

    std::string key = toLower(segment.substr(0, segment.find('=') + 1));
    if (key == "name=") {
      name = stripQuotes(segment.substr(5));
    } else if (key == "filename=") {
      filename = stripQuotes(segment.substr(9));
    }

    if (semi == std::string::npos)
      break;
    start = semi + 1;
  }
}
}  // namespace

MultipartReader::MultipartReader(std::string_view body,
                                 const std::string& boundary)
    : body(body), delimiter("--" + boundary) {
  if (boundary.empty())
    return;

  // Everything before the first delimiter is preamble
  position = body.find(delimiter);
  if (position != std::string_view::npos)
    position += delimiter.size();
}

std::optional<std::string_view> MultipartReader::nextChunk() {
  if (position == std::string_view::npos)
    return std::nullopt;

  size_t end = body.find(delimiter, position);
  std::string_view chunk;
  if (end == std::string_view::npos) {
    chunk = body.substr(position);
    position = std::string_view::npos;
  } else {
    chunk = body.substr(position, end - position);
    position = end + delimiter.size();
  }
  return chunk;
}

std::optional<MultipartPart> MultipartReader::next() {
  while (auto chunk = nextChunk()) {
    std::string_view part = *chunk;
    if (part.empty())
      continue;

    // Closing delimiter, the rest is epilogue
    if (startsWith(part, "--")) {
      position = std::string_view::npos;
      return std::nullopt;
    }

    if (startsWith(part, CRLF))
      part.remove_prefix(CRLF.size());

    size_t separator = part.find(BLANK_LINE);
    if (separator == std::string_view::npos)
      continue;

    MultipartPart out;
    out.headers = part.substr(0, separator);
    out.content = part.substr(separator + BLANK_LINE.size());
    if (endsWith(out.content, CRLF))
      out.content.remove_suffix(CRLF.size());

    parseContentDisposition(out.headers, out.name, out.filename);
    return out;
  }
  return std::nullopt;
}

MultipartResult chipstream::decodeMultipart(std::string_view body,
                                            const std::string& boundary) {
  MultipartResult result;
  MultipartReader reader(body, boundary);

  while (auto part = reader.next()) {
    if (part->filename.has_value() && !part->filename->empty()) {
      if (result.fileData.has_value())
        continue;
      result.fileData = part->content;
      result.fileName = part->filename;
    } else if (!part->name.empty()) {
      result.fields[part->name] = sanitizeUtf8(part->content);
    }
  }
  return result;
}

std::optional<std::string> chipstream::extractBoundary(
    const std::string& contentType) {
  size_t start = 0;
  while (start <= contentType.size()) {
    size_t semi = contentType.find(';', start);
    std::string segment = contentType.substr(
        start, semi == std::string::npos ? std::string::npos : semi - start);
    trim(segment);

    if (startsWith(toLower(segment), "boundary=")) {
      std::string value = stripQuotes(segment.substr(9));
      if (value.empty())
        return std::nullopt;
      return value;
    }

    if (semi == std::string::npos)
      break;
    start = semi + 1;
  }
  return std::nullopt;
}
