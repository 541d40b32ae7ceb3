#pragma once

#include <stddef.h>     // for size_t
#include <map>          // for map
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace chipstream {

// One body part of a multipart/form-data payload. Views point into the
// body passed to MultipartReader and live as long as it does.
struct MultipartPart {
  std::string_view headers;
  std::string_view content;
  std::string name;
  std::optional<std::string> filename;
};

/**
 * Walks the parts of a multipart body lazily, one delimiter at a time.
 * Empty parts, the closing "--" marker and parts without a blank line
 * between headers and content are skipped.
 */
class MultipartReader {
 public:
  MultipartReader(std::string_view body, const std::string& boundary);

  std::optional<MultipartPart> next();

 private:
  std::optional<std::string_view> nextChunk();

  std::string_view body;
  std::string delimiter;
  size_t position = std::string_view::npos;
};

struct MultipartResult {
  std::map<std::string, std::string> fields;
  // Points into the decoded body, valid as long as that body is.
  std::optional<std::string_view> fileData;
  std::optional<std::string> fileName;
};

// Text fields (last value wins) plus the first part carrying a filename.
// The file payload is not copied.
MultipartResult decodeMultipart(std::string_view body,
                                const std::string& boundary);

// `boundary` parameter of a Content-Type value, quotes stripped.
std::optional<std::string> extractBoundary(const std::string& contentType);

}  // namespace chipstream
