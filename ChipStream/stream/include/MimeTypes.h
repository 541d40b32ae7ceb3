#pragma once

#include <string>

namespace chipstream {

// Content-Type for a lowercase extension such as ".ogg". Unknown
// extensions map to application/octet-stream.
std::string mimeTypeForExtension(const std::string& extension);

}  // namespace chipstream
