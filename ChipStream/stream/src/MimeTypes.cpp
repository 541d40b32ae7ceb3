#include "MimeTypes.h"

#include <unordered_map>  // for unordered_map

std::string chipstream::mimeTypeForExtension(const std::string& extension) {
  static const std::unordered_map<std::string, std::string> types = {
      {".mp3", "audio/mpeg"},   {".ogg", "audio/ogg"},
      {".wav", "audio/wav"},    {".flac", "audio/flac"},
      {".mod", "audio/x-mod"},  {".xm", "audio/x-xm"},
      {".s3m", "audio/x-s3m"},  {".it", "audio/x-it"},
      {".html", "text/html"},   {".htm", "text/html"},
      {".css", "text/css"},     {".js", "text/javascript"},
      {".json", "application/json"},
  };

  auto it = types.find(extension);
  if (it == types.end()) {
    return "application/octet-stream";
  }
  return it->second;
}
