#pragma once

#include <stdint.h>  // for uint64_t
#include <set>       // for set
#include <string>    // for string

#include <nlohmann/json.hpp>  // for json

namespace chipstream {

static const char* const UNKNOWN_TITLE = "Unknown Title";
static const char* const UNKNOWN_ARTIST = "Unknown Artist";

// Raw-sample format served through WavTranscoder
static const char* const RAW_SAMPLE_EXTENSION = ".fc";

struct Song {
  std::string id;
  std::string title = UNKNOWN_TITLE;
  std::string artist = UNKNOWN_ARTIST;
  std::string comment;
  std::string storedFilename;
  std::string extension;
  uint64_t sizeBytes = 0;
  std::string uploadedAt;
};

bool operator==(const Song& a, const Song& b);

// Lowercase extensions with their dot, e.g. ".mod"
const std::set<std::string>& allowedExtensions();
bool isAllowedExtension(const std::string& extension);

void to_json(nlohmann::json& j, const Song& song);

// Throws nlohmann::json::exception when `id` is missing or not a string.
void from_json(const nlohmann::json& j, Song& song);

}  // namespace chipstream
