#include "Song.h"

#include "ChipUtils.h"  // for trimmed

using namespace chipstream;

bool chipstream::operator==(const Song& a, const Song& b) {
  return a.id == b.id && a.title == b.title && a.artist == b.artist &&
         a.comment == b.comment && a.storedFilename == b.storedFilename &&
         a.extension == b.extension && a.sizeBytes == b.sizeBytes &&
         a.uploadedAt == b.uploadedAt;
}

const std::set<std::string>& chipstream::allowedExtensions() {
  static const std::set<std::string> extensions = {
      ".mp3", ".ogg", ".wav", ".flac", ".mod", ".xm",  ".s3m",
      ".it",  ".nsf", ".spc", ".gbs",  ".vgm", ".vgz", ".fc",
  };
  return extensions;
}

bool chipstream::isAllowedExtension(const std::string& extension) {
  return allowedExtensions().count(extension) > 0;
}

void chipstream::to_json(nlohmann::json& j, const Song& song) {
  j = nlohmann::json{
      {"id", song.id},
      {"title", song.title},
      {"artist", song.artist},
      {"comment", song.comment},
      {"storedFilename", song.storedFilename},
      {"extension", song.extension},
      {"sizeBytes", song.sizeBytes},
      {"uploadedAt", song.uploadedAt},
  };
}

void chipstream::from_json(const nlohmann::json& j, Song& song) {
  j.at("id").get_to(song.id);

  song.title = trimmed(j.value("title", std::string()));
  if (song.title.empty())
    song.title = UNKNOWN_TITLE;
  song.artist = trimmed(j.value("artist", std::string()));
  if (song.artist.empty())
    song.artist = UNKNOWN_ARTIST;

  song.comment = j.value("comment", std::string());
  song.storedFilename = j.value("storedFilename", std::string());
  song.extension = j.value("extension", std::string());
  song.sizeBytes = j.value("sizeBytes", (uint64_t)0);
  song.uploadedAt = j.value("uploadedAt", std::string());
}
