#include "SongService.h"

#include <stdint.h>      // for uint64_t
#include <filesystem>    // for path, exists, file_size, remove
#include <fstream>       // for ofstream, ifstream
#include <iterator>      // for istreambuf_iterator
#include <random>        // for mt19937_64, uniform_int_distribution
#include <system_error>  // for error_code
#include <vector>        // for vector

#include <nlohmann/json.hpp>  // for json

#include "ChipLogger.h"        // for CHIP_LOG
#include "ChipUtils.h"         // for containsIgnoreCase, fileExtension...
#include "MimeTypes.h"         // for mimeTypeForExtension
#include "MultipartDecoder.h"  // for decodeMultipart, extractBoundary
#include "RangeStreamer.h"     // for RangeStreamer
#include "WavTranscoder.h"     // for WavTranscoder

using namespace chipstream;
namespace fs = std::filesystem;

SongService::SongService(std::shared_ptr<CatalogStore> catalog,
                         ServerConfig config)
    : catalog(catalog), config(config) {}

std::unique_ptr<HTTPResponse> SongService::makeError(const std::string& message,
                                                     int status) {
  nlohmann::json j = {{"error", message}};
  return makeJsonResponse(j.dump(), status);
}

std::string SongService::storedPath(const Song& song) const {
  return (fs::path(config.uploadDir) / song.storedFilename).string();
}

std::unique_ptr<HTTPResponse> SongService::listSongs(const std::string& query) {
  nlohmann::json result = nlohmann::json::array();
  for (auto& song : catalog->list()) {
    if (query.empty() || containsIgnoreCase(song.title, query) ||
        containsIgnoreCase(song.artist, query)) {
      result.push_back(song);
    }
  }
  return makeJsonResponse(
      result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::unique_ptr<HTTPResponse> SongService::randomSong(
    const std::string& exclude) {
  auto songs = catalog->list();
  std::vector<Song> pool;
  for (auto& song : songs) {
    if (song.id != exclude) {
      pool.push_back(song);
    }
  }
  if (pool.empty()) {
    pool = songs;
  }
  if (pool.empty()) {
    return makeError("No songs available", 404);
  }

  static thread_local std::mt19937_64 generator(std::random_device{}());
  std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
  nlohmann::json j = pool[pick(generator)];
  return makeJsonResponse(
      j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::unique_ptr<HTTPResponse> SongService::upload(
    const std::string& contentType, std::string_view body) {
  if (!containsIgnoreCase(contentType, "multipart/form-data")) {
    return makeError("Expected multipart/form-data", 400);
  }
  auto boundary = extractBoundary(contentType);
  if (!boundary.has_value()) {
    return makeError("Missing boundary", 400);
  }

  auto form = decodeMultipart(body, *boundary);
  if (!form.fileData.has_value() || form.fileData->empty() ||
      !form.fileName.has_value() || form.fileName->empty()) {
    return makeError("No file uploaded", 400);
  }

  std::string extension = fileExtension(*form.fileName);
  if (!isAllowedExtension(extension)) {
    return makeError("Unsupported format: " + extension, 400);
  }

  Song song;
  song.id = generateRandomUUID();
  song.title = trimmed(form.fields["title"]);
  if (song.title.empty())
    song.title = UNKNOWN_TITLE;
  song.artist = trimmed(form.fields["artist"]);
  if (song.artist.empty())
    song.artist = UNKNOWN_ARTIST;
  song.comment = trimmed(form.fields["comment"]);
  song.extension = extension;
  song.storedFilename = song.id + extension;
  song.sizeBytes = form.fileData->size();
  song.uploadedAt = isoTimestampUTC();

  std::error_code ec;
  fs::create_directories(config.uploadDir, ec);
  if (ec) {
    CHIP_LOG(error, "SongService", "Cannot create %s: %s",
             config.uploadDir.c_str(), ec.message().c_str());
    return makeError("Failed to store upload", 500);
  }

  std::string path = storedPath(song);
  {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (file.is_open()) {
      file.write(form.fileData->data(), (std::streamsize)form.fileData->size());
      file.flush();
    }
    if (!file.is_open() || !file) {
      CHIP_LOG(error, "SongService", "Failed writing %s", path.c_str());
      file.close();
      fs::remove(path, ec);
      return makeError("Failed to store upload", 500);
    }
  }

  try {
    catalog->append(song);
  } catch (CatalogError& e) {
    CHIP_LOG(error, "SongService", "Catalog append failed: %s", e.what());
    fs::remove(path, ec);
    if (ec) {
      CHIP_LOG(debug, "SongService", "Could not remove %s: %s", path.c_str(),
               ec.message().c_str());
    }
    return makeError("Failed to store upload", 500);
  }

  CHIP_LOG(info, "SongService", "Stored %s (%llu bytes) as %s",
           song.title.c_str(), (unsigned long long)song.sizeBytes,
           song.storedFilename.c_str());

  nlohmann::json j = {{"ok", true}, {"song", song}};
  return makeJsonResponse(
      j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), 201);
}

std::unique_ptr<HTTPResponse> SongService::removeSong(const std::string& id) {
  auto song = catalog->find(id);
  if (!song.has_value()) {
    return makeError("Not found", 404);
  }

  // A concurrent delete may have won the race
  if (!catalog->removeById(id)) {
    return makeError("Not found", 404);
  }

  std::error_code ec;
  fs::remove(storedPath(*song), ec);
  if (ec) {
    CHIP_LOG(debug, "SongService", "Could not remove %s: %s",
             song->storedFilename.c_str(), ec.message().c_str());
  }
  return makeJsonResponse("{\"ok\":true}");
}

std::unique_ptr<HTTPResponse> SongService::stream(
    const std::string& id, const std::optional<std::string>& rangeHeader) {
  auto song = catalog->find(id);
  if (!song.has_value()) {
    return makeError("Not found", 404);
  }

  std::string path = storedPath(*song);
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    return makeError("File missing", 404);
  }
  uint64_t fileSize = fs::file_size(path, ec);
  if (ec) {
    return makeError("File missing", 404);
  }

  if (song->extension == RAW_SAMPLE_EXTENSION) {
    auto response = WavTranscoder::makeResponse(path, fileSize, config.chunkSize);
    if (!response) {
      return makeError("File unreadable", 404);
    }
    return response;
  }

  return RangeStreamer::makeResponse(path, fileSize,
                                     mimeTypeForExtension(song->extension),
                                     rangeHeader, config.chunkSize);
}

std::unique_ptr<HTTPResponse> SongService::indexPage() {
  std::ifstream file(config.indexPath, std::ios::binary);
  if (!file.is_open()) {
    return makeError("index.html not found", 404);
  }
  std::string body((std::istreambuf_iterator<char>(file)),
                   std::istreambuf_iterator<char>());

  auto response = makeEmptyResponse(200);
  response->setBody(body);
  response->headers["Content-Type"] =
      mimeTypeForExtension(fileExtension(config.indexPath));
  return response;
}
